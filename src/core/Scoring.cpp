#include "fqcheck/core/Scoring.h"

#include <algorithm>

namespace fqcheck {

double computeScore(const std::vector<Finding> &findings,
                    const ScoringConfig &scoring) {
    double penalty = 0.0;
    for (const auto &f : findings)
        penalty += scoring.weightOf(f.severity);
    return std::max(0.0, scoring.baseline - penalty);
}

FileStatus classify(const FileResult &result, const ScoringConfig &scoring) {
    if (result.findings.empty() && result.rulesApplied == 0)
        return FileStatus::NotGraded;

    bool critical = std::any_of(
        result.findings.begin(), result.findings.end(),
        [](const Finding &f) { return f.severity == Severity::Critical; });
    if (critical || result.score < scoring.passScore)
        return FileStatus::Fail;
    return FileStatus::Pass;
}

void rescore(FileResult &result, const ScoringConfig &scoring) {
    result.score  = computeScore(result.findings, scoring);
    result.status = classify(result, scoring);
}

} // namespace fqcheck
