#include "fqcheck/report/Aggregator.h"
#include "fqcheck/core/Scoring.h"

#include <algorithm>
#include <map>

namespace fqcheck {

namespace {

constexpr const char *kDuplicationTitle = "Duplicate Content";

} // anonymous namespace

Aggregator::Aggregator(const Config &cfg) : config_(cfg) {}

bool Aggregator::duplicationEnabled() const {
    return config_.rules.duplication.enabled &&
           !config_.isRuleDisabled(std::string(ruleid::Duplication));
}

void Aggregator::markDuplicates(std::vector<FileResult> &results) const {
    if (!duplicationEnabled())
        return;

    const auto &dup = config_.rules.duplication;

    // Index lists stay in path order, so the first entry is canonical.
    std::map<std::string, std::vector<size_t>> groups;
    for (size_t i = 0; i < results.size(); ++i) {
        const FileResult &r = results[i];
        if (r.contentKey().empty() || r.sizeBytes < dup.minSizeBytes)
            continue;
        groups[r.contentKey()].push_back(i);
    }

    for (const auto &[key, members] : groups) {
        if (members.size() < 2)
            continue;

        const FileResult &canonical = results[members.front()];
        for (size_t k = 1; k < members.size(); ++k) {
            FileResult &r = results[members[k]];

            Finding f;
            f.ruleID   = std::string(ruleid::Duplication);
            f.title    = kDuplicationTitle;
            f.severity = Severity::Medium;
            f.message  = "duplicate of " + canonical.relativePath;
            if (members.size() > 2)
                f.message += " (" + std::to_string(members.size()) +
                             " files share this content)";
            r.findings.push_back(std::move(f));
            rescore(r, config_.scoring);
        }
    }
}

double Aggregator::aggregateScore(const std::vector<FileResult> &results) const {
    const auto &scoring = config_.scoring;
    if (results.empty())
        return scoring.baseline;

    switch (scoring.aggregate) {
        case AggregateMode::Minimum: {
            double lowest = results.front().score;
            for (const auto &r : results)
                lowest = std::min(lowest, r.score);
            return lowest;
        }
        case AggregateMode::SizeWeighted: {
            double weighted = 0.0;
            double total = 0.0;
            for (const auto &r : results) {
                weighted += r.score * static_cast<double>(r.sizeBytes);
                total += static_cast<double>(r.sizeBytes);
            }
            if (total > 0.0)
                return weighted / total;
            [[fallthrough]];
        }
        case AggregateMode::Mean:
            break;
    }

    double sum = 0.0;
    for (const auto &r : results)
        sum += r.score;
    return sum / static_cast<double>(results.size());
}

RunReport Aggregator::aggregate(std::vector<FileResult> results,
                                AggregationContext ctx) const {
    std::sort(results.begin(), results.end(),
              [](const FileResult &a, const FileResult &b) {
                  return a.path < b.path;
              });
    std::sort(ctx.discoveryFindings.begin(), ctx.discoveryFindings.end(),
              [](const DiscoveryFinding &a, const DiscoveryFinding &b) {
                  return a.path < b.path;
              });

    markDuplicates(results);

    RunReportData data;
    data.timestampEpochSec = ctx.timestampEpochSec;
    data.root              = std::move(ctx.root);
    data.ruleSetVersion    = std::move(ctx.ruleSetVersion);
    data.filesDiscovered   = ctx.filesDiscovered;
    data.incomplete        = ctx.incomplete;
    data.aggregateScore    = aggregateScore(results);

    for (const auto &r : results) {
        for (const auto &f : r.findings)
            ++data.severityCounts[severityIndex(f.severity)];
        ++data.statusCounts[static_cast<size_t>(r.status)];
        ++data.extensionCounts[RunReport::extensionKey(r.relativePath)];
    }

    data.files             = std::move(results);
    data.discoveryFindings = std::move(ctx.discoveryFindings);
    return RunReport(std::move(data));
}

} // namespace fqcheck
