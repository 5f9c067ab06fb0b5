#pragma once

#include "fqcheck/core/Config.h"
#include "fqcheck/core/FileResult.h"

#include <vector>

namespace fqcheck {

// baseline - sum of severity weights, floored at zero.
double computeScore(const std::vector<Finding> &findings,
                    const ScoringConfig &scoring);

FileStatus classify(const FileResult &result, const ScoringConfig &scoring);

// Recomputes score and status from the result's findings.
void rescore(FileResult &result, const ScoringConfig &scoring);

} // namespace fqcheck
