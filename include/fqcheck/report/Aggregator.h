#pragma once

#include "fqcheck/core/Config.h"
#include "fqcheck/core/FileResult.h"
#include "fqcheck/report/RunReport.h"

#include <cstdint>
#include <string>
#include <vector>

namespace fqcheck {

struct AggregationContext {
    uint64_t    timestampEpochSec = 0;
    std::string root;
    std::string ruleSetVersion;
    std::vector<DiscoveryFinding> discoveryFindings;
    uint64_t    filesDiscovered = 0;
    bool        incomplete      = false;
};

// Combines per-file results into a RunReport. Owns the cross-file
// duplication check, which cannot be decided from a single file.
class Aggregator {
public:
    explicit Aggregator(const Config &cfg);

    RunReport aggregate(std::vector<FileResult> results,
                        AggregationContext ctx) const;

    // Appends one duplication finding to every non-canonical member of a
    // content group. `results` must be sorted by path.
    void markDuplicates(std::vector<FileResult> &results) const;

    double aggregateScore(const std::vector<FileResult> &results) const;

private:
    bool duplicationEnabled() const;

    const Config &config_;
};

} // namespace fqcheck
