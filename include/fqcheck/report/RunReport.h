#pragma once

#include "fqcheck/core/FileResult.h"
#include "fqcheck/core/Finding.h"
#include "fqcheck/core/Severity.h"

#include <llvm/ADT/StringRef.h>

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace fqcheck {

struct RunReportData {
    uint64_t    timestampEpochSec = 0;
    std::string root;
    std::string ruleSetVersion;

    std::vector<FileResult>       files; // sorted by path
    std::vector<DiscoveryFinding> discoveryFindings;

    double aggregateScore = 0.0;
    std::array<uint64_t, kSeverityCount>   severityCounts{};
    std::array<uint64_t, kFileStatusCount> statusCounts{};
    std::map<std::string, uint64_t>        extensionCounts; // ".txt" or "(none)"

    uint64_t filesDiscovered = 0;
    bool     incomplete      = false; // cancelled before every file was analyzed
};

// Immutable snapshot of one analysis pass, consumed by output formatters
// and any presentation layer. Built only by the Aggregator.
class RunReport {
public:
    explicit RunReport(RunReportData data);

    uint64_t timestamp() const { return data_.timestampEpochSec; }
    const std::string &root() const { return data_.root; }
    const std::string &ruleSetVersion() const { return data_.ruleSetVersion; }

    const std::vector<FileResult> &files() const { return data_.files; }
    const std::vector<DiscoveryFinding> &discoveryFindings() const {
        return data_.discoveryFindings;
    }

    double aggregateScore() const { return data_.aggregateScore; }
    uint64_t severityCount(Severity s) const {
        return data_.severityCounts[severityIndex(s)];
    }
    uint64_t statusCount(FileStatus s) const {
        return data_.statusCounts[static_cast<size_t>(s)];
    }
    const std::map<std::string, uint64_t> &extensionCounts() const {
        return data_.extensionCounts;
    }

    uint64_t filesDiscovered() const { return data_.filesDiscovered; }
    bool incomplete() const { return data_.incomplete; }

    uint64_t totalFindings() const;
    uint64_t flaggedFiles() const;

    // Passed / (passed + failed); 0 when nothing was graded.
    double passRate() const;

    // Lookup by absolute or root-relative path.
    const FileResult *find(llvm::StringRef path) const;

    // Files with at least one finding of severity >= `atLeast`.
    std::vector<const FileResult *> withSeverity(Severity atLeast) const;
    std::vector<const FileResult *> withStatus(FileStatus status) const;
    std::vector<const FileResult *> withExtension(llvm::StringRef ext) const;

    // Ascending score; ties keep path order.
    std::vector<const FileResult *> sortedByScore() const;

    // Up to `n` lowest-scoring files that have findings.
    std::vector<const FileResult *> worstOffenders(size_t n) const;

    // Extension bucket used by extensionCounts() and withExtension().
    static std::string extensionKey(llvm::StringRef relativePath);

private:
    RunReportData data_;
};

} // namespace fqcheck
