#pragma once

#include "fqcheck/core/ExecutionMetadata.h"
#include "fqcheck/core/FileResult.h"
#include "fqcheck/core/Severity.h"
#include "fqcheck/report/RunReport.h"

#include <llvm/ADT/StringRef.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fqcheck {

// Presentation filters. They select what is rendered and never alter the
// report itself.
struct RenderOptions {
    Severity minSeverity = Severity::Informational;
    std::optional<FileStatus> status;
    size_t worst = 0; // 0 = every file, in path order
};

class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;
    virtual std::string format(const RunReport &report,
                               const ExecutionMetadata &meta,
                               const RenderOptions &options) = 0;
};

class CLIOutputFormatter : public OutputFormatter {
public:
    std::string format(const RunReport &report, const ExecutionMetadata &meta,
                       const RenderOptions &options) override;
};

// Deterministic: everything that differs between two runs over the same
// tree, except the timestamp, is left out. The timestamp sits on a line of
// its own.
class JSONOutputFormatter : public OutputFormatter {
public:
    std::string format(const RunReport &report, const ExecutionMetadata &meta,
                       const RenderOptions &options) override;
};

class SARIFOutputFormatter : public OutputFormatter {
public:
    std::string format(const RunReport &report, const ExecutionMetadata &meta,
                       const RenderOptions &options) override;
};

// "cli", "json" or "sarif"; null for anything else.
std::unique_ptr<OutputFormatter> makeOutputFormatter(llvm::StringRef name);

// Files selected by the status filter and the worst-offenders limit.
std::vector<const FileResult *> selectFiles(const RunReport &report,
                                            const RenderOptions &options);

std::vector<const Finding *> visibleFindings(const FileResult &result,
                                             const RenderOptions &options);

std::string escapeJSON(llvm::StringRef s);

// Fixed two-decimal rendering used for every score.
std::string formatScore(double score);

} // namespace fqcheck
