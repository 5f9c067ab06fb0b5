#pragma once

#include "fqcheck/core/Config.h"
#include "fqcheck/core/FileResult.h"
#include "fqcheck/core/Rule.h"
#include "fqcheck/core/RuleRegistry.h"

#include <llvm/ADT/StringRef.h>

#include <string>
#include <vector>

namespace fqcheck {

class ResultCache;

// Produces one FileResult per file. Holds no per-run mutable state, so a
// single instance may serve many worker threads at once.
class Analyzer {
public:
    Analyzer(const Config &cfg, const RuleRegistry &registry,
             ResultCache *cache);

    // Never fails: an unreadable file yields a result carrying a single
    // FQ901 finding.
    FileResult analyze(const std::string &path,
                       const std::string &relativePath) const;

    // Analyzes bytes already in memory. Bypasses the cache.
    FileResult analyzeContent(const std::string &path,
                              const std::string &relativePath,
                              llvm::StringRef content) const;

private:
    FileResult evaluate(const FileInput &input, std::string fingerprint) const;

    // Runs one rule in isolation: a failing rule contributes exactly one
    // FQ900 finding and none of its partial output.
    void runRule(const Rule &rule, const FileInput &input,
                 std::vector<Finding> &out) const;

    const Config &config_;
    const RuleRegistry &registry_;
    ResultCache *cache_;
};

} // namespace fqcheck
