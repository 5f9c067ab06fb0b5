#pragma once

#include "fqcheck/cache/ResultCache.h"
#include "fqcheck/core/Cancellation.h"
#include "fqcheck/core/Config.h"
#include "fqcheck/core/ExecutionMetadata.h"
#include "fqcheck/core/RuleRegistry.h"
#include "fqcheck/discovery/FileDiscoverer.h"
#include "fqcheck/report/RunReport.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

#include <memory>
#include <string>
#include <vector>

namespace fqcheck {

// Drives one analysis pass: discovery, per-file analysis on a bounded
// worker pool, aggregation. The engine owns its configuration, rule set
// and cache; none of them change while a run is in progress.
class QualityEngine {
public:
    QualityEngine(Config cfg, RuleRegistry registry,
                  std::unique_ptr<ResultCache> cache);

    QualityEngine(const QualityEngine &) = delete;
    QualityEngine &operator=(const QualityEngine &) = delete;

    // Analyzes everything under `root`. Fails only with AccessError when the
    // root cannot be read. A stop request yields a report tagged incomplete.
    llvm::Expected<RunReport> run(llvm::StringRef root,
                                  const CancellationToken *cancel = nullptr);

    // Analyzes an explicit file list; relative entries resolve against
    // `baseDir`, which also serves as the report root.
    llvm::Expected<RunReport> runFiles(const std::vector<std::string> &files,
                                       llvm::StringRef baseDir,
                                       const CancellationToken *cancel = nullptr);

    // Provenance of the most recent run.
    const ExecutionMetadata &metadata() const { return meta_; }

    const Config &config() const { return config_; }
    const RuleRegistry &registry() const { return registry_; }
    ResultCache *cache() const { return cache_.get(); }

    // Worker threads used for `jobs` files.
    unsigned workerCount(size_t jobs) const;

private:
    RunReport analyzeAll(DiscoveryResult discovered,
                         const CancellationToken *cancel);

    Config config_;
    RuleRegistry registry_;
    std::unique_ptr<ResultCache> cache_;
    ExecutionMetadata meta_;
};

} // namespace fqcheck
