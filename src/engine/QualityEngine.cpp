#include "fqcheck/engine/QualityEngine.h"
#include "fqcheck/analysis/Analyzer.h"
#include "fqcheck/core/Version.h"
#include "fqcheck/report/Aggregator.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <thread>

namespace fqcheck {

namespace {

uint64_t nowEpochSeconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
}

CacheStats statsDelta(const CacheStats &after, const CacheStats &before) {
    CacheStats d;
    d.hits          = after.hits - before.hits;
    d.misses        = after.misses - before.misses;
    d.corrupt       = after.corrupt - before.corrupt;
    d.writeFailures = after.writeFailures - before.writeFailures;
    return d;
}

} // anonymous namespace

QualityEngine::QualityEngine(Config cfg, RuleRegistry registry,
                             std::unique_ptr<ResultCache> cache)
    : config_(std::move(cfg)),
      registry_(std::move(registry)),
      cache_(std::move(cache)) {}

unsigned QualityEngine::workerCount(size_t jobs) const {
    unsigned n = config_.workers;
    if (n == 0)
        n = std::max(1u, std::thread::hardware_concurrency());
    if (jobs < n)
        n = static_cast<unsigned>(std::max<size_t>(jobs, 1));
    return n;
}

llvm::Expected<RunReport>
QualityEngine::run(llvm::StringRef root, const CancellationToken *cancel) {
    FileDiscoverer discoverer(config_);
    auto discovered = discoverer.discover(root);
    if (!discovered)
        return discovered.takeError();
    return analyzeAll(std::move(*discovered), cancel);
}

llvm::Expected<RunReport>
QualityEngine::runFiles(const std::vector<std::string> &files,
                        llvm::StringRef baseDir,
                        const CancellationToken *cancel) {
    FileDiscoverer discoverer(config_);
    auto discovered = discoverer.discoverFiles(files, baseDir);
    if (!discovered)
        return discovered.takeError();
    return analyzeAll(std::move(*discovered), cancel);
}

RunReport QualityEngine::analyzeAll(DiscoveryResult discovered,
                                    const CancellationToken *cancel) {
    auto start = std::chrono::steady_clock::now();

    meta_ = ExecutionMetadata{};
    meta_.toolVersion       = kToolVersion;
    meta_.root              = discovered.root;
    meta_.ruleSetVersion    = registry_.version();
    meta_.timestampEpochSec = nowEpochSeconds();
    meta_.cacheEnabled      = cache_ != nullptr;

    CacheStats before = cache_ ? cache_->stats() : CacheStats{};

    const auto &files = discovered.files;
    Analyzer analyzer(config_, registry_, cache_.get());

    // Slots are indexed by discovery order; completion order does not matter.
    std::vector<std::optional<FileResult>> slots(files.size());
    std::atomic<size_t> cursor{0};

    auto worker = [&]() {
        for (;;) {
            if (cancel && cancel->stopRequested())
                return;
            size_t i = cursor.fetch_add(1, std::memory_order_relaxed);
            if (i >= files.size())
                return;
            slots[i] = analyzer.analyze(files[i].path, files[i].relativePath);
        }
    };

    unsigned workers = workerCount(files.size());
    meta_.workers = workers;

    if (!files.empty()) {
        std::vector<std::future<void>> futures;
        futures.reserve(workers);
        for (unsigned w = 0; w < workers; ++w)
            futures.push_back(std::async(std::launch::async, worker));
        for (auto &f : futures)
            f.get();
    }

    std::vector<FileResult> results;
    results.reserve(files.size());
    bool incomplete = false;
    for (auto &slot : slots) {
        if (slot)
            results.push_back(std::move(*slot));
        else
            incomplete = true;
    }

    AggregationContext ctx;
    ctx.timestampEpochSec = meta_.timestampEpochSec;
    ctx.root              = discovered.root;
    ctx.ruleSetVersion    = registry_.version();
    ctx.discoveryFindings = std::move(discovered.findings);
    ctx.filesDiscovered   = files.size();
    ctx.incomplete        = incomplete;

    Aggregator aggregator(config_);
    RunReport report = aggregator.aggregate(std::move(results), std::move(ctx));

    if (cache_)
        meta_.cache = statsDelta(cache_->stats(), before);
    meta_.elapsedMs = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());

    return report;
}

} // namespace fqcheck
