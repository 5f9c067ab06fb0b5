#pragma once

#include "fqcheck/core/ExecutionMetadata.h"
#include "fqcheck/core/FileResult.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/ADT/Twine.h>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace fqcheck {

struct Config;

// Per-file result cache: one entry per path. An entry is served only when
// the root-relative path the rules saw, the content fingerprint and the
// rule-set version all match; staleness is never decided by time. A put
// replaces whatever the path held before. Implementations must be safe for
// concurrent get/put on different paths.
class ResultCache {
public:
    virtual ~ResultCache() = default;

    virtual std::optional<FileResult> get(llvm::StringRef path,
                                          llvm::StringRef relativePath,
                                          llvm::StringRef fingerprint,
                                          llvm::StringRef ruleSetVersion) = 0;

    virtual void put(llvm::StringRef path,
                     llvm::StringRef relativePath,
                     llvm::StringRef fingerprint,
                     llvm::StringRef ruleSetVersion,
                     const FileResult &result) = 0;

    CacheStats stats() const;

protected:
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> corrupt_{0};
    std::atomic<uint64_t> writeFailures_{0};
};

class InMemoryResultCache : public ResultCache {
public:
    std::optional<FileResult> get(llvm::StringRef path,
                                  llvm::StringRef relativePath,
                                  llvm::StringRef fingerprint,
                                  llvm::StringRef ruleSetVersion) override;

    void put(llvm::StringRef path,
             llvm::StringRef relativePath,
             llvm::StringRef fingerprint,
             llvm::StringRef ruleSetVersion,
             const FileResult &result) override;

    size_t size() const;

private:
    struct Entry {
        std::string relativePath;
        std::string fingerprint;
        std::string ruleSetVersion;
        FileResult  result;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

// Persistent cache: one JSON document per path under `directory`, named by
// the MD5 of the path. Writes go to a unique temporary file that is renamed
// over the entry, so a crash or a concurrent writer never leaves a torn
// entry and never touches other entries.
class DiskResultCache : public ResultCache {
public:
    explicit DiskResultCache(std::string directory);

    std::optional<FileResult> get(llvm::StringRef path,
                                  llvm::StringRef relativePath,
                                  llvm::StringRef fingerprint,
                                  llvm::StringRef ruleSetVersion) override;

    void put(llvm::StringRef path,
             llvm::StringRef relativePath,
             llvm::StringRef fingerprint,
             llvm::StringRef ruleSetVersion,
             const FileResult &result) override;

    const std::string &directory() const { return directory_; }

    // Location of the entry for `path`.
    std::string entryPath(llvm::StringRef path) const;

private:
    void warn(const llvm::Twine &message);
    void discardTemp(llvm::StringRef tmpPath);

    std::string directory_;
    std::mutex logMutex_;
};

// Creates the cache the configuration asks for, or null when caching is
// disabled. Relative cache directories resolve against `root`.
std::unique_ptr<ResultCache> makeResultCache(const Config &cfg,
                                             llvm::StringRef root);

// JSON encoding of one entry; exposed for tests. Paths are stored as hex and
// other text that is not valid UTF-8 as a hex sibling field, so any byte
// sequence a file name may contain survives the round trip.
std::string encodeCacheEntry(llvm::StringRef path, llvm::StringRef relativePath,
                             llvm::StringRef fingerprint,
                             llvm::StringRef ruleSetVersion,
                             const FileResult &result);

// Returns nullopt when the document is malformed or describes a different
// path, relative path, fingerprint or rule-set version.
std::optional<FileResult> decodeCacheEntry(llvm::StringRef json,
                                           llvm::StringRef path,
                                           llvm::StringRef relativePath,
                                           llvm::StringRef fingerprint,
                                           llvm::StringRef ruleSetVersion);

} // namespace fqcheck
