#include "fqcheck/cache/ResultCache.h"

namespace fqcheck {

CacheStats ResultCache::stats() const {
    CacheStats s;
    s.hits          = hits_.load();
    s.misses        = misses_.load();
    s.corrupt       = corrupt_.load();
    s.writeFailures = writeFailures_.load();
    return s;
}

std::optional<FileResult> InMemoryResultCache::get(
    llvm::StringRef path, llvm::StringRef relativePath,
    llvm::StringRef fingerprint, llvm::StringRef ruleSetVersion) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(path.str());
    if (it == entries_.end() || it->second.relativePath != relativePath ||
        it->second.fingerprint != fingerprint ||
        it->second.ruleSetVersion != ruleSetVersion) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second.result;
}

void InMemoryResultCache::put(llvm::StringRef path,
                              llvm::StringRef relativePath,
                              llvm::StringRef fingerprint,
                              llvm::StringRef ruleSetVersion,
                              const FileResult &result) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[path.str()] = Entry{relativePath.str(), fingerprint.str(),
                                 ruleSetVersion.str(), result};
}

size_t InMemoryResultCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace fqcheck
