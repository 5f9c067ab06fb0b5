#pragma once

#include "fqcheck/core/Config.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <cassert>
#include <string>

namespace fqcheck::test {

// Unique scratch directory under the system temp dir, removed on
// destruction.
class TempDir {
public:
    explicit TempDir(const std::string &name) {
        llvm::SmallString<128> p;
        std::error_code ec =
            llvm::sys::fs::createUniqueDirectory("fqcheck_" + name, p);
        assert(!ec);
        (void)ec;
        path_ = std::string(p);
    }

    ~TempDir() { llvm::sys::fs::remove_directories(path_); }

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::string &str() const { return path_; }

    std::string file(const std::string &rel) const {
        llvm::SmallString<256> p(path_);
        llvm::sys::path::append(p, rel);
        return std::string(p);
    }

    // Writes `content` to `rel`, creating parent directories.
    std::string write(const std::string &rel, const std::string &content) const {
        std::string p = file(rel);
        std::error_code ec = llvm::sys::fs::create_directories(
            llvm::sys::path::parent_path(p));
        assert(!ec);
        llvm::raw_fd_ostream out(p, ec);
        assert(!ec);
        out << content;
        return p;
    }

private:
    std::string path_;
};

inline std::string readFile(const std::string &path) {
    auto buf = llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                           /*RequiresNullTerminator=*/false);
    assert(buf);
    return (*buf)->getBuffer().str();
}

// Number of entries directly inside `dir`.
inline size_t countEntries(const std::string &dir) {
    size_t n = 0;
    std::error_code ec;
    for (llvm::sys::fs::directory_iterator it(dir, ec), end; !ec && it != end;
         it.increment(ec))
        ++n;
    assert(!ec);
    return n;
}

// Defaults with caching off and a single worker, so results do not depend
// on the environment.
inline Config quietConfig() {
    Config cfg = Config::defaults();
    cfg.cacheEnabled = false;
    cfg.workers = 1;
    return cfg;
}

} // namespace fqcheck::test
