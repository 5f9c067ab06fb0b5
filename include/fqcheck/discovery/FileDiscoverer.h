#pragma once

#include "fqcheck/core/Config.h"
#include "fqcheck/core/Finding.h"
#include "fqcheck/discovery/PathMatcher.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/FileSystem/UniqueID.h>

#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace fqcheck {

struct DiscoveredFile {
    std::string path;         // normalized absolute
    std::string relativePath; // '/'-separated, relative to the discovery root

    bool operator==(const DiscoveredFile &) const = default;
};

struct DiscoveryResult {
    std::string root;                        // normalized absolute
    std::vector<DiscoveredFile> files;       // unique, lexical by path
    std::vector<DiscoveryFinding> findings;  // skipped sub-paths
};

// Lazy depth-first walk under one directory. Entries of every directory are
// visited in lexical order, so the sequence is a pure function of the
// filesystem state. Unreadable sub-directories are recorded, not fatal.
// Each directory is entered at most once, so symlink cycles terminate.
class FileWalker {
public:
    FileWalker(std::string root, const Config &cfg, const PathMatcher &matcher);

    // Opens the root directory. Must succeed before next() yields anything.
    std::error_code start();

    std::optional<DiscoveredFile> next();

    std::vector<DiscoveryFinding> takeFindings() { return std::move(findings_); }

private:
    struct Frame {
        std::string dir;
        std::string rel;
        unsigned depth = 0;
        std::vector<std::string> names;
        size_t index = 0;
    };

    std::error_code openDirectory(const std::string &dir, const std::string &rel,
                                  unsigned depth);
    void recordSkipped(const std::string &path, const std::string &why);

    std::string root_;
    const Config &config_;
    const PathMatcher &matcher_;
    std::string cacheDir_;
    std::vector<Frame> stack_;
    std::set<llvm::sys::fs::UniqueID> visited_;
    std::vector<DiscoveryFinding> findings_;
};

class FileDiscoverer {
public:
    explicit FileDiscoverer(const Config &cfg);

    // Walks `root` (a directory, or a single file). Fails with AccessError
    // only when the root itself cannot be read.
    llvm::Expected<DiscoveryResult> discover(llvm::StringRef root) const;

    // Explicit file list; patterns do not apply. Relative entries resolve
    // against `baseDir`. Missing entries become discovery findings; an
    // AccessError is returned only when `baseDir` cannot be resolved.
    llvm::Expected<DiscoveryResult>
    discoverFiles(const std::vector<std::string> &files,
                  llvm::StringRef baseDir) const;

    // Absolute path with "." and ".." removed.
    static llvm::Expected<std::string> normalizePath(llvm::StringRef path,
                                                     llvm::StringRef baseDir = {});

private:
    const Config &config_;
    PathMatcher matcher_;
};

} // namespace fqcheck
