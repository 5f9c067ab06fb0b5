#include "fqcheck/discovery/FileDiscoverer.h"
#include "fqcheck/core/Errors.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/Path.h>

#include <algorithm>

namespace fqcheck {

namespace fs = llvm::sys::fs;
namespace path = llvm::sys::path;

namespace {

Finding inaccessibleFinding(const std::string &why) {
    Finding f;
    f.ruleID   = std::string(ruleid::Inaccessible);
    f.title    = "Inaccessible Path";
    f.severity = Severity::Medium;
    f.message  = why;
    return f;
}

std::string joinPath(llvm::StringRef dir, llvm::StringRef name) {
    llvm::SmallString<256> p(dir);
    path::append(p, name);
    return std::string(p);
}

void sortAndDedupe(std::vector<DiscoveredFile> &files) {
    std::sort(files.begin(), files.end(),
              [](const DiscoveredFile &a, const DiscoveredFile &b) {
                  return a.path < b.path;
              });
    files.erase(std::unique(files.begin(), files.end(),
                            [](const DiscoveredFile &a, const DiscoveredFile &b) {
                                return a.path == b.path;
                            }),
                files.end());
}

} // anonymous namespace

// --- FileWalker ---

FileWalker::FileWalker(std::string root, const Config &cfg,
                       const PathMatcher &matcher)
    : root_(std::move(root)), config_(cfg), matcher_(matcher),
      cacheDir_(cfg.cacheDirFor(root_)) {}

std::error_code FileWalker::start() {
    stack_.clear();
    visited_.clear();

    fs::file_status st;
    if (auto ec = fs::status(root_, st))
        return ec;
    visited_.insert(st.getUniqueID());
    return openDirectory(root_, "", 0);
}

std::error_code FileWalker::openDirectory(const std::string &dir,
                                          const std::string &rel,
                                          unsigned depth) {
    Frame frame;
    frame.dir = dir;
    frame.rel = rel;
    frame.depth = depth;

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec, config_.followSymlinks), end;
         !ec && it != end; it.increment(ec)) {
        frame.names.push_back(path::filename(it->path()).str());
    }
    if (ec)
        return ec;

    std::sort(frame.names.begin(), frame.names.end());
    stack_.push_back(std::move(frame));
    return {};
}

void FileWalker::recordSkipped(const std::string &p, const std::string &why) {
    findings_.push_back({p, inaccessibleFinding(why)});
}

std::optional<DiscoveredFile> FileWalker::next() {
    while (!stack_.empty()) {
        Frame &top = stack_.back();
        if (top.index >= top.names.size()) {
            stack_.pop_back();
            continue;
        }

        const std::string &name = top.names[top.index++];
        std::string child = joinPath(top.dir, name);
        std::string rel = top.rel.empty() ? name : top.rel + "/" + name;
        unsigned depth = top.depth;

        if (child == cacheDir_ || matcher_.isExcluded(rel))
            continue;

        fs::file_status st;
        if (auto ec = fs::status(child, st, config_.followSymlinks)) {
            recordSkipped(child, "cannot stat: " + ec.message());
            continue;
        }

        switch (st.type()) {
            case fs::file_type::directory_file:
                // `top` may dangle after this call.
                if (depth + 1 > config_.maxDepth)
                    continue;
                // Already entered, through a symlink or as an ancestor.
                if (!visited_.insert(st.getUniqueID()).second)
                    continue;
                if (auto ec = openDirectory(child, rel, depth + 1))
                    recordSkipped(child, "cannot read directory: " + ec.message());
                continue;
            case fs::file_type::regular_file:
                if (!matcher_.isIncluded(rel))
                    continue;
                return DiscoveredFile{std::move(child), std::move(rel)};
            default:
                // Symlinks (when not followed), sockets, devices.
                continue;
        }
    }
    return std::nullopt;
}

// --- FileDiscoverer ---

FileDiscoverer::FileDiscoverer(const Config &cfg)
    : config_(cfg), matcher_(cfg.includePatterns, cfg.excludePatterns) {}

llvm::Expected<std::string> FileDiscoverer::normalizePath(llvm::StringRef p,
                                                          llvm::StringRef baseDir) {
    llvm::SmallString<256> abs(p);
    if (path::is_relative(abs)) {
        if (!baseDir.empty()) {
            abs = baseDir;
            path::append(abs, p);
        } else if (auto ec = fs::make_absolute(abs)) {
            return llvm::make_error<AccessError>(p.str(), ec);
        }
    }
    path::remove_dots(abs, /*remove_dot_dot=*/true);
    return std::string(abs);
}

llvm::Expected<DiscoveryResult>
FileDiscoverer::discover(llvm::StringRef root) const {
    auto normOrErr = normalizePath(root);
    if (!normOrErr)
        return normOrErr.takeError();
    std::string norm = std::move(*normOrErr);

    fs::file_status st;
    if (auto ec = fs::status(norm, st))
        return llvm::make_error<AccessError>(norm, ec);

    DiscoveryResult result;

    if (st.type() == fs::file_type::regular_file) {
        result.root = path::parent_path(norm).str();
        result.files.push_back({norm, path::filename(norm).str()});
        return result;
    }

    if (st.type() != fs::file_type::directory_file)
        return llvm::make_error<AccessError>(
            norm, std::make_error_code(std::errc::not_a_directory));

    result.root = norm;
    FileWalker walker(norm, config_, matcher_);
    if (auto ec = walker.start())
        return llvm::make_error<AccessError>(norm, ec);

    while (auto file = walker.next())
        result.files.push_back(std::move(*file));

    result.findings = walker.takeFindings();
    sortAndDedupe(result.files);
    return result;
}

llvm::Expected<DiscoveryResult>
FileDiscoverer::discoverFiles(const std::vector<std::string> &files,
                              llvm::StringRef baseDir) const {
    auto baseOrErr = normalizePath(baseDir);
    if (!baseOrErr)
        return baseOrErr.takeError();

    DiscoveryResult result;
    result.root = std::move(*baseOrErr);

    std::string prefix = result.root;
    if (!prefix.empty() && prefix.back() != '/')
        prefix += '/';

    for (const auto &f : files) {
        auto normOrErr = normalizePath(f, result.root);
        if (!normOrErr) {
            llvm::consumeError(normOrErr.takeError());
            result.findings.push_back({f, inaccessibleFinding("cannot resolve path")});
            continue;
        }
        std::string norm = std::move(*normOrErr);

        fs::file_status st;
        if (auto ec = fs::status(norm, st)) {
            result.findings.push_back(
                {norm, inaccessibleFinding("cannot stat: " + ec.message())});
            continue;
        }
        if (st.type() != fs::file_type::regular_file) {
            result.findings.push_back(
                {norm, inaccessibleFinding("not a regular file")});
            continue;
        }

        std::string rel = llvm::StringRef(norm).startswith(prefix)
            ? norm.substr(prefix.size())
            : llvm::StringRef(norm).ltrim('/').str();
        result.files.push_back({norm, rel});
    }

    sortAndDedupe(result.files);
    return result;
}

} // namespace fqcheck
