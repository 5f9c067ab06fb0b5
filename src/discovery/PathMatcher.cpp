#include "fqcheck/discovery/PathMatcher.h"

#include <llvm/Support/Path.h>

#include <fnmatch.h>

namespace fqcheck {

PathMatcher::PathMatcher(std::vector<std::string> includePatterns,
                         std::vector<std::string> excludePatterns)
    : include_(std::move(includePatterns)),
      exclude_(std::move(excludePatterns)) {}

bool PathMatcher::isExcluded(llvm::StringRef relativePath) const {
    return matchesAny(exclude_, relativePath);
}

bool PathMatcher::isIncluded(llvm::StringRef relativePath) const {
    return include_.empty() || matchesAny(include_, relativePath);
}

bool PathMatcher::matchesAny(const std::vector<std::string> &patterns,
                             llvm::StringRef relativePath) {
    std::string rel = relativePath.str();
    std::string base = llvm::sys::path::filename(
        relativePath, llvm::sys::path::Style::posix).str();

    for (const auto &pat : patterns) {
        if (fnmatch(pat.c_str(), rel.c_str(), 0) == 0)
            return true;
        if (fnmatch(pat.c_str(), base.c_str(), 0) == 0)
            return true;
    }
    return false;
}

} // namespace fqcheck
