#pragma once

#include <llvm/ADT/StringRef.h>

#include <string>
#include <vector>

namespace fqcheck {

// Include/exclude filtering with fnmatch-style globs. A pattern matches if it
// matches either the root-relative path or its last component, so "*.txt"
// and "build" both behave as expected at any depth.
class PathMatcher {
public:
    PathMatcher(std::vector<std::string> includePatterns,
                std::vector<std::string> excludePatterns);

    bool isExcluded(llvm::StringRef relativePath) const;

    // True when no include patterns are configured.
    bool isIncluded(llvm::StringRef relativePath) const;

private:
    static bool matchesAny(const std::vector<std::string> &patterns,
                           llvm::StringRef relativePath);

    std::vector<std::string> include_;
    std::vector<std::string> exclude_;
};

} // namespace fqcheck
