#pragma once

#include "fqcheck/core/Finding.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fqcheck {

enum class FileStatus : uint8_t {
    Pass,
    Fail,
    NotGraded, // no rule applied and nothing was found
};

inline constexpr size_t kFileStatusCount = 3;

constexpr std::string_view fileStatusName(FileStatus s) {
    switch (s) {
        case FileStatus::Pass:      return "pass";
        case FileStatus::Fail:      return "fail";
        case FileStatus::NotGraded: return "na";
    }
    return "na";
}

struct FileResult {
    std::string path;          // normalized absolute path
    std::string relativePath;  // '/'-separated, relative to the run root
    uint64_t    sizeBytes = 0;

    std::string fingerprint;            // MD5 of raw bytes; empty if unreadable
    std::string normalizedFingerprint;  // whitespace-insensitive; empty unless enabled

    std::vector<Finding> findings;      // rule registration order
    unsigned    rulesApplied = 0;
    double      score        = 0.0;
    FileStatus  status       = FileStatus::NotGraded;

    // Key used for duplicate grouping.
    const std::string &contentKey() const {
        return normalizedFingerprint.empty() ? fingerprint
                                             : normalizedFingerprint;
    }

    bool operator==(const FileResult &) const = default;
};

} // namespace fqcheck
