#pragma once

#include "fqcheck/core/Severity.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fqcheck {

// Stable rule identifiers. FQ9xx are synthetic: produced by the engine,
// never by a registered rule.
namespace ruleid {
inline constexpr std::string_view FileSize       = "FQ001";
inline constexpr std::string_view Encoding       = "FQ010";
inline constexpr std::string_view LineEndings    = "FQ020";
inline constexpr std::string_view Duplication    = "FQ030";
inline constexpr std::string_view Naming         = "FQ040";
inline constexpr std::string_view RuleFailure    = "FQ900";
inline constexpr std::string_view Unreadable     = "FQ901";
inline constexpr std::string_view Inaccessible   = "FQ902";
} // namespace ruleid

struct FindingLocation {
    unsigned line       = 0; // 1-based
    uint64_t byteOffset = 0; // from start of file

    bool operator==(const FindingLocation &) const = default;
};

struct Finding {
    std::string    ruleID;
    std::string    title;
    Severity       severity = Severity::Informational;
    std::string    message;
    std::optional<FindingLocation> location;

    bool operator==(const Finding &) const = default;
};

// A finding raised while walking the tree, before any file was analyzed.
struct DiscoveryFinding {
    std::string path;
    Finding     finding;

    bool operator==(const DiscoveryFinding &) const = default;
};

} // namespace fqcheck
