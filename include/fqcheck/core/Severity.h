#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace fqcheck {

enum class Severity : uint8_t {
    Informational = 0,
    Medium        = 1,
    High          = 2,
    Critical      = 3,
};

inline constexpr size_t kSeverityCount = 4;

constexpr std::string_view severityToString(Severity s) {
    switch (s) {
        case Severity::Informational: return "Informational";
        case Severity::Medium:        return "Medium";
        case Severity::High:          return "High";
        case Severity::Critical:      return "Critical";
    }
    return "Unknown";
}

constexpr std::optional<Severity> severityFromString(std::string_view s) {
    if (s == "Critical")      return Severity::Critical;
    if (s == "High")          return Severity::High;
    if (s == "Medium")        return Severity::Medium;
    if (s == "Informational") return Severity::Informational;
    return std::nullopt;
}

constexpr size_t severityIndex(Severity s) {
    return static_cast<size_t>(s);
}

constexpr bool operator>=(Severity a, Severity b) {
    return static_cast<uint8_t>(a) >= static_cast<uint8_t>(b);
}

} // namespace fqcheck
