#pragma once

#include <optional>
#include <string>

namespace cth {

// Event severity, totally ordered NORMAL < WARNING < ERROR < CRITICAL
enum class Severity {
    NORMAL,
    WARNING,
    ERROR,
    CRITICAL
};

inline std::string severity_to_string(Severity severity) {
    switch (severity) {
        case Severity::NORMAL: return "normal";
        case Severity::WARNING: return "warning";
        case Severity::ERROR: return "error";
        case Severity::CRITICAL: return "critical";
        default: return "normal";
    }
}

/**
 * @brief Strict parse, used where an unknown level must be reported
 */
inline std::optional<Severity> parse_severity(const std::string& s) {
    if (s == "normal") return Severity::NORMAL;
    if (s == "warning") return Severity::WARNING;
    if (s == "error") return Severity::ERROR;
    if (s == "critical") return Severity::CRITICAL;
    return std::nullopt;
}

/**
 * @brief Lenient parse for stored records: unknown levels read as NORMAL
 */
inline Severity string_to_severity(const std::string& s) {
    return parse_severity(s).value_or(Severity::NORMAL);
}

// Weight used by transition scoring and scope aggregation: normal=1 .. critical=4
inline int severity_weight(Severity severity) {
    return static_cast<int>(severity) + 1;
}

inline Severity severity_from_weight(double weight) {
    if (weight >= 3.5) return Severity::CRITICAL;
    if (weight >= 2.5) return Severity::ERROR;
    if (weight >= 1.5) return Severity::WARNING;
    return Severity::NORMAL;
}

} // namespace cth
