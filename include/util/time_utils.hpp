#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace cth {

/**
 * @brief UTC point in time with microsecond resolution
 *
 * All telemetry timestamps are normalized to UTC when parsed. Naive
 * timestamps (no offset designator) are interpreted as UTC.
 */
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

/**
 * @brief Parse a timestamp string
 *
 * Accepted forms:
 *   2024-01-15T10:00:00Z
 *   2024-01-15T10:00:00.123456+02:00
 *   2024-01-15T10:00:00            (naive, treated as UTC)
 *   2024-01-15 10:00:00
 *   2024-01-15 10:00:00.250
 *
 * @return Parsed time point, or std::nullopt if the text is not a timestamp
 */
std::optional<Timestamp> parse_timestamp(const std::string& text);

/**
 * @brief Format as ISO-8601 UTC ("2024-01-15T10:00:00Z", fractional
 *        seconds only when non-zero)
 */
std::string format_timestamp(Timestamp ts);

/**
 * @brief Seconds elapsed from `from` to `to` (negative if `to` is earlier)
 */
double seconds_between(Timestamp from, Timestamp to);

/**
 * @brief Round down to a multiple of `minutes` within the hour, seconds cleared
 */
Timestamp floor_to_minutes(Timestamp ts, int minutes);

// Current wall-clock time
Timestamp now_utc();

// Build a timestamp from civil UTC fields (used by tests and examples)
Timestamp make_timestamp(int year, int month, int day,
                         int hour = 0, int minute = 0, int second = 0);

} // namespace cth
