#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chronodb {
namespace utils {

/// Timestamp unit used on the wire. Storage is always milliseconds.
enum class TimePrecision { Seconds, Milliseconds, Microseconds };

/// Parse "s", "ms", "u" (also "us"). Empty string yields Seconds.
std::optional<TimePrecision> precisionFromString(const std::string& s);
const char* precisionToString(TimePrecision p);

/// Largest timestamp magnitude in milliseconds. Keeps every precision
/// conversion of a stored time inside int64.
constexpr int64_t kMaxTimestampMs = INT64_MAX / 1000;

/// Convert a wire timestamp to milliseconds. nullopt if the result is
/// outside +-kMaxTimestampMs.
std::optional<int64_t> toMillis(int64_t value, TimePrecision precision);

/// Convert a floating point wire timestamp (e.g. 1311836008.5 s) to milliseconds.
/// nullopt for NaN, infinity or an out of range result.
std::optional<int64_t> toMillis(double value, TimePrecision precision);

/// Convert stored milliseconds back to the wire precision. Saturates at the int64 limits.
int64_t fromMillis(int64_t ms, TimePrecision precision);

/// Overflow-checked int64 arithmetic. nullopt when the exact result does not fit.
std::optional<int64_t> checkedAdd(int64_t a, int64_t b);
std::optional<int64_t> checkedSub(int64_t a, int64_t b);
std::optional<int64_t> checkedMul(int64_t a, int64_t b);

/// Milliseconds since the Unix epoch.
int64_t nowMillis();

/**
 * @brief Parse a duration literal such as "15m", "1h", "7d", "500ms", "2w".
 *
 * Units: u (microseconds), ms, s, m, h, d, w. Result is in milliseconds;
 * microsecond durations are truncated. Returns nullopt on malformed input.
 */
std::optional<int64_t> parseDurationMillis(const std::string& text);

/// Align a timestamp down to the start of its bucket. bucket_ms <= 0 returns ts unchanged.
int64_t alignToBucket(int64_t ts_ms, int64_t bucket_ms);

} // namespace utils
} // namespace chronodb
