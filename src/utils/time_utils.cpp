#include "utils/time_utils.h"

#include <chrono>
#include <cctype>
#include <cmath>
#include <limits>

namespace chronodb {
namespace utils {

std::optional<TimePrecision> precisionFromString(const std::string& s) {
    if (s.empty() || s == "s") return TimePrecision::Seconds;
    if (s == "ms") return TimePrecision::Milliseconds;
    if (s == "u" || s == "us") return TimePrecision::Microseconds;
    return std::nullopt;
}

const char* precisionToString(TimePrecision p) {
    switch (p) {
        case TimePrecision::Seconds: return "s";
        case TimePrecision::Milliseconds: return "ms";
        case TimePrecision::Microseconds: return "u";
    }
    return "s";
}

std::optional<int64_t> toMillis(int64_t value, TimePrecision precision) {
    int64_t ms = value;
    switch (precision) {
        case TimePrecision::Seconds:
            if (value > kMaxTimestampMs / 1000 || value < -kMaxTimestampMs / 1000) return std::nullopt;
            ms = value * 1000;
            break;
        case TimePrecision::Milliseconds: break;
        case TimePrecision::Microseconds: ms = value / 1000; break;
    }
    if (ms > kMaxTimestampMs || ms < -kMaxTimestampMs) return std::nullopt;
    return ms;
}

std::optional<int64_t> toMillis(double value, TimePrecision precision) {
    if (!std::isfinite(value)) return std::nullopt;
    double ms = value;
    switch (precision) {
        case TimePrecision::Seconds: ms = value * 1000.0; break;
        case TimePrecision::Milliseconds: break;
        case TimePrecision::Microseconds: ms = value / 1000.0; break;
    }
    ms = std::round(ms);
    if (ms > static_cast<double>(kMaxTimestampMs) || ms < -static_cast<double>(kMaxTimestampMs)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(ms);
}

int64_t fromMillis(int64_t ms, TimePrecision precision) {
    switch (precision) {
        case TimePrecision::Seconds: return ms / 1000;
        case TimePrecision::Milliseconds: return ms;
        case TimePrecision::Microseconds:
            if (auto us = checkedMul(ms, 1000)) return *us;
            return ms < 0 ? std::numeric_limits<int64_t>::min() : std::numeric_limits<int64_t>::max();
    }
    return ms;
}

std::optional<int64_t> checkedAdd(int64_t a, int64_t b) {
    if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
        (b < 0 && a < std::numeric_limits<int64_t>::min() - b)) {
        return std::nullopt;
    }
    return a + b;
}

std::optional<int64_t> checkedSub(int64_t a, int64_t b) {
    if ((b < 0 && a > std::numeric_limits<int64_t>::max() + b) ||
        (b > 0 && a < std::numeric_limits<int64_t>::min() + b)) {
        return std::nullopt;
    }
    return a - b;
}

std::optional<int64_t> checkedMul(int64_t a, int64_t b) {
    if (a == 0 || b == 0) return 0;
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t min = std::numeric_limits<int64_t>::min();
    if (a > 0) {
        if (b > 0 ? a > max / b : b < min / a) return std::nullopt;
    } else {
        if (b > 0 ? a < min / b : a < max / b) return std::nullopt;
    }
    return a * b;
}

int64_t nowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::optional<int64_t> parseDurationMillis(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) ++i;
    if (i == 0) return std::nullopt;

    int64_t amount = 0;
    try {
        amount = std::stoll(text.substr(0, i));
    } catch (const std::exception&) {
        return std::nullopt;
    }

    const std::string unit = text.substr(i);
    int64_t factor = 0;
    if (unit == "u" || unit == "us") return amount / 1000;
    if (unit == "ms") factor = 1;
    else if (unit == "s") factor = 1000;
    else if (unit == "m") factor = 60LL * 1000;
    else if (unit == "h") factor = 3600LL * 1000;
    else if (unit == "d") factor = 86400LL * 1000;
    else if (unit == "w") factor = 7LL * 86400 * 1000;
    else return std::nullopt;

    if (amount > std::numeric_limits<int64_t>::max() / factor) return std::nullopt;
    return amount * factor;
}

int64_t alignToBucket(int64_t ts_ms, int64_t bucket_ms) {
    if (bucket_ms <= 0) return ts_ms;
    int64_t r = ts_ms % bucket_ms;
    if (r < 0) r += bucket_ms;
    return ts_ms - r;
}

} // namespace utils
} // namespace chronodb
