#include "format/time_codec.hpp"

#include <cmath>
#include <cstdint>
#include <format>
#include <limits>

namespace {

// Largest input whose millisecond count still fits in int64_t.
constexpr double kMaxSeconds = 9.0e15;

int64_t truncate_to_ms(double seconds) {
    double ms = seconds * 1000.0;
    // Snap values within a few ULPs of a whole millisecond onto it, so
    // 0.29 * 1000 == 289.99999999999997 counts as 290 while 1.9999999999
    // still truncates to 1999.
    double nearest = std::round(ms);
    double ulp = std::nextafter(ms, std::numeric_limits<double>::infinity()) - ms;
    if (std::abs(ms - nearest) <= 4 * ulp) ms = nearest;
    return static_cast<int64_t>(std::floor(ms));
}

} // namespace

std::string format_timestamp(double seconds, TimestampStyle style) {
    if (!std::isfinite(seconds) || seconds < 0.0) seconds = 0.0;
    if (seconds > kMaxSeconds) seconds = kMaxSeconds;

    int64_t total_ms = truncate_to_ms(seconds);

    int64_t hours = total_ms / 3'600'000;
    int64_t minutes = (total_ms / 60'000) % 60;
    int64_t secs = (total_ms / 1000) % 60;
    int64_t millis = total_ms % 1000;

    char sep = style == TimestampStyle::Vtt ? '.' : ',';
    return std::format("{:02}:{:02}:{:02}{}{:03}", hours, minutes, secs, sep, millis);
}

std::string format_seconds(double seconds) {
    auto s = std::format("{}", seconds);
    if (s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
}
