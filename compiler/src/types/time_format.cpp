#include "types/time_format.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace stencil::types {

namespace {

/// Division rounding toward negative infinity.
auto floor_div(int64_t a, int64_t b) -> int64_t {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

// Displayable range: years -262143 through 262143, UTC.
constexpr int64_t MIN_DISPLAY_MILLIS = -8334601228800000;
constexpr int64_t MAX_DISPLAY_MILLIS = 8210298412799999;

struct RelativeUnit {
    uint64_t seconds;
    const char* name;
};

constexpr int64_t MINUTE = 60;
constexpr int64_t HOUR = 60 * MINUTE;
constexpr int64_t DAY = 24 * HOUR;

// Largest first.
constexpr RelativeUnit RELATIVE_UNITS[] = {
    {365 * DAY, "year"}, {30 * DAY, "month"}, {7 * DAY, "week"}, {DAY, "day"},
    {HOUR, "hour"},      {MINUTE, "minute"},  {1, "second"},
};

} // namespace

auto format_tz_offset(int32_t minutes) -> std::string {
    char sign = minutes < 0 ? '-' : '+';
    int32_t abs_minutes = minutes < 0 ? -minutes : minutes;

    std::ostringstream oss;
    oss << sign << std::setw(2) << std::setfill('0') << abs_minutes / 60 << ':' << std::setw(2)
        << std::setfill('0') << abs_minutes % 60;
    return oss.str();
}

auto format_timestamp(const Timestamp& ts) -> std::string {
    if (ts.millis_since_epoch < MIN_DISPLAY_MILLIS || ts.millis_since_epoch > MAX_DISPLAY_MILLIS) {
        return OUT_OF_RANGE_DATE;
    }
    int64_t local_millis = ts.millis_since_epoch + static_cast<int64_t>(ts.tz_offset) * 60 * 1000;
    int64_t seconds = floor_div(local_millis, 1000);
    int64_t millis = local_millis - seconds * 1000;

    auto time = static_cast<std::time_t>(seconds);
    std::tm tm_buf{};
#ifdef _WIN32
    bool converted = gmtime_s(&tm_buf, &time) == 0;
#else
    bool converted = gmtime_r(&time, &tm_buf) != nullptr;
#endif
    if (!converted) {
        return OUT_OF_RANGE_DATE;
    }

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << millis << ' ' << format_tz_offset(ts.tz_offset);
    return oss.str();
}

auto format_timestamp_relative(const Timestamp& ts, int64_t now_millis) -> std::string {
    if (ts.millis_since_epoch > now_millis) {
        return "in the future";
    }

    // The distance between any two int64 values fits in uint64.
    uint64_t diff_millis =
        static_cast<uint64_t>(now_millis) - static_cast<uint64_t>(ts.millis_since_epoch);
    uint64_t diff_seconds = diff_millis / 1000;
    if (diff_seconds == 0) {
        return "now";
    }

    for (const auto& unit : RELATIVE_UNITS) {
        if (diff_seconds >= unit.seconds) {
            uint64_t count = diff_seconds / unit.seconds;
            std::string text = std::to_string(count) + " " + unit.name;
            if (count != 1) {
                text += "s";
            }
            return text + " ago";
        }
    }
    return "now";
}

auto format_timestamp_relative_to_now(const Timestamp& ts) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto now_millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return format_timestamp_relative(ts, static_cast<int64_t>(now_millis));
}

} // namespace stencil::types
