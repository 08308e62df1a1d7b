//! # Timestamp Formatting
//!
//! | Function                      | Output                            |
//! |-------------------------------|-----------------------------------|
//! | `format_timestamp`            | `2023-01-02 03:04:05.678 +09:00`  |
//! | `format_timestamp_relative`   | `3 days ago`, `now`, `in the future` |
//!
//! Relative times use the largest whole unit: seconds, minutes, hours, days,
//! weeks, months (30 days) and years (365 days), singular for a count of one.
//!
//! Timestamps outside years -262143 to 262143 display as `<out-of-range date>`.

#ifndef STENCIL_TYPES_TIME_FORMAT_HPP
#define STENCIL_TYPES_TIME_FORMAT_HPP

#include "types/value_types.hpp"

#include <cstdint>
#include <string>

namespace stencil::types {

inline constexpr const char* OUT_OF_RANGE_DATE = "<out-of-range date>";

/// Formats `ts` in its own UTC offset.
[[nodiscard]] auto format_timestamp(const Timestamp& ts) -> std::string;

/// Formats the distance from `ts` to `now_millis` (milliseconds since epoch).
[[nodiscard]] auto format_timestamp_relative(const Timestamp& ts, int64_t now_millis)
    -> std::string;

/// `format_timestamp_relative` against the system clock.
[[nodiscard]] auto format_timestamp_relative_to_now(const Timestamp& ts) -> std::string;

/// Formats a UTC offset in minutes as `+HH:MM` / `-HH:MM`.
[[nodiscard]] auto format_tz_offset(int32_t minutes) -> std::string;

} // namespace stencil::types

#endif // STENCIL_TYPES_TIME_FORMAT_HPP
