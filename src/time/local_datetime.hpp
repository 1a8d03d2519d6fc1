#pragma once

/// @file local_datetime.hpp
/// @brief Civil (wall-clock) date/time without an attached offset.

#include "core/types.hpp"

#include <absl/time/civil_time.h>

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace meridian::time
{
    /// @brief Civil date/time as entered by a caller, no offset attached.
    ///
    /// Always a valid calendar date and clock reading, but may still be invalid
    /// relative to a zone's transition schedule (a gap).
    /// Members compare lexicographically, which is chronological order.
    struct LocalDateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        i32 second;
        i32 nanosecond = 0;

        /// @brief Whole-second civil time (sub-second part dropped).
        [[nodiscard]] absl::CivilSecond civil() const;

        /// @brief ISO-8601 rendering, e.g. "1943-06-15T14:30:00".
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] static LocalDateTime from_civil(absl::CivilSecond cs, i32 nanosecond = 0);

        auto operator<=>(const LocalDateTime&) const = default;
    };

    /// @brief Parse a civil timestamp.
    ///
    /// Accepted forms: YYYY-MM-DDTHH:MM, YYYY-MM-DDTHH:MM:SS and
    /// YYYY-MM-DDTHH:MM:SS.f (1-9 fraction digits); a single space may stand in
    /// for 'T'. Years are 0001-9999. A date on its own (YYYY-MM-DD) is accepted
    /// only when allow_date_only is set and means 00:00:00.
    /// Anything carrying an offset or 'Z' designator is rejected.
    ///
    /// @return The parsed value, or std::nullopt if malformed or not a real calendar date.
    [[nodiscard]] std::optional<LocalDateTime> parse_local_datetime(std::string_view text,
                                                                    bool allow_date_only = false);

    [[nodiscard]] bool is_leap_year(i32 year);
    [[nodiscard]] i32 days_in_month(i32 year, i32 month);

} // namespace meridian::time
