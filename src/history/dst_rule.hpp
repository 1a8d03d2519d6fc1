#pragma once

/// @file dst_rule.hpp
/// @brief Daylight-saving rule sets used by fixed-offset historical patches.

#include "core/types.hpp"
#include "time/local_datetime.hpp"

#include <absl/time/civil_time.h>

#include <optional>
#include <string_view>

namespace meridian::history
{
    /// @brief Rule that decides whether +1h applies on top of a patch's base offset.
    enum class DstRule : u8
    {
        None,       ///< Standard offset all year
        WarTime,    ///< +1h all year (e.g. US War Time, Feb 1942 - Sep 1945)
        UsStandard, ///< +1h from the last Sunday of April to the last Sunday of October
    };

    [[nodiscard]] std::string_view to_string(DstRule rule);

    /// @brief Parse "none" / "war_time" / "us_standard".
    [[nodiscard]] std::optional<DstRule> parse_dst_rule(std::string_view text);

    /// @brief Whether the rule adds daylight time at a local civil time.
    ///
    /// UsStandard is in effect from 00:00 on the last Sunday of April up to and
    /// including 00:00 on the last Sunday of October.
    [[nodiscard]] bool dst_in_effect(DstRule rule, const time::LocalDateTime& local);

    /// @brief Last Sunday of a month.
    [[nodiscard]] absl::CivilDay last_sunday(i64 year, i32 month);

} // namespace meridian::history
