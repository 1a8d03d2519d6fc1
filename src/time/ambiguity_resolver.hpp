#pragma once

/// @file ambiguity_resolver.hpp
/// @brief Local civil time to UTC with explicit fold and gap handling.

#include "core/types.hpp"
#include "core/warning.hpp"
#include "time/local_datetime.hpp"

#include <absl/time/time.h>

#include <optional>
#include <string>
#include <string_view>

namespace meridian::time
{
    /// @brief Which candidate wins when a local time occurs twice.
    enum class FoldPolicy : u8
    {
        PreferStandardTime,
        PreferDaylightTime,
        PreferEarlierInstant,
    };

    [[nodiscard]] std::string_view to_string(FoldPolicy policy);

    /// @brief Parse "prefer_standard_time" / "prefer_daylight_time" / "prefer_earlier_instant".
    [[nodiscard]] std::optional<FoldPolicy> parse_fold_policy(std::string_view text);

    /// @brief How the local time related to the zone's transition schedule.
    enum class TransitionKind : u8
    {
        Normal,
        Gap,
        Fold,
    };

    /// @brief Outcome of mapping one local time to one instant.
    struct LocalResolution
    {
        absl::Time utc;
        i32 offset_seconds = 0;     ///< Total UTC offset in force at utc
        bool dst_active = false;
        TransitionKind kind = TransitionKind::Normal;
        i64 transition_seconds = 0; ///< Gap or overlap length (0 when Normal)
        std::optional<Warning> warning;
    };

    /// @brief Static utility class mapping local civil times to UTC instants.
    ///
    /// Gap: the wall clock moves forward by the gap length. The result is the
    /// interpretation under the offset in force before the transition, which is
    /// exactly one gap length later than the interpretation under the offset
    /// after it.
    /// Fold: the policy picks one of the two instants. When both candidates have
    /// the same DST flag the daylight/standard policies fall back to the earlier
    /// instant.
    class AmbiguityResolver
    {
    public:
        AmbiguityResolver() = delete;

        /// @param local Civil time to resolve.
        /// @param zone Zone whose rules apply.
        /// @param zone_label Name used in warning messages.
        /// @param policy Fold policy.
        [[nodiscard]] static LocalResolution resolve(const LocalDateTime& local,
                                                     const absl::TimeZone& zone,
                                                     std::string_view zone_label,
                                                     FoldPolicy policy);

        /// @brief Resolve against a fixed total offset. Never a gap or fold.
        [[nodiscard]] static LocalResolution resolve_fixed(const LocalDateTime& local,
                                                           i32 offset_seconds,
                                                           bool dst_active);
    };

} // namespace meridian::time
