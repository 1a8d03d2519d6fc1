#pragma once

/// @file warning.hpp
/// @brief Structured warning attached to resolution results.

#include <string>
#include <string_view>

namespace meridian
{
    /// @brief Machine-readable code plus a human message.
    struct Warning
    {
        std::string code;
        std::string message;

        bool operator==(const Warning&) const = default;
    };

    namespace warning_codes
    {
        constexpr std::string_view kNonExistentLocalTime = "non_existent_local_time";
        constexpr std::string_view kAmbiguousLocalTime   = "ambiguous_local_time";
        constexpr std::string_view kDistantFallback      = "distant_fallback";
        constexpr std::string_view kTrustedUserInput     = "trusted_user_input";
        constexpr std::string_view kZoneAbbreviation     = "zone_abbreviation";
        constexpr std::string_view kUserZoneMismatch     = "user_zone_mismatch";
        constexpr std::string_view kInvalidUserZone      = "invalid_user_zone";
    }
}
