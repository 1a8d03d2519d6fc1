#pragma once

/// @file result.hpp
/// @brief Immutable outcome of one resolution request.

#include "core/confidence.hpp"
#include "core/types.hpp"
#include "core/warning.hpp"

#include <absl/time/time.h>

#include <string>
#include <string_view>
#include <vector>

namespace meridian::resolver
{
    /// @brief Names of the subsystems a result can cite, in pipeline order.
    namespace sources
    {
        constexpr std::string_view kBoundaryIndex = "boundary_index";
        constexpr std::string_view kFallbackIndex = "fallback_index";
        constexpr std::string_view kPatchRegistry = "patch_registry";
        constexpr std::string_view kTzdb          = "tzdb";
        constexpr std::string_view kCallerInput   = "caller_input";
    }

    /// @brief Dataset versions reported with every result.
    struct DatasetVersions
    {
        std::string tzdb;
        std::string boundary;
        std::string settlement;
        std::string patch;

        bool operator==(const DatasetVersions&) const = default;
    };

    struct Provenance
    {
        DatasetVersions versions;
        std::vector<std::string> sources;           ///< Subsystems consulted, pipeline order
        std::string resolution_mode;                ///< Profile wire name
        std::string fold_policy;
        std::vector<std::string> patches_applied;   ///< 0 or 1 patch ids

        bool operator==(const Provenance&) const = default;
    };

    /// @brief Final answer for one request. Built once, never modified.
    struct ResolutionResult
    {
        absl::Time utc_instant;
        std::string utc;                ///< ISO-8601, "Z" suffix
        f64 utc_julian_date;
        std::string zone_id;
        i32 offset_seconds;
        bool dst_active;
        Confidence confidence;
        std::string reason;
        std::vector<std::string> notes;
        std::vector<Warning> warnings;
        Provenance provenance;

        [[nodiscard]] bool has_warning(std::string_view code) const;

        bool operator==(const ResolutionResult&) const = default;
    };

    /// @brief "YYYY-MM-DDTHH:MM:SS[.f]Z".
    [[nodiscard]] std::string format_utc(absl::Time instant);

    /// @brief Julian Date (UTC scale) of an instant.
    [[nodiscard]] f64 to_julian_date(absl::Time instant);

} // namespace meridian::resolver
