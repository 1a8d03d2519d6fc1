#pragma once

/// @file patch.hpp
/// @brief Historical override rule: where, when and what it changes.

#include "core/confidence.hpp"
#include "core/types.hpp"
#include "geo/bounding_box.hpp"
#include "geo/coordinate.hpp"
#include "history/dst_rule.hpp"
#include "time/local_datetime.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace meridian::history
{
    /// @brief Inclusive lat/lon box with a human-readable label.
    struct BoxRegion
    {
        geo::BoundingBox box;
        std::string label;
    };

    /// @brief Every coordinate whose base zone is zone_id.
    struct NamedZoneRegion
    {
        std::string zone_id;
    };

    using PatchRegion = std::variant<BoxRegion, NamedZoneRegion>;

    /// @brief Re-resolve the local time in another tz zone.
    struct ZoneOverride
    {
        std::string zone_id;
    };

    /// @brief Replace the zone with a fixed standard offset plus a DST rule.
    ///
    /// The DST rule is evaluated on the local wall time and its switches are
    /// instantaneous: local times skipped or repeated at a rule transition
    /// resolve with the offset the rule gives them and never raise
    /// non_existent_local_time or ambiguous_local_time.
    struct FixedOffsetOverride
    {
        i32 offset_seconds;         ///< Standard (non-DST) offset
        DstRule dst_rule = DstRule::None;
        std::string zone_label;     ///< Reported zone id; empty means "UTC±hh:mm"
    };

    using PatchEffect = std::variant<ZoneOverride, FixedOffsetOverride>;

    /// @brief Historical era vs. forward-looking convention change.
    enum class PatchScope : u8
    {
        Historical,
        Forward,
    };

    [[nodiscard]] std::string_view to_string(PatchScope scope);
    [[nodiscard]] std::optional<PatchScope> parse_patch_scope(std::string_view text);

    /// @brief Which patches a request may consult.
    enum class PatchSubset : u8
    {
        None,
        All,
        ForwardOnly,
    };

    /// @brief One entry of the historical patch registry. Immutable once loaded.
    struct Patch
    {
        std::string id;
        PatchRegion region;
        time::LocalDateTime valid_from;     ///< Inclusive
        time::LocalDateTime valid_to;       ///< Exclusive
        PatchEffect effect;
        Confidence confidence = Confidence::Medium;
        PatchScope scope = PatchScope::Historical;
        std::string reason;
        std::vector<std::string> sources;

        /// @brief Region test. Named-zone regions compare against the base zone.
        [[nodiscard]] bool covers(const geo::Coordinate& coordinate, std::string_view base_zone_id) const;

        /// @brief valid_from <= local < valid_to.
        [[nodiscard]] bool active_at(const time::LocalDateTime& local) const
        {
            return valid_from <= local && local < valid_to;
        }

        [[nodiscard]] bool is_box() const { return std::holds_alternative<BoxRegion>(region); }

        /// @brief Interval length in seconds.
        [[nodiscard]] i64 interval_seconds() const
        {
            return valid_to.civil() - valid_from.civil();
        }

        [[nodiscard]] bool allowed_by(PatchSubset subset) const
        {
            switch (subset)
            {
                case PatchSubset::None:        return false;
                case PatchSubset::All:         return true;
                case PatchSubset::ForwardOnly: return scope == PatchScope::Forward;
            }
            return false;
        }
    };

} // namespace meridian::history
