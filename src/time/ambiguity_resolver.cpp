/// @file ambiguity_resolver.cpp
/// @brief Implementation of fold/gap resolution on top of absl::TimeZone::At().

#include "time/ambiguity_resolver.hpp"

#include "time/zone_database.hpp"

#include <fmt/format.h>

namespace meridian::time
{

namespace
{

std::string_view dst_label(bool dst_active)
{
    return dst_active ? "daylight" : "standard";
}

std::string wall_clock(absl::CivilSecond cs)
{
    return fmt::format("{:02d}:{:02d}:{:02d}", cs.hour(), cs.minute(), cs.second());
}

} // anonymous namespace

std::string_view to_string(FoldPolicy policy)
{
    switch (policy)
    {
        case FoldPolicy::PreferStandardTime:   return "prefer_standard_time";
        case FoldPolicy::PreferDaylightTime:   return "prefer_daylight_time";
        case FoldPolicy::PreferEarlierInstant: return "prefer_earlier_instant";
    }
    return "prefer_standard_time";
}

std::optional<FoldPolicy> parse_fold_policy(std::string_view text)
{
    for (const FoldPolicy policy : {FoldPolicy::PreferStandardTime,
                                    FoldPolicy::PreferDaylightTime,
                                    FoldPolicy::PreferEarlierInstant})
    {
        if (text == to_string(policy))
        {
            return policy;
        }
    }
    return std::nullopt;
}

// -----------------------------------------------------------------
// Zone resolution
// -----------------------------------------------------------------

LocalResolution AmbiguityResolver::resolve(const LocalDateTime& local,
                                           const absl::TimeZone& zone,
                                           std::string_view zone_label,
                                           FoldPolicy policy)
{
    const absl::Duration sub_second = absl::Nanoseconds(local.nanosecond);
    const absl::TimeZone::TimeInfo info = zone.At(local.civil());

    LocalResolution result{
        .utc            = info.pre + sub_second,
        .offset_seconds = 0,
        .dst_active     = false,
    };

    switch (info.kind)
    {
        case absl::TimeZone::TimeInfo::UNIQUE:
            break;

        case absl::TimeZone::TimeInfo::SKIPPED:
        {
            // pre uses the offset before the transition, post the one after; pre > post
            result.kind = TransitionKind::Gap;
            result.transition_seconds = absl::ToInt64Seconds(info.pre - info.post);

            const absl::TimeZone::CivilInfo shifted = zone.At(result.utc);
            result.warning = Warning{
                .code    = std::string{warning_codes::kNonExistentLocalTime},
                .message = fmt::format(
                    "local time {} does not exist in {} ({} min gap); shifted forward to {} at UTC{}",
                    local.to_string(), zone_label, result.transition_seconds / 60,
                    wall_clock(shifted.cs), format_offset(shifted.offset)),
            };
            break;
        }

        case absl::TimeZone::TimeInfo::REPEATED:
        {
            // pre is the earlier instant (offset before the transition)
            const absl::TimeZone::CivilInfo earlier = zone.At(info.pre);
            const absl::TimeZone::CivilInfo later = zone.At(info.post);

            bool pick_earlier = true;
            if (earlier.is_dst != later.is_dst)
            {
                if (policy == FoldPolicy::PreferStandardTime)
                {
                    pick_earlier = !earlier.is_dst;
                }
                else if (policy == FoldPolicy::PreferDaylightTime)
                {
                    pick_earlier = earlier.is_dst;
                }
            }

            const absl::TimeZone::CivilInfo& chosen = pick_earlier ? earlier : later;
            const absl::TimeZone::CivilInfo& rejected = pick_earlier ? later : earlier;

            result.utc = (pick_earlier ? info.pre : info.post) + sub_second;
            result.kind = TransitionKind::Fold;
            result.transition_seconds = absl::ToInt64Seconds(info.post - info.pre);
            result.warning = Warning{
                .code    = std::string{warning_codes::kAmbiguousLocalTime},
                .message = fmt::format(
                    "local time {} occurs twice in {}; chose UTC{} ({}) over UTC{} ({}) per {}",
                    local.to_string(), zone_label,
                    format_offset(chosen.offset), dst_label(chosen.is_dst),
                    format_offset(rejected.offset), dst_label(rejected.is_dst),
                    to_string(policy)),
            };
            break;
        }
    }

    const absl::TimeZone::CivilInfo at = zone.At(result.utc);
    result.offset_seconds = at.offset;
    result.dst_active = at.is_dst;

    return result;
}

LocalResolution AmbiguityResolver::resolve_fixed(const LocalDateTime& local,
                                                 i32 offset_seconds,
                                                 bool dst_active)
{
    const absl::Time utc = absl::FromCivil(local.civil(), absl::UTCTimeZone()) -
                           absl::Seconds(offset_seconds) +
                           absl::Nanoseconds(local.nanosecond);

    return LocalResolution{
        .utc            = utc,
        .offset_seconds = offset_seconds,
        .dst_active     = dst_active,
    };
}

} // namespace meridian::time
