/// @file dst_rule.cpp
/// @brief Implementation of the historical DST rule sets.

#include "history/dst_rule.hpp"

namespace meridian::history
{

std::string_view to_string(DstRule rule)
{
    switch (rule)
    {
        case DstRule::None:       return "none";
        case DstRule::WarTime:    return "war_time";
        case DstRule::UsStandard: return "us_standard";
    }
    return "none";
}

std::optional<DstRule> parse_dst_rule(std::string_view text)
{
    for (const DstRule rule : {DstRule::None, DstRule::WarTime, DstRule::UsStandard})
    {
        if (text == to_string(rule))
        {
            return rule;
        }
    }
    return std::nullopt;
}

absl::CivilDay last_sunday(i64 year, i32 month)
{
    // Day before the first of the next month, then back to a Sunday
    const absl::CivilDay first_of_next = absl::CivilDay(absl::CivilMonth(year, month) + 1);
    return absl::PrevWeekday(first_of_next, absl::Weekday::sunday);
}

bool dst_in_effect(DstRule rule, const time::LocalDateTime& local)
{
    switch (rule)
    {
        case DstRule::None:
            return false;

        case DstRule::WarTime:
            return true;

        case DstRule::UsStandard:
        {
            const absl::CivilSecond start = absl::CivilSecond(last_sunday(local.year, 4));
            const absl::CivilSecond end = absl::CivilSecond(last_sunday(local.year, 10));
            const absl::CivilSecond cs = local.civil();
            return cs >= start && cs <= end;
        }
    }
    return false;
}

} // namespace meridian::history
