/// @file result.cpp
/// @brief Result helpers: UTC rendering and Julian Date.

#include "resolver/result.hpp"

#include <algorithm>

namespace meridian::resolver
{

bool ResolutionResult::has_warning(std::string_view code) const
{
    return std::any_of(warnings.begin(), warnings.end(),
                       [code](const Warning& w) { return w.code == code; });
}

std::string format_utc(absl::Time instant)
{
    return absl::FormatTime("%Y-%m-%dT%H:%M:%E*SZ", instant, absl::UTCTimeZone());
}

f64 to_julian_date(absl::Time instant)
{
    const f64 seconds = absl::ToDoubleSeconds(instant - absl::UnixEpoch());
    return time_constants::kUnixEpochJd + seconds / time_constants::kSecondsPerDay;
}

} // namespace meridian::resolver
