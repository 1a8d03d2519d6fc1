/// @file lookup_cache.cpp
/// @brief Coordinate rounding for cache keys.

#include "resolver/lookup_cache.hpp"

#include <cmath>

namespace meridian::resolver
{

CoordinateKey CoordinateKey::from(const geo::Coordinate& coordinate)
{
    return CoordinateKey{
        .lat_scaled = static_cast<i32>(std::lround(coordinate.latitude() * kScale)),
        .lon_scaled = static_cast<i32>(std::lround(coordinate.longitude() * kScale)),
    };
}

geo::Coordinate CoordinateKey::coordinate() const
{
    // Rounding an in-range coordinate never leaves the valid range
    const auto rounded = geo::Coordinate::make(lat_scaled / kScale, lon_scaled / kScale);
    return rounded.value();
}

} // namespace meridian::resolver
