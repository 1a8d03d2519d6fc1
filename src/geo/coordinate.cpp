/// @file coordinate.cpp
/// @brief Implementation of coordinate validation and great-circle distance.

#include "geo/coordinate.hpp"

#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>

namespace meridian::geo
{

std::optional<Coordinate> Coordinate::make(f64 latitude_deg, f64 longitude_deg)
{
    if (!is_valid_latitude(latitude_deg) || !is_valid_longitude(longitude_deg))
    {
        return std::nullopt;
    }
    return Coordinate{latitude_deg, longitude_deg};
}

Vec3d Coordinate::unit_vector() const
{
    const f64 lat = glm::radians(m_latitude);
    const f64 lon = glm::radians(m_longitude);
    return Vec3d{
        std::cos(lat) * std::cos(lon),
        std::cos(lat) * std::sin(lon),
        std::sin(lat),
    };
}

bool is_valid_latitude(f64 latitude_deg)
{
    return std::isfinite(latitude_deg) && latitude_deg >= -90.0 && latitude_deg <= 90.0;
}

bool is_valid_longitude(f64 longitude_deg)
{
    return std::isfinite(longitude_deg) && longitude_deg >= -180.0 && longitude_deg <= 180.0;
}

// -----------------------------------------------------------------
// Haversine distance
// -----------------------------------------------------------------

f64 great_circle_km(const Coordinate& a, const Coordinate& b)
{
    const f64 lat1 = glm::radians(a.latitude());
    const f64 lat2 = glm::radians(b.latitude());
    const f64 dlat = lat2 - lat1;
    const f64 dlon = glm::radians(b.longitude() - a.longitude());

    const f64 h = std::sin(dlat / 2.0) * std::sin(dlat / 2.0)
                + std::cos(lat1) * std::cos(lat2) * std::sin(dlon / 2.0) * std::sin(dlon / 2.0);

    return 2.0 * geo_constants::kEarthRadiusKm * std::asin(std::sqrt(std::clamp(h, 0.0, 1.0)));
}

} // namespace meridian::geo
