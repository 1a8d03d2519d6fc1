#pragma once

/// @file bounding_box.hpp
/// @brief Latitude/longitude aligned bounding box.

#include "core/types.hpp"
#include "geo/coordinate.hpp"

#include <algorithm>

namespace meridian::geo
{
    /// @brief Closed lat/lon box in degrees. Does not wrap the antimeridian.
    struct BoundingBox
    {
        f64 min_lat{0.0};
        f64 max_lat{0.0};
        f64 min_lon{0.0};
        f64 max_lon{0.0};

        /// Inclusive on all four edges.
        [[nodiscard]] bool contains(const Coordinate& c) const
        {
            return c.latitude() >= min_lat && c.latitude() <= max_lat &&
                   c.longitude() >= min_lon && c.longitude() <= max_lon;
        }

        /// Area in square degrees (used as a specificity measure, not a surface area).
        [[nodiscard]] f64 area_deg2() const
        {
            return (max_lat - min_lat) * (max_lon - min_lon);
        }

        [[nodiscard]] bool is_valid() const
        {
            return is_valid_latitude(min_lat) && is_valid_latitude(max_lat) &&
                   is_valid_longitude(min_lon) && is_valid_longitude(max_lon) &&
                   min_lat <= max_lat && min_lon <= max_lon;
        }

        /// Grow the box to include a point.
        void expand(f64 lat, f64 lon)
        {
            min_lat = std::min(min_lat, lat);
            max_lat = std::max(max_lat, lat);
            min_lon = std::min(min_lon, lon);
            max_lon = std::max(max_lon, lon);
        }

        bool operator==(const BoundingBox&) const = default;
    };

} // namespace meridian::geo
