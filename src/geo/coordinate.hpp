#pragma once

/// @file coordinate.hpp
/// @brief Geographic coordinate value type and great-circle helpers.

#include "core/types.hpp"

#include <optional>

namespace meridian::geo
{
    /// @brief Validated geographic coordinate (WGS84 degrees).
    ///
    /// Latitude in [-90, 90], longitude in [-180, 180], both finite.
    /// Instances can only be obtained through make(), so every Coordinate in
    /// the system is known to be in range.
    class Coordinate
    {
    public:
        /// @brief Validate and build a coordinate.
        /// @return std::nullopt if either component is out of range or not finite.
        [[nodiscard]] static std::optional<Coordinate> make(f64 latitude_deg, f64 longitude_deg);

        [[nodiscard]] f64 latitude() const { return m_latitude; }
        [[nodiscard]] f64 longitude() const { return m_longitude; }

        /// @brief Position on the unit sphere (x towards 0°/0°, z towards the north pole).
        [[nodiscard]] Vec3d unit_vector() const;

        bool operator==(const Coordinate&) const = default;

    private:
        Coordinate(f64 latitude_deg, f64 longitude_deg)
            : m_latitude{latitude_deg}
            , m_longitude{longitude_deg}
        {
        }

        f64 m_latitude;
        f64 m_longitude;
    };

    [[nodiscard]] bool is_valid_latitude(f64 latitude_deg);
    [[nodiscard]] bool is_valid_longitude(f64 longitude_deg);

    /// @brief Great-circle distance (haversine) in kilometres.
    [[nodiscard]] f64 great_circle_km(const Coordinate& a, const Coordinate& b);

} // namespace meridian::geo
