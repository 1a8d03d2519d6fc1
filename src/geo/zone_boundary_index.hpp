#pragma once

/// @file zone_boundary_index.hpp
/// @brief Point-in-polygon lookup of base time-zone identities.

#include "core/types.hpp"
#include "geo/bounding_box.hpp"
#include "geo/coordinate.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace meridian::geo
{
    /// @brief One polygon of the zone boundary dataset.
    ///
    /// Vertices are stored as (x = longitude, y = latitude) in degrees.
    /// rings[0] is the outer boundary, further rings are holes. Rings are
    /// implicitly closed (the last vertex connects back to the first).
    struct ZonePolygon
    {
        std::string zone_id;
        std::vector<std::vector<Vec2d>> rings;
        BoundingBox bounds;
    };

    /// @brief Immutable point-in-polygon index over the zone boundary dataset.
    ///
    /// Candidate polygons are narrowed with a uniform grid over their bounding
    /// boxes (kGridResolutionDeg cells). Each cell keeps its candidates in
    /// canonical dataset order, which doubles as the tie-break rule: a
    /// coordinate that lies on a shared edge, or inside overlapping polygons,
    /// resolves to the polygon that appears first in the dataset.
    class ZoneBoundaryIndex
    {
    public:
        static constexpr f64 kGridResolutionDeg = 1.0;

        /// @param polygons Polygons in canonical dataset order. Bounds are recomputed.
        /// @param version Dataset version label reported in provenance.
        ZoneBoundaryIndex(std::vector<ZonePolygon> polygons, std::string version);

        /// @brief Find the polygon containing a coordinate.
        /// Points on an edge or vertex count as contained.
        /// @return The first containing polygon in dataset order, or nullptr.
        [[nodiscard]] const ZonePolygon* lookup(const Coordinate& coordinate) const;

        [[nodiscard]] std::size_t size() const { return m_polygons.size(); }
        [[nodiscard]] const std::string& version() const { return m_version; }
        [[nodiscard]] const std::vector<ZonePolygon>& polygons() const { return m_polygons; }

    private:
        std::vector<ZonePolygon> m_polygons;
        std::string m_version;

        // Spatial grid: key = lat_cell * kLonCells + lon_cell
        using CellKey = u32;
        std::unordered_map<CellKey, std::vector<std::size_t>> m_grid;

        static constexpr i32 kLatCells = static_cast<i32>(180.0 / kGridResolutionDeg);
        static constexpr i32 kLonCells = static_cast<i32>(360.0 / kGridResolutionDeg);

        static CellKey cell_key(i32 lat_cell, i32 lon_cell)
        {
            return static_cast<CellKey>(lat_cell * kLonCells + lon_cell);
        }

        static std::pair<i32, i32> cell_for(f64 lat, f64 lon);

        void build_grid();
    };

    /// @brief Classification of a point against a single closed ring.
    enum class RingSide
    {
        Outside,
        Inside,
        OnEdge,
    };

    /// @brief Even-odd ray casting with explicit edge detection.
    [[nodiscard]] RingSide classify_point(const std::vector<Vec2d>& ring, Vec2d point);

    /// @brief Outer ring contains the point (edges included) and no hole strictly contains it.
    [[nodiscard]] bool polygon_contains(const ZonePolygon& polygon, Vec2d point);

} // namespace meridian::geo
