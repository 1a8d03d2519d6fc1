/// @file zone_boundary_index.cpp
/// @brief Implementation of the zone boundary grid index and point-in-polygon tests.

#include "geo/zone_boundary_index.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace meridian::geo
{

namespace
{

// Collinearity tolerance in degrees² (well below dataset vertex precision)
constexpr f64 kEdgeEpsilon = 1e-12;

bool on_segment(Vec2d a, Vec2d b, Vec2d p)
{
    const Vec2d ab = b - a;
    const Vec2d ap = p - a;
    const f64 cross = ab.x * ap.y - ab.y * ap.x;
    if (std::abs(cross) > kEdgeEpsilon)
    {
        return false;
    }
    return p.x >= std::min(a.x, b.x) && p.x <= std::max(a.x, b.x) &&
           p.y >= std::min(a.y, b.y) && p.y <= std::max(a.y, b.y);
}

} // anonymous namespace

ZoneBoundaryIndex::ZoneBoundaryIndex(std::vector<ZonePolygon> polygons, std::string version)
    : m_polygons{std::move(polygons)}
    , m_version{std::move(version)}
{
    for (auto& polygon : m_polygons)
    {
        BoundingBox bounds{
            .min_lat = std::numeric_limits<f64>::max(),
            .max_lat = std::numeric_limits<f64>::lowest(),
            .min_lon = std::numeric_limits<f64>::max(),
            .max_lon = std::numeric_limits<f64>::lowest(),
        };
        if (!polygon.rings.empty())
        {
            for (const Vec2d& v : polygon.rings.front())
            {
                bounds.expand(v.y, v.x);
            }
        }
        polygon.bounds = bounds;
    }

    build_grid();

    MRD_CORE_INFO("ZoneBoundaryIndex: {} polygons in {} grid cells (dataset {})",
                  m_polygons.size(), m_grid.size(), m_version);
}

// -----------------------------------------------------------------
// Lookup: grid cell → candidates in dataset order → first containing polygon
// -----------------------------------------------------------------

const ZonePolygon* ZoneBoundaryIndex::lookup(const Coordinate& coordinate) const
{
    const auto [lat_cell, lon_cell] = cell_for(coordinate.latitude(), coordinate.longitude());
    const auto it = m_grid.find(cell_key(lat_cell, lon_cell));
    if (it == m_grid.end())
    {
        return nullptr;
    }

    const Vec2d point{coordinate.longitude(), coordinate.latitude()};
    for (const std::size_t index : it->second)
    {
        const ZonePolygon& polygon = m_polygons[index];
        if (polygon.bounds.contains(coordinate) && polygon_contains(polygon, point))
        {
            return &polygon;
        }
    }
    return nullptr;
}

std::pair<i32, i32> ZoneBoundaryIndex::cell_for(f64 lat, f64 lon)
{
    // lat = +90 and lon = +180 fold into the last cell
    const i32 lat_cell = std::clamp(
        static_cast<i32>(std::floor((lat + 90.0) / kGridResolutionDeg)), 0, kLatCells - 1);
    const i32 lon_cell = std::clamp(
        static_cast<i32>(std::floor((lon + 180.0) / kGridResolutionDeg)), 0, kLonCells - 1);
    return {lat_cell, lon_cell};
}

void ZoneBoundaryIndex::build_grid()
{
    m_grid.clear();

    // Indices are appended in ascending order, so every cell list stays in dataset order
    for (std::size_t index = 0; index < m_polygons.size(); ++index)
    {
        const BoundingBox& b = m_polygons[index].bounds;
        if (m_polygons[index].rings.empty())
        {
            continue;
        }

        const auto [lat_lo, lon_lo] = cell_for(b.min_lat, b.min_lon);
        const auto [lat_hi, lon_hi] = cell_for(b.max_lat, b.max_lon);

        for (i32 lat_cell = lat_lo; lat_cell <= lat_hi; ++lat_cell)
        {
            for (i32 lon_cell = lon_lo; lon_cell <= lon_hi; ++lon_cell)
            {
                m_grid[cell_key(lat_cell, lon_cell)].push_back(index);
            }
        }
    }
}

// -----------------------------------------------------------------
// Point in ring (even-odd rule), edges reported separately
// -----------------------------------------------------------------

RingSide classify_point(const std::vector<Vec2d>& ring, Vec2d point)
{
    const std::size_t n = ring.size();
    if (n < 3)
    {
        return RingSide::Outside;
    }

    bool inside = false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++)
    {
        const Vec2d a = ring[j];
        const Vec2d b = ring[i];

        if (on_segment(a, b, point))
        {
            return RingSide::OnEdge;
        }

        if ((b.y > point.y) != (a.y > point.y))
        {
            const f64 x_cross = (a.x - b.x) * (point.y - b.y) / (a.y - b.y) + b.x;
            if (point.x < x_cross)
            {
                inside = !inside;
            }
        }
    }

    return inside ? RingSide::Inside : RingSide::Outside;
}

bool polygon_contains(const ZonePolygon& polygon, Vec2d point)
{
    if (polygon.rings.empty() || classify_point(polygon.rings.front(), point) == RingSide::Outside)
    {
        return false;
    }

    // A point on a hole's edge still belongs to the polygon
    for (std::size_t r = 1; r < polygon.rings.size(); ++r)
    {
        if (classify_point(polygon.rings[r], point) == RingSide::Inside)
        {
            return false;
        }
    }
    return true;
}

} // namespace meridian::geo
