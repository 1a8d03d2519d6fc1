/// @file zone_locator.cpp
/// @brief Implementation of the boundary/fallback zone lookup pipeline.

#include "resolver/zone_locator.hpp"

#include "core/logger.hpp"

namespace meridian::resolver
{

ZoneLocator::ZoneLocator(const geo::ZoneBoundaryIndex& boundaries,
                         const geo::SettlementIndex& settlements,
                         std::size_t cache_capacity)
    : m_boundaries{boundaries}
    , m_settlements{settlements}
{
    if (cache_capacity > 0)
    {
        m_cache = std::make_unique<LookupCache<std::optional<ZoneLookup>>>(cache_capacity);
    }

    MRD_CORE_INFO("ZoneLocator: lookup cache {} (capacity {})",
                  cache_capacity > 0 ? "enabled" : "disabled", cache_capacity);
}

std::optional<ZoneLookup> ZoneLocator::locate(const geo::Coordinate& coordinate, bool use_boundary_index)
{
    const CoordinateKey key = CoordinateKey::from(coordinate);
    if (!use_boundary_index)
    {
        return nearest_settlement(key.coordinate());
    }
    if (!m_cache)
    {
        return compute(key.coordinate());
    }
    return m_cache->get_or_compute(key, [this, &key] { return compute(key.coordinate()); });
}

std::optional<ZoneLookup> ZoneLocator::compute(const geo::Coordinate& rounded) const
{
    if (const geo::ZonePolygon* polygon = m_boundaries.lookup(rounded))
    {
        return ZoneLookup{
            .zone_id = polygon->zone_id,
            .source  = ZoneSource::Boundary,
        };
    }

    return nearest_settlement(rounded);
}

std::optional<ZoneLookup> ZoneLocator::nearest_settlement(const geo::Coordinate& rounded) const
{
    const auto nearest = m_settlements.nearest(rounded);
    if (!nearest)
    {
        return std::nullopt;
    }

    MRD_CORE_DEBUG("ZoneLocator: ({:.3f}, {:.3f}) resolved by nearest settlement {} at {:.1f} km",
                   rounded.latitude(), rounded.longitude(),
                   nearest->settlement->name, nearest->distance_km);

    return ZoneLookup{
        .zone_id     = nearest->settlement->zone_id,
        .source      = ZoneSource::Fallback,
        .settlement  = nearest->settlement->name,
        .distance_km = nearest->distance_km,
    };
}

CacheStats ZoneLocator::cache_stats() const
{
    return m_cache ? m_cache->stats() : CacheStats{};
}

} // namespace meridian::resolver
