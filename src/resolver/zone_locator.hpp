#pragma once

/// @file zone_locator.hpp
/// @brief Coordinate to base zone: boundary index, then nearest-settlement fallback.

#include "geo/settlement_index.hpp"
#include "geo/zone_boundary_index.hpp"
#include "resolver/lookup_cache.hpp"

#include <memory>
#include <optional>
#include <string>

namespace meridian::resolver
{
    enum class ZoneSource : u8
    {
        Boundary,
        Fallback,
    };

    /// @brief Base zone of a coordinate and how it was found.
    struct ZoneLookup
    {
        std::string zone_id;
        ZoneSource source = ZoneSource::Boundary;
        std::string settlement;     ///< Fallback only
        f64 distance_km = 0.0;      ///< Fallback only

        bool operator==(const ZoneLookup&) const = default;
    };

    /// @brief Cache-assisted zone lookup shared by all requests.
    ///
    /// Lookups always run on the coordinate rounded to the cache key precision,
    /// so results are identical with the cache on or off.
    class ZoneLocator
    {
    public:
        /// @param boundaries Boundary index (must outlive the locator).
        /// @param settlements Fallback index (must outlive the locator).
        /// @param cache_capacity Entry budget; 0 disables the cache.
        ZoneLocator(const geo::ZoneBoundaryIndex& boundaries,
                    const geo::SettlementIndex& settlements,
                    std::size_t cache_capacity);

        /// @param use_boundary_index False skips the polygons and answers from the
        ///        settlement index alone; such lookups bypass the cache.
        /// @return The zone lookup, or std::nullopt if neither index knows the point.
        [[nodiscard]] std::optional<ZoneLookup> locate(const geo::Coordinate& coordinate,
                                                       bool use_boundary_index = true);

        [[nodiscard]] bool cache_enabled() const { return m_cache != nullptr; }
        [[nodiscard]] CacheStats cache_stats() const;

    private:
        [[nodiscard]] std::optional<ZoneLookup> compute(const geo::Coordinate& rounded) const;
        [[nodiscard]] std::optional<ZoneLookup> nearest_settlement(const geo::Coordinate& rounded) const;

        const geo::ZoneBoundaryIndex& m_boundaries;
        const geo::SettlementIndex& m_settlements;
        std::unique_ptr<LookupCache<std::optional<ZoneLookup>>> m_cache;
    };

} // namespace meridian::resolver
