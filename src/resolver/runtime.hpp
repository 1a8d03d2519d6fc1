#pragma once

/// @file runtime.hpp
/// @brief Startup composition: datasets, indexes, cache and resolver.

#include "geo/settlement_index.hpp"
#include "geo/zone_boundary_index.hpp"
#include "history/patch_registry.hpp"
#include "resolver/config.hpp"
#include "resolver/lookup_cache.hpp"
#include "resolver/time_resolver.hpp"
#include "resolver/zone_locator.hpp"
#include "time/zone_database.hpp"

#include <absl/status/statusor.h>

#include <memory>
#include <string>

namespace meridian::resolver
{
    /// @brief Snapshot of dataset versions, sizes and cache counters.
    struct HealthReport
    {
        DatasetVersions versions;
        std::size_t patch_count = 0;
        std::size_t polygon_count = 0;
        std::size_t settlement_count = 0;
        std::size_t zone_count = 0;
        bool cache_enabled = false;
        CacheStats cache;
    };

    /// @brief Owns every long-lived component. Fully built or not at all.
    class Runtime
    {
        // Restricts construction to create()
        struct Passkey
        {
            explicit Passkey() = default;
        };

    public:
        /// @brief Load all datasets and wire the pipeline.
        /// @return The runtime, or FailedPrecondition when a dataset is missing or malformed.
        [[nodiscard]] static absl::StatusOr<std::unique_ptr<Runtime>> create(const ResolverConfig& config);

        Runtime(Passkey,
                time::ZoneDatabase zones,
                history::PatchRegistry patches,
                geo::ZoneBoundaryIndex boundaries,
                geo::SettlementIndex settlements,
                const ResolverConfig& config);

        Runtime(const Runtime&) = delete;
        Runtime& operator=(const Runtime&) = delete;

        [[nodiscard]] const TimeResolver& resolver() const { return m_resolver; }
        [[nodiscard]] HealthReport health() const;

    private:
        time::ZoneDatabase m_zones;
        history::PatchRegistry m_patches;
        geo::ZoneBoundaryIndex m_boundaries;
        geo::SettlementIndex m_settlements;
        ZoneLocator m_locator;
        TimeResolver m_resolver;
    };

    /// @brief Multi-line human-readable health report.
    [[nodiscard]] std::string format_health(const HealthReport& report);

} // namespace meridian::resolver
