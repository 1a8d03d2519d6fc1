/// @file runtime.cpp
/// @brief Implementation of startup composition and the health summary.

#include "resolver/runtime.hpp"

#include "core/logger.hpp"
#include "geo/boundary_loader.hpp"
#include "geo/settlement_loader.hpp"
#include "history/patch_loader.hpp"

#include <absl/status/status.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <set>

namespace meridian::resolver
{

absl::StatusOr<std::unique_ptr<Runtime>> Runtime::create(const ResolverConfig& config)
{
    MRD_CORE_INFO("Runtime: starting (boundaries={}, settlements={}, patches={})",
                  config.boundary_file.string(), config.settlement_file.string(),
                  config.patch_file.string());

    // ---- tz database ----
    std::string tzdb_version = config.tzdb_version;
    if (tzdb_version.empty())
    {
        tzdb_version = time::ZoneDatabase::detect_version();
    }
    time::ZoneDatabase zones(tzdb_version);

    // ---- Boundary polygons ----
    auto polygons = geo::BoundaryLoader::load_csv(config.boundary_file);
    if (!polygons)
    {
        return absl::FailedPreconditionError(fmt::format(
            "boundary dataset unavailable or malformed: {}", config.boundary_file.string()));
    }

    // ---- Settlements ----
    auto settlements = geo::SettlementLoader::load_csv(config.settlement_file);
    if (!settlements)
    {
        return absl::FailedPreconditionError(fmt::format(
            "settlement dataset unavailable or malformed: {}", config.settlement_file.string()));
    }

    // ---- Every zone named by a dataset must exist ----
    std::set<std::string> zone_ids;
    for (const auto& polygon : *polygons)
    {
        zone_ids.insert(polygon.zone_id);
    }
    for (const auto& settlement : *settlements)
    {
        zone_ids.insert(settlement.zone_id);
    }

    const auto missing = zones.preload({zone_ids.begin(), zone_ids.end()});
    if (!missing.empty())
    {
        MRD_CORE_ERROR("Runtime: unknown zone ids in datasets: {}", fmt::join(missing, ", "));
        return absl::FailedPreconditionError(fmt::format(
            "datasets reference zones missing from the tz database: {}", fmt::join(missing, ", ")));
    }

    // ---- Historical patches ----
    auto patches = history::PatchLoader::load_csv(config.patch_file, zones);
    if (!patches)
    {
        return absl::FailedPreconditionError(fmt::format(
            "patch dataset unavailable or malformed: {}", config.patch_file.string()));
    }

    geo::ZoneBoundaryIndex boundary_index(std::move(*polygons), config.boundary_version);
    geo::SettlementIndex settlement_index(std::move(*settlements), config.settlement_version);

    auto runtime = std::make_unique<Runtime>(Passkey{}, std::move(zones), std::move(*patches),
                                             std::move(boundary_index), std::move(settlement_index),
                                             config);

    MRD_CORE_INFO("Runtime: ready (tzdb {}, {})", runtime->m_zones.version(), runtime->m_patches.version());

    return runtime;
}

Runtime::Runtime(Passkey,
                 time::ZoneDatabase zones,
                 history::PatchRegistry patches,
                 geo::ZoneBoundaryIndex boundaries,
                 geo::SettlementIndex settlements,
                 const ResolverConfig& config)
    : m_zones{std::move(zones)}
    , m_patches{std::move(patches)}
    , m_boundaries{std::move(boundaries)}
    , m_settlements{std::move(settlements)}
    , m_locator{m_boundaries, m_settlements, config.cache_enabled ? config.cache_capacity : 0}
    , m_resolver{m_zones, m_patches, m_locator,
                 ParitySelector{config.fold_policies},
                 ResultAssembler{DatasetVersions{
                                     .tzdb       = m_zones.version(),
                                     .boundary   = m_boundaries.version(),
                                     .settlement = m_settlements.version(),
                                     .patch      = m_patches.version(),
                                 },
                                 config.fallback_max_km}}
{
}

HealthReport Runtime::health() const
{
    return HealthReport{
        .versions         = m_resolver.assembler().versions(),
        .patch_count      = m_patches.size(),
        .polygon_count    = m_boundaries.size(),
        .settlement_count = m_settlements.size(),
        .zone_count       = m_zones.preloaded_count(),
        .cache_enabled    = m_locator.cache_enabled(),
        .cache            = m_locator.cache_stats(),
    };
}

std::string format_health(const HealthReport& report)
{
    return fmt::format(
        "status: ok\n"
        "tzdb_version: {}\n"
        "patch_version: {}\n"
        "boundary_version: {}\n"
        "settlement_version: {}\n"
        "patches: {}\n"
        "polygons: {}\n"
        "settlements: {}\n"
        "zones: {}\n"
        "cache: {} (size {}/{}, hits {}, misses {}, evictions {}, hit rate {:.3f})\n",
        report.versions.tzdb, report.versions.patch, report.versions.boundary,
        report.versions.settlement, report.patch_count, report.polygon_count,
        report.settlement_count, report.zone_count,
        report.cache_enabled ? "enabled" : "disabled", report.cache.size, report.cache.capacity,
        report.cache.hits, report.cache.misses, report.cache.evictions, report.cache.hit_rate());
}

} // namespace meridian::resolver
