/// @file patch_registry.cpp
/// @brief Implementation of patch priority ordering and matching.

#include "history/patch_registry.hpp"

#include "core/logger.hpp"

#include <algorithm>

namespace meridian::history
{

PatchRegistry::PatchRegistry(std::vector<Patch> patches, std::string version)
    : m_patches{std::move(patches)}
    , m_version{std::move(version)}
{
    std::stable_sort(m_patches.begin(), m_patches.end(), &PatchRegistry::higher_priority);

    MRD_CORE_INFO("PatchRegistry: {} patches (version {})", m_patches.size(), m_version);
    for (std::size_t i = 0; i < m_patches.size(); ++i)
    {
        MRD_CORE_DEBUG("PatchRegistry: priority {} -> {}", i, m_patches[i].id);
    }
}

bool PatchRegistry::higher_priority(const Patch& a, const Patch& b)
{
    // 1. Geographic specificity: boxes (smallest first), then named zones
    if (a.is_box() != b.is_box())
    {
        return a.is_box();
    }
    if (a.is_box())
    {
        const f64 area_a = std::get<BoxRegion>(a.region).box.area_deg2();
        const f64 area_b = std::get<BoxRegion>(b.region).box.area_deg2();
        if (area_a != area_b)
        {
            return area_a < area_b;
        }
    }

    // 2. Temporal specificity
    return a.interval_seconds() < b.interval_seconds();
}

const Patch* PatchRegistry::match(const geo::Coordinate& coordinate,
                                  const time::LocalDateTime& local,
                                  std::string_view base_zone_id,
                                  PatchSubset subset) const
{
    if (subset == PatchSubset::None)
    {
        return nullptr;
    }

    for (const Patch& patch : m_patches)
    {
        if (patch.allowed_by(subset) && patch.active_at(local) && patch.covers(coordinate, base_zone_id))
        {
            return &patch;
        }
    }
    return nullptr;
}

const Patch* PatchRegistry::find(std::string_view id) const
{
    const auto it = std::find_if(m_patches.begin(), m_patches.end(),
                                 [id](const Patch& patch) { return patch.id == id; });
    return it != m_patches.end() ? &*it : nullptr;
}

} // namespace meridian::history
