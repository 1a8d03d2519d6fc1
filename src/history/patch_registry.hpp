#pragma once

/// @file patch_registry.hpp
/// @brief Ordered, read-only set of historical patches.

#include "history/patch.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace meridian::history
{
    /// @brief Immutable registry of historical patches in priority order.
    ///
    /// Priority is fixed at construction:
    ///   1. box regions before named-zone regions, smaller box area first
    ///   2. narrower validity interval first
    ///   3. insertion order
    /// match() returns the first applicable patch; patches never stack.
    class PatchRegistry
    {
    public:
        /// @param patches Patches in file order. Ids are expected to be unique.
        /// @param version Dataset version ("patches-xxxxxxxx").
        PatchRegistry(std::vector<Patch> patches, std::string version);

        /// @brief First patch in priority order that applies to the request.
        /// @param coordinate Query coordinate.
        /// @param local Local civil time of the request.
        /// @param base_zone_id Zone found by the boundary/fallback indexes.
        /// @param subset Which patches the caller's profile may consult.
        /// @return The matching patch, or nullptr.
        [[nodiscard]] const Patch* match(const geo::Coordinate& coordinate,
                                         const time::LocalDateTime& local,
                                         std::string_view base_zone_id,
                                         PatchSubset subset) const;

        [[nodiscard]] const Patch* find(std::string_view id) const;

        /// @brief Patches in priority order.
        [[nodiscard]] const std::vector<Patch>& ordered() const { return m_patches; }
        [[nodiscard]] std::size_t size() const { return m_patches.size(); }
        [[nodiscard]] const std::string& version() const { return m_version; }

        /// @brief Strict priority comparison (insertion order is kept by a stable sort).
        [[nodiscard]] static bool higher_priority(const Patch& a, const Patch& b);

    private:
        std::vector<Patch> m_patches;
        std::string m_version;
    };

} // namespace meridian::history
