#pragma once

/// @file settlement_index.hpp
/// @brief Nearest-settlement fallback for coordinates outside every zone polygon.

#include "core/types.hpp"
#include "geo/coordinate.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace meridian::geo
{
    /// @brief A named place with a known zone identity.
    struct Settlement
    {
        std::string name;
        Coordinate location;
        std::string zone_id;
    };

    /// @brief Result of a nearest-neighbour query.
    struct NearestSettlement
    {
        const Settlement* settlement;
        f64 distance_km;    ///< Great-circle distance from the query point
    };

    /// @brief Immutable k-d tree over settlement positions on the unit sphere.
    ///
    /// Points are indexed as 3-D unit vectors so that straight-line (chord)
    /// distance orders neighbours exactly like great-circle distance, with no
    /// seam at the antimeridian or the poles. The tree is balanced by median
    /// splits at build time; queries are O(log n) on average.
    /// Equidistant settlements resolve to the one listed first in the catalog.
    class SettlementIndex
    {
    public:
        /// @param settlements Catalog in canonical order.
        /// @param version Dataset version label reported in provenance.
        SettlementIndex(std::vector<Settlement> settlements, std::string version);

        /// @brief Nearest settlement to a coordinate.
        /// @return std::nullopt only when the catalog is empty.
        [[nodiscard]] std::optional<NearestSettlement> nearest(const Coordinate& coordinate) const;

        [[nodiscard]] std::size_t size() const { return m_settlements.size(); }
        [[nodiscard]] const std::string& version() const { return m_version; }
        [[nodiscard]] const std::vector<Settlement>& settlements() const { return m_settlements; }

    private:
        struct Node
        {
            u32 settlement;     ///< Index into m_settlements / m_points
            i32 left = -1;
            i32 right = -1;
            u8 axis = 0;
        };

        i32 build(std::vector<u32>& order, std::size_t begin, std::size_t end, u32 depth);
        void search(i32 node, const Vec3d& target, u32& best, f64& best_dist2) const;

        std::vector<Settlement> m_settlements;
        std::vector<Vec3d> m_points;
        std::vector<Node> m_nodes;
        i32 m_root = -1;
        std::string m_version;
    };

} // namespace meridian::geo
