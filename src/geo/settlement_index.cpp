/// @file settlement_index.cpp
/// @brief k-d tree construction and nearest-neighbour search.

#include "geo/settlement_index.hpp"

#include "core/logger.hpp"

#include <glm/geometric.hpp>

#include <algorithm>
#include <limits>
#include <numeric>

namespace meridian::geo
{

SettlementIndex::SettlementIndex(std::vector<Settlement> settlements, std::string version)
    : m_settlements{std::move(settlements)}
    , m_version{std::move(version)}
{
    m_points.reserve(m_settlements.size());
    for (const auto& s : m_settlements)
    {
        m_points.push_back(s.location.unit_vector());
    }

    std::vector<u32> order(m_settlements.size());
    std::iota(order.begin(), order.end(), 0U);

    m_nodes.reserve(m_settlements.size());
    m_root = build(order, 0, order.size(), 0);

    MRD_CORE_INFO("SettlementIndex: {} settlements indexed (dataset {})",
                  m_settlements.size(), m_version);
}

// -----------------------------------------------------------------
// Median-split construction
// -----------------------------------------------------------------

i32 SettlementIndex::build(std::vector<u32>& order, std::size_t begin, std::size_t end, u32 depth)
{
    if (begin >= end)
    {
        return -1;
    }

    const u8 axis = static_cast<u8>(depth % 3);
    const std::size_t mid = begin + (end - begin) / 2;

    // Ties on the split axis are ordered by catalog index so the tree shape is deterministic
    std::nth_element(order.begin() + static_cast<std::ptrdiff_t>(begin),
                     order.begin() + static_cast<std::ptrdiff_t>(mid),
                     order.begin() + static_cast<std::ptrdiff_t>(end),
                     [this, axis](u32 a, u32 b) {
                         const f64 va = m_points[a][axis];
                         const f64 vb = m_points[b][axis];
                         return va < vb || (va == vb && a < b);
                     });

    const i32 node_index = static_cast<i32>(m_nodes.size());
    m_nodes.push_back(Node{.settlement = order[mid], .axis = axis});

    const i32 left = build(order, begin, mid, depth + 1);
    const i32 right = build(order, mid + 1, end, depth + 1);
    m_nodes[static_cast<std::size_t>(node_index)].left = left;
    m_nodes[static_cast<std::size_t>(node_index)].right = right;

    return node_index;
}

// -----------------------------------------------------------------
// Nearest-neighbour query
// -----------------------------------------------------------------

std::optional<NearestSettlement> SettlementIndex::nearest(const Coordinate& coordinate) const
{
    if (m_root < 0)
    {
        return std::nullopt;
    }

    const Vec3d target = coordinate.unit_vector();
    u32 best = std::numeric_limits<u32>::max();
    f64 best_dist2 = std::numeric_limits<f64>::max();
    search(m_root, target, best, best_dist2);

    const Settlement& settlement = m_settlements[best];
    return NearestSettlement{
        .settlement  = &settlement,
        .distance_km = great_circle_km(coordinate, settlement.location),
    };
}

void SettlementIndex::search(i32 node_index, const Vec3d& target, u32& best, f64& best_dist2) const
{
    if (node_index < 0)
    {
        return;
    }

    const Node& node = m_nodes[static_cast<std::size_t>(node_index)];
    const Vec3d& point = m_points[node.settlement];

    const Vec3d delta = point - target;
    const f64 dist2 = glm::dot(delta, delta);
    if (dist2 < best_dist2 || (dist2 == best_dist2 && node.settlement < best))
    {
        best_dist2 = dist2;
        best = node.settlement;
    }

    const f64 diff = target[node.axis] - point[node.axis];
    const i32 near_side = diff < 0.0 ? node.left : node.right;
    const i32 far_side = diff < 0.0 ? node.right : node.left;

    search(near_side, target, best, best_dist2);

    // '<=' keeps equidistant candidates on the far side reachable for the tie-break
    if (diff * diff <= best_dist2)
    {
        search(far_side, target, best, best_dist2);
    }
}

} // namespace meridian::geo
