/// @file src/cascade/proximity_graph.cpp
/// @brief Implementation of ProximityGraph.

#include "bridget/cascade.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace bridget::cascade {

// ─── haversine_km ─────────────────────────────────────────────────────────────

double ProximityGraph::haversine_km(double lat1, double lon1,
                                    double lat2, double lon2) noexcept {
    constexpr double DEG = std::numbers::pi / 180.0;

    const double phi1 = lat1 * DEG;
    const double phi2 = lat2 * DEG;
    const double dphi = (lat2 - lat1) * DEG;
    const double dlam = (lon2 - lon1) * DEG;

    // a = sin²(Δφ/2) + cos φ₁ cos φ₂ sin²(Δλ/2);  d = 2R·atan2(√a, √(1−a))
    const double s1 = std::sin(dphi / 2.0);
    const double s2 = std::sin(dlam / 2.0);
    const double a  = std::clamp(s1 * s1 + std::cos(phi1) * std::cos(phi2) * s2 * s2, 0.0, 1.0);
    return 2.0 * constants::EARTH_RADIUS_KM * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
}

// ─── Construction ─────────────────────────────────────────────────────────────

ProximityGraph::ProximityGraph(std::span<const EntityLocation> locations,
                               double max_distance_km)
    : max_distance_km_(std::isfinite(max_distance_km) ? std::max(0.0, max_distance_km) : 0.0) {
    // First occurrence of each id wins.
    std::unordered_map<EntityId, EntityLocation> unique;
    for (const auto& loc : locations) {
        if (!std::isfinite(loc.latitude) || !std::isfinite(loc.longitude)) continue;
        unique.try_emplace(loc.entity_id, loc);
    }

    ids_.reserve(unique.size());
    for (const auto& [id, _] : unique) ids_.push_back(id);
    std::sort(ids_.begin(), ids_.end());

    const auto n = static_cast<Eigen::Index>(ids_.size());
    distances_ = Matrix::Zero(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& a = unique.at(ids_[static_cast<std::size_t>(i)]);
        index_.emplace(a.entity_id, i);
        for (Eigen::Index j = i + 1; j < n; ++j) {
            const auto& b = unique.at(ids_[static_cast<std::size_t>(j)]);
            const double d = haversine_km(a.latitude, a.longitude, b.latitude, b.longitude);
            distances_(i, j) = d;
            distances_(j, i) = d;
        }
    }
}

// ─── Queries ──────────────────────────────────────────────────────────────────

bool ProximityGraph::contains(EntityId id) const noexcept {
    return index_.find(id) != index_.end();
}

std::optional<double> ProximityGraph::distance_km(EntityId a, EntityId b) const noexcept {
    const auto ia = index_.find(a);
    const auto ib = index_.find(b);
    if (ia == index_.end() || ib == index_.end()) return std::nullopt;
    return distances_(ia->second, ib->second);
}

bool ProximityGraph::adjacent(EntityId a, EntityId b) const noexcept {
    if (a == b) return false;
    const auto d = distance_km(a, b);
    return d && *d <= max_distance_km_;
}

std::vector<EntityId> ProximityGraph::neighbors(EntityId id) const {
    std::vector<EntityId> out;
    const auto it = index_.find(id);
    if (it == index_.end()) return out;

    const Eigen::Index row = it->second;
    for (Eigen::Index j = 0; j < distances_.cols(); ++j) {
        if (j != row && distances_(row, j) <= max_distance_km_) {
            out.push_back(ids_[static_cast<std::size_t>(j)]);
        }
    }
    return out;
}

std::size_t ProximityGraph::edge_count() const noexcept {
    std::size_t edges = 0;
    for (Eigen::Index i = 0; i < distances_.rows(); ++i) {
        for (Eigen::Index j = i + 1; j < distances_.cols(); ++j) {
            if (distances_(i, j) <= max_distance_km_) ++edges;
        }
    }
    return edges;
}

}  // namespace bridget::cascade
