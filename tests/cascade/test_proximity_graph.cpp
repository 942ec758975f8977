#include <gtest/gtest.h>
#include "bridget/cascade.hpp"
#include "bridget/constants.hpp"

#include <cmath>
#include <limits>
#include <numbers>
#include <vector>

using namespace bridget;
using namespace bridget::cascade;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// Degrees of latitude spanning `km` along a meridian.
static double lat_degrees(double km) {
    return km / (constants::EARTH_RADIUS_KM * std::numbers::pi / 180.0);
}

static constexpr double BASE_LAT = 47.65;
static constexpr double BASE_LON = -122.35;

// ─── haversine_km ─────────────────────────────────────────────────────────────

TEST(ProximityGraph_Haversine, ZeroDistance) {
    EXPECT_DOUBLE_EQ(ProximityGraph::haversine_km(BASE_LAT, BASE_LON, BASE_LAT, BASE_LON), 0.0);
}

TEST(ProximityGraph_Haversine, OneDegreeOfLatitude) {
    const double expected = constants::EARTH_RADIUS_KM * std::numbers::pi / 180.0;
    EXPECT_NEAR(ProximityGraph::haversine_km(10.0, 20.0, 11.0, 20.0), expected, 1e-9);
}

TEST(ProximityGraph_Haversine, Symmetric) {
    const double ab = ProximityGraph::haversine_km(47.6062, -122.3321, 45.5152, -122.6784);
    const double ba = ProximityGraph::haversine_km(45.5152, -122.6784, 47.6062, -122.3321);
    EXPECT_DOUBLE_EQ(ab, ba);
    EXPECT_NEAR(ab, 233.0, 3.0);  // Seattle → Portland
}

TEST(ProximityGraph_Haversine, Antipodal_HalfCircumference) {
    const double d = ProximityGraph::haversine_km(0.0, 0.0, 0.0, 180.0);
    EXPECT_NEAR(d, constants::EARTH_RADIUS_KM * std::numbers::pi, 1e-6);
}

// ─── Construction ─────────────────────────────────────────────────────────────

TEST(ProximityGraph_Build, EmptyLocations) {
    const std::vector<EntityLocation> none;
    const ProximityGraph g(none);
    EXPECT_TRUE(g.empty());
    EXPECT_EQ(g.edge_count(), 0u);
    EXPECT_FALSE(g.contains(1));
    EXPECT_TRUE(g.neighbors(1).empty());
}

TEST(ProximityGraph_Build, IdsSorted_FirstOccurrenceWins) {
    const std::vector<EntityLocation> locs = {
        {3, BASE_LAT, BASE_LON},
        {1, BASE_LAT + lat_degrees(2.0), BASE_LON},
        {3, BASE_LAT + 10.0, BASE_LON},  // duplicate, ignored
    };
    const ProximityGraph g(locs);
    ASSERT_EQ(g.size(), 2u);
    EXPECT_EQ(g.ids()[0], 1);
    EXPECT_EQ(g.ids()[1], 3);
    ASSERT_TRUE(g.distance_km(1, 3).has_value());
    EXPECT_NEAR(*g.distance_km(1, 3), 2.0, 1e-6);
}

TEST(ProximityGraph_Build, NonFiniteCoordinatesDropped) {
    const std::vector<EntityLocation> locs = {
        {1, BASE_LAT, BASE_LON},
        {2, std::numeric_limits<double>::quiet_NaN(), BASE_LON},
    };
    const ProximityGraph g(locs);
    EXPECT_EQ(g.size(), 1u);
    EXPECT_FALSE(g.contains(2));
}

TEST(ProximityGraph_Build, DistanceMatrixSymmetricWithZeroDiagonal) {
    const std::vector<EntityLocation> locs = {
        {1, BASE_LAT, BASE_LON},
        {2, BASE_LAT + lat_degrees(1.0), BASE_LON},
        {3, BASE_LAT + lat_degrees(7.0), BASE_LON},
    };
    const ProximityGraph g(locs);
    const auto& d = g.distances();
    ASSERT_EQ(d.rows(), 3);
    EXPECT_TRUE(d.isApprox(d.transpose()));
    for (Eigen::Index i = 0; i < 3; ++i) EXPECT_DOUBLE_EQ(d(i, i), 0.0);
}

// ─── Adjacency ────────────────────────────────────────────────────────────────

TEST(ProximityGraph_Adjacency, RadiusInclusive_SelfNeverAdjacent) {
    const std::vector<EntityLocation> locs = {
        {1, BASE_LAT, BASE_LON},
        {2, BASE_LAT + lat_degrees(2.0), BASE_LON},
        {3, BASE_LAT + lat_degrees(10.0), BASE_LON},
    };
    const ProximityGraph g(locs, 5.0);

    EXPECT_TRUE(g.adjacent(1, 2));
    EXPECT_TRUE(g.adjacent(2, 1));
    EXPECT_FALSE(g.adjacent(1, 3));
    EXPECT_FALSE(g.adjacent(1, 1));
    EXPECT_FALSE(g.adjacent(1, 99));
    EXPECT_FALSE(g.distance_km(1, 99).has_value());

    // 2 → 3 is 8 km, outside 5 km.
    EXPECT_EQ(g.neighbors(1), (std::vector<EntityId>{2}));
    EXPECT_EQ(g.neighbors(2), (std::vector<EntityId>{1}));
    EXPECT_TRUE(g.neighbors(3).empty());
    EXPECT_EQ(g.edge_count(), 1u);

    const ProximityGraph wide(locs, 10.5);
    EXPECT_EQ(wide.edge_count(), 3u);
    EXPECT_EQ(wide.neighbors(2), (std::vector<EntityId>{1, 3}));
}

TEST(ProximityGraph_Adjacency, NegativeRadius_TreatedAsZero) {
    const std::vector<EntityLocation> locs = {
        {1, BASE_LAT, BASE_LON},
        {2, BASE_LAT, BASE_LON},  // co-located
    };
    const ProximityGraph g(locs, -1.0);
    EXPECT_DOUBLE_EQ(g.max_distance_km(), 0.0);
    EXPECT_TRUE(g.adjacent(1, 2));
}
