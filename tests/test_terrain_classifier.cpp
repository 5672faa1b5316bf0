/**
 * @file test_terrain_classifier.cpp
 * @brief Unit tests for position metrics and the ordered terrain rules
 */

#include "hierophant/seeded_random.hpp"
#include "hierophant/terrain_classifier.hpp"

#include <gtest/gtest.h>

using namespace hierophant;

static PositionMetrics metrics(double center, double edge) {
    PositionMetrics m;
    m.normalizedCenterDist = center;
    m.normalizedEdgeDist = edge;
    return m;
}

// ============================================================================
// Position metrics
// ============================================================================

TEST(PositionMetricsTest, MapCenter) {
    PositionMetrics m = measurePosition({600, 400}, 1200, 800);
    EXPECT_DOUBLE_EQ(m.normalizedCenterDist, 0.0);
    EXPECT_DOUBLE_EQ(m.normalizedEdgeDist, 0.5);
}

TEST(PositionMetricsTest, Corner) {
    PositionMetrics m = measurePosition({0, 0}, 1200, 800);
    EXPECT_DOUBLE_EQ(m.normalizedCenterDist, 1.0);
    EXPECT_DOUBLE_EQ(m.normalizedEdgeDist, 0.0);
}

TEST(PositionMetricsTest, EdgeDistanceUsesShorterSide) {
    // 80 from the top edge, map min side 800
    PositionMetrics m = measurePosition({600, 80}, 1200, 800);
    EXPECT_DOUBLE_EQ(m.normalizedEdgeDist, 0.1);
}

// ============================================================================
// Rule chain
// ============================================================================

TEST(TerrainClassifierTest, MountainsBeforeEverythingElse) {
    // Rule 1 fires regardless of center distance
    EXPECT_EQ(classifyTerrain(metrics(0.1, 0.1), 0.5), Terrain::Mountains);
    EXPECT_EQ(classifyTerrain(metrics(0.65, 0.1), 0.5), Terrain::Mountains);
    EXPECT_EQ(classifyTerrain(metrics(0.95, 0.1), 0.5), Terrain::Mountains);
}

TEST(TerrainClassifierTest, Coastal) {
    EXPECT_EQ(classifyTerrain(metrics(0.5, 0.18), 0.65), Terrain::Coastal);
    // Edge band below 0.15 with r too high for mountains
    EXPECT_EQ(classifyTerrain(metrics(0.5, 0.1), 0.65), Terrain::Coastal);
}

TEST(TerrainClassifierTest, CoastalNeedsCenterBelowThreshold) {
    // Falls through every rule to the default
    EXPECT_EQ(classifyTerrain(metrics(0.8, 0.18), 0.65), Terrain::Plains);
}

TEST(TerrainClassifierTest, Hills) {
    EXPECT_EQ(classifyTerrain(metrics(0.5, 0.25), 0.4), Terrain::Hills);
    EXPECT_EQ(classifyTerrain(metrics(0.9, 0.25), 0.1), Terrain::Hills);
}

TEST(TerrainClassifierTest, CentralPlains) {
    EXPECT_EQ(classifyTerrain(metrics(0.3, 0.4), 0.55), Terrain::Plains);
    // Plains rule precedes forest even for low draws
    EXPECT_EQ(classifyTerrain(metrics(0.3, 0.4), 0.1), Terrain::Plains);
}

TEST(TerrainClassifierTest, Forest) {
    EXPECT_EQ(classifyTerrain(metrics(0.55, 0.4), 0.2), Terrain::Forest);
    // Forest precedes desert
    EXPECT_EQ(classifyTerrain(metrics(0.7, 0.4), 0.2), Terrain::Forest);
}

TEST(TerrainClassifierTest, Desert) {
    EXPECT_EQ(classifyTerrain(metrics(0.7, 0.4), 0.27), Terrain::Desert);
}

TEST(TerrainClassifierTest, DefaultPlains) {
    EXPECT_EQ(classifyTerrain(metrics(0.55, 0.4), 0.9), Terrain::Plains);
    EXPECT_EQ(classifyTerrain(metrics(0.7, 0.4), 0.35), Terrain::Plains);
}

TEST(TerrainClassifierTest, RuleTableOrder) {
    const auto& rules = terrainRules();
    EXPECT_EQ(rules[0].terrain, Terrain::Mountains);
    EXPECT_EQ(rules[1].terrain, Terrain::Coastal);
    EXPECT_EQ(rules[2].terrain, Terrain::Hills);
    EXPECT_EQ(rules[3].terrain, Terrain::Plains);
    EXPECT_EQ(rules[4].terrain, Terrain::Forest);
    EXPECT_EQ(rules[5].terrain, Terrain::Desert);
}

TEST(TerrainClassifierTest, SeededClassificationUsesFirstDraw) {
    const glm::dvec2 p(100, 300);
    const PositionMetrics m = measurePosition(p, 1200, 800);
    for (int64_t seed = 0; seed < 50; ++seed) {
        SeededRandom rng(seed);
        EXPECT_EQ(classifyTerrain(p, 1200, 800, seed), classifyTerrain(m, rng.next()));
    }
}

TEST(TerrainClassifierTest, TerrainNamesRoundTrip) {
    for (Terrain t : kAllTerrains) {
        auto parsed = parseTerrain(terrainName(t));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, t);
    }
    EXPECT_FALSE(parseTerrain("swamp").has_value());
    EXPECT_EQ(terrainName(Terrain::Coastal), "coastal");
}
