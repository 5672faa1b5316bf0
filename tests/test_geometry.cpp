/**
 * @file test_geometry.cpp
 * @brief Unit tests for polygon area, centroid and bounds
 */

#include "hierophant/errors.hpp"
#include "hierophant/geometry.hpp"

#include <gtest/gtest.h>

using namespace hierophant;

// ============================================================================
// Area
// ============================================================================

TEST(GeometryTest, SquareAreaExact) {
    Polygon square = {{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    EXPECT_EQ(polygonArea(square), 100.0);
}

TEST(GeometryTest, WindingAffectsSignOnly) {
    Polygon ccw = {{0, 0}, {10, 0}, {10, 10}, {0, 10}};
    Polygon cw = {{0, 10}, {10, 10}, {10, 0}, {0, 0}};
    EXPECT_GT(signedArea(ccw), 0.0);
    EXPECT_LT(signedArea(cw), 0.0);
    EXPECT_EQ(polygonArea(ccw), polygonArea(cw));
}

TEST(GeometryTest, TriangleArea) {
    Polygon tri = {{0, 0}, {4, 0}, {0, 3}};
    EXPECT_DOUBLE_EQ(polygonArea(tri), 6.0);
}

TEST(GeometryTest, ConcavePolygonArea) {
    // L-shape: 2x2 square minus a 1x1 corner
    Polygon l = {{0, 0}, {2, 0}, {2, 1}, {1, 1}, {1, 2}, {0, 2}};
    EXPECT_DOUBLE_EQ(polygonArea(l), 3.0);
}

TEST(GeometryTest, TooFewVerticesThrows) {
    EXPECT_THROW((void)polygonArea({}), GeometryError);
    EXPECT_THROW((void)polygonArea({{0, 0}, {1, 1}}), GeometryError);
}

// ============================================================================
// Centroid
// ============================================================================

TEST(GeometryTest, VertexCentroidIsMean) {
    Polygon p = {{0, 0}, {4, 0}, {4, 2}, {0, 2}};
    glm::dvec2 c = vertexCentroid(p);
    EXPECT_DOUBLE_EQ(c.x, 2.0);
    EXPECT_DOUBLE_EQ(c.y, 1.0);
}

TEST(GeometryTest, VertexCentroidEmpty) {
    glm::dvec2 c = vertexCentroid({});
    EXPECT_EQ(c.x, 0.0);
    EXPECT_EQ(c.y, 0.0);
}

// ============================================================================
// Bounds and stats
// ============================================================================

TEST(GeometryTest, BoundsPolygonMatchesArea) {
    Bounds b = Bounds::fromSize(1200, 800);
    EXPECT_DOUBLE_EQ(b.area(), 960000.0);
    EXPECT_DOUBLE_EQ(signedArea(b.toPolygon()), 960000.0);
    EXPECT_TRUE(b.contains({0, 0}));
    EXPECT_TRUE(b.contains({1200, 800}));
    EXPECT_FALSE(b.contains({-1, 5}));
}

TEST(GeometryTest, SummarizeAreas) {
    AreaStats s = summarizeAreas({2.0, 8.0, 5.0});
    EXPECT_EQ(s.count, 3u);
    EXPECT_DOUBLE_EQ(s.total, 15.0);
    EXPECT_DOUBLE_EQ(s.mean, 5.0);
    EXPECT_DOUBLE_EQ(s.min, 2.0);
    EXPECT_DOUBLE_EQ(s.max, 8.0);
}

TEST(GeometryTest, SummarizeNoAreas) {
    AreaStats s = summarizeAreas({});
    EXPECT_EQ(s.count, 0u);
    EXPECT_EQ(s.total, 0.0);
}
