/**
 * @file test_point_sampler.cpp
 * @brief Unit tests for initial point placement and Lloyd relaxation
 */

#include "hierophant/errors.hpp"
#include "hierophant/point_sampler.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <limits>

using namespace hierophant;

/// Partitioner that never produces a cell
class NoCellPartitioner : public RegionPartitioner {
public:
    [[nodiscard]] CellList partition(const std::vector<glm::dvec2>& points,
                                     const Bounds&) const override {
        return CellList(points.size());
    }
};

static double minPairDistance(const std::vector<glm::dvec2>& pts) {
    double best = std::numeric_limits<double>::max();
    for (size_t i = 0; i < pts.size(); ++i) {
        for (size_t j = i + 1; j < pts.size(); ++j) {
            best = std::min(best, glm::length(pts[i] - pts[j]));
        }
    }
    return best;
}

class PointSamplerTest : public ::testing::Test {
protected:
    HalfPlanePartitioner partitioner;
};

TEST_F(PointSamplerTest, UnrelaxedPointsFollowRandomStream) {
    SamplerSettings settings;
    settings.relaxationIterations = 0;
    auto pts = samplePoints(2, 1000.0, 500.0, 1, partitioner, settings);
    ASSERT_EQ(pts.size(), 2u);
    EXPECT_DOUBLE_EQ(pts[0].x, 0.2511917009602195 * 1000.0);
    EXPECT_DOUBLE_EQ(pts[0].y, 0.5453317901234568 * 500.0);
    EXPECT_DOUBLE_EQ(pts[1].x, 0.34230109739368997 * 1000.0);
    EXPECT_DOUBLE_EQ(pts[1].y, 0.9538280178326475 * 500.0);
}

TEST_F(PointSamplerTest, Deterministic) {
    auto a = samplePoints(30, 1200, 800, 42, partitioner);
    auto b = samplePoints(30, 1200, 800, 42, partitioner);
    EXPECT_EQ(a, b);
}

TEST_F(PointSamplerTest, RelaxedPointsStayInBounds) {
    auto pts = samplePoints(50, 1200, 800, 9, partitioner);
    ASSERT_EQ(pts.size(), 50u);
    for (const auto& p : pts) {
        EXPECT_GE(p.x, 0.0);
        EXPECT_LE(p.x, 1200.0);
        EXPECT_GE(p.y, 0.0);
        EXPECT_LE(p.y, 800.0);
    }
}

TEST_F(PointSamplerTest, RelaxationSpreadsPoints) {
    SamplerSettings raw;
    raw.relaxationIterations = 0;
    auto before = samplePoints(50, 1000, 1000, 3, partitioner, raw);
    auto after = samplePoints(50, 1000, 1000, 3, partitioner);
    EXPECT_GT(minPairDistance(after), minPairDistance(before));
}

TEST_F(PointSamplerTest, PointsWithoutCellsAreKept) {
    NoCellPartitioner none;
    SamplerSettings raw;
    raw.relaxationIterations = 0;
    auto unrelaxed = samplePoints(10, 100, 100, 8, none, raw);
    auto relaxed = samplePoints(10, 100, 100, 8, none);
    EXPECT_EQ(unrelaxed, relaxed);
}

TEST_F(PointSamplerTest, RelaxStepMovesToVertexMean) {
    Bounds b = Bounds::fromSize(100, 100);
    auto moved = relaxPoints({{10, 10}}, b, partitioner);
    ASSERT_EQ(moved.size(), 1u);
    EXPECT_DOUBLE_EQ(moved[0].x, 50.0);
    EXPECT_DOUBLE_EQ(moved[0].y, 50.0);
}

TEST_F(PointSamplerTest, MarginPadsInitialDraw) {
    SamplerSettings settings;
    settings.relaxationIterations = 0;
    settings.edgeMargin = 100.0;
    auto pts = samplePoints(40, 1000, 600, 21, partitioner, settings);
    for (const auto& p : pts) {
        EXPECT_GE(p.x, 100.0);
        EXPECT_LT(p.x, 900.0);
        EXPECT_GE(p.y, 100.0);
        EXPECT_LT(p.y, 500.0);
    }
}

TEST_F(PointSamplerTest, InvalidArgumentsThrow) {
    EXPECT_THROW((void)samplePoints(0, 100, 100, 1, partitioner), ConfigError);
    EXPECT_THROW((void)samplePoints(5, 0, 100, 1, partitioner), ConfigError);
    EXPECT_THROW((void)samplePoints(5, 100, -1, 1, partitioner), ConfigError);

    SamplerSettings negative;
    negative.relaxationIterations = -1;
    EXPECT_THROW((void)samplePoints(5, 100, 100, 1, partitioner, negative), ConfigError);

    SamplerSettings wide;
    wide.edgeMargin = 50.0;
    EXPECT_THROW((void)samplePoints(5, 100, 200, 1, partitioner, wide), ConfigError);
}

TEST_F(PointSamplerTest, ValidateSettings) {
    SamplerSettings ok;
    ok.edgeMargin = 10.0;
    EXPECT_NO_THROW(validateSamplerSettings(ok, 100.0, 50.0));

    SamplerSettings tooWide;
    tooWide.edgeMargin = 25.0;
    EXPECT_THROW(validateSamplerSettings(tooWide, 100.0, 50.0), ConfigError);

    SamplerSettings negative;
    negative.relaxationIterations = -2;
    EXPECT_THROW(validateSamplerSettings(negative, 100.0, 50.0), ConfigError);
}
