/**
 * @file test_map_config.cpp
 * @brief Unit tests for loading map settings from config text
 */

#include "hierophant/errors.hpp"
#include "hierophant/map_config.hpp"

#include <gtest/gtest.h>

using namespace hierophant;

class MapConfigTest : public ::testing::Test {
protected:
    MapSettings load(std::string_view text) {
        return loadMapSettings(parser.parseString(text));
    }

    ConfigParser parser;
};

TEST_F(MapConfigTest, FullConfig) {
    MapSettings s = load(
        "width: 1600\n"
        "height: 900\n"
        "territory_count: 45\n"
        "seed: 1234\n"
        "relaxation_iterations: 5\n"
        "edge_margin: 20\n"
        "color_mode: palette\n"
        "degenerate_cells: fail\n"
        "name_attempts: 5000\n"
    );

    EXPECT_DOUBLE_EQ(s.config.width, 1600.0);
    EXPECT_DOUBLE_EQ(s.config.height, 900.0);
    EXPECT_EQ(s.config.territoryCount, 45);
    EXPECT_EQ(s.config.seed, 1234);
    EXPECT_EQ(s.generator.sampler.relaxationIterations, 5);
    EXPECT_DOUBLE_EQ(s.generator.sampler.edgeMargin, 20.0);
    EXPECT_EQ(s.generator.colorMode, ColorMode::Palette);
    EXPECT_EQ(s.generator.degenerateCells, DegenerateCellPolicy::Fail);
    EXPECT_EQ(s.generator.nameAttempts, 5000u);
}

TEST_F(MapConfigTest, DefaultsWithOnlySeed) {
    MapSettings s = load("seed: 7\n");

    EXPECT_DOUBLE_EQ(s.config.width, kDefaultMapWidth);
    EXPECT_DOUBLE_EQ(s.config.height, kDefaultMapHeight);
    EXPECT_EQ(s.config.territoryCount, kDefaultTerritoryCount);
    EXPECT_EQ(s.generator.sampler.relaxationIterations, 3);
    EXPECT_EQ(s.generator.colorMode, ColorMode::Terrain);
    EXPECT_EQ(s.generator.degenerateCells, DegenerateCellPolicy::Drop);
    EXPECT_EQ(s.generator.nameAttempts, 0u);
}

TEST_F(MapConfigTest, SeedIsRequired) {
    EXPECT_THROW((void)load("width: 100\n"), ConfigError);
}

TEST_F(MapConfigTest, RejectsInvalidValues) {
    EXPECT_THROW((void)load("seed: 1\nterritory_count: 0\n"), ConfigError);
    EXPECT_THROW((void)load("seed: 1\nwidth: -10\n"), ConfigError);
    EXPECT_THROW((void)load("seed: 1\nheight: tall\n"), ConfigError);
    EXPECT_THROW((void)load("seed: abc\n"), ConfigError);
    EXPECT_THROW((void)load("seed: 1\ncolor_mode: neon\n"), ConfigError);
    EXPECT_THROW((void)load("seed: 1\ndegenerate_cells: retry\n"), ConfigError);
    EXPECT_THROW((void)load("seed: 1\nrelaxation_iterations: -2\n"), ConfigError);
    EXPECT_THROW((void)load("seed: 1\nwidth: 100\nedge_margin: 60\n"), ConfigError);
    EXPECT_THROW((void)load("seed: 1\nname_attempts: -1\n"), ConfigError);
}

TEST_F(MapConfigTest, MissingFileThrows) {
    EXPECT_THROW((void)loadMapSettingsFile("/nonexistent/hierophant/map.conf"), ConfigError);
}

TEST_F(MapConfigTest, LoadedSettingsGenerate) {
    MapSettings s = load("width: 600\nheight: 400\nterritory_count: 8\nseed: 3\n");
    MapGenerator generator(s.config, s.generator);
    auto territories = generator.generate();
    EXPECT_EQ(territories.size(), 8u);
}
