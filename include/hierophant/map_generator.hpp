/**
 * @file map_generator.hpp
 * @brief Generation pipeline from MapConfig to territory list
 *
 * Stages run once, in order:
 *
 *   Configured -> PointsSampled -> PartitionComputed -> Classified
 *              -> Named -> Colored -> Assembled
 *
 * Any exception moves the generator to Failed and is rethrown. The result
 * is ordered by generation index; points whose cell is degenerate at the
 * output stage are dropped (or fail the run, per DegenerateCellPolicy).
 */

#pragma once

#include "hierophant/color.hpp"
#include "hierophant/geometry.hpp"
#include "hierophant/point_sampler.hpp"
#include "hierophant/region_partitioner.hpp"
#include "hierophant/territory.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace hierophant {

enum class GenerationStage : uint8_t {
    Configured,
    PointsSampled,
    PartitionComputed,
    Classified,
    Named,
    Colored,
    Assembled,
    Failed,
};

[[nodiscard]] std::string_view stageName(GenerationStage stage);

/// What to do with a point that has no cell in the final partition
enum class DegenerateCellPolicy : uint8_t {
    Drop,   ///< Skip the territory and log a warning
    Fail,   ///< Throw DegenerateCellError
};

struct GeneratorSettings {
    SamplerSettings sampler;
    ColorMode colorMode = ColorMode::Terrain;
    DegenerateCellPolicy degenerateCells = DegenerateCellPolicy::Drop;
    /// Name attempt ceiling, 0 = defaultNameAttempts(territoryCount)
    size_t nameAttempts = 0;
};

/// Single-use pipeline for one MapConfig
class MapGenerator {
public:
    /// @param partitioner Cell source; HalfPlanePartitioner when null
    /// @throws ConfigError for an invalid config or settings
    explicit MapGenerator(MapConfig config, GeneratorSettings settings = {},
                          std::shared_ptr<const RegionPartitioner> partitioner = nullptr);

    /// Run every stage and return the territories
    [[nodiscard]] std::vector<Territory> generate();

    [[nodiscard]] GenerationStage stage() const { return stage_; }
    [[nodiscard]] const MapConfig& config() const { return config_; }
    [[nodiscard]] const GeneratorSettings& settings() const { return settings_; }

    /// Indices dropped for lack of a cell in the last run
    [[nodiscard]] const std::vector<size_t>& droppedIndices() const { return dropped_; }

private:
    /// Per-index working state between stages
    struct Draft {
        size_t index = 0;
        glm::dvec2 center{0.0};
        Polygon border;
        double area = 0.0;
        TerritoryMetadata metadata;
        std::string name;
        std::string color;
    };

    void advance(GenerationStage next);
    void runSampling();
    void runPartition();
    void runClassification();
    void runNaming();
    void runColoring();
    [[nodiscard]] std::vector<Territory> runAssembly();

    MapConfig config_;
    int64_t seed_;          ///< config_.seed reduced, base of every derived seed
    GeneratorSettings settings_;
    std::shared_ptr<const RegionPartitioner> partitioner_;
    GenerationStage stage_ = GenerationStage::Configured;

    std::vector<glm::dvec2> points_;
    std::vector<Draft> drafts_;
    std::vector<size_t> dropped_;
};

/// Generate with default settings and partitioner
[[nodiscard]] std::vector<Territory> generateMap(const MapConfig& config);

// ============================================================================
// Summary
// ============================================================================

struct MapSummary {
    size_t territoryCount = 0;
    double mapArea = 0.0;
    AreaStats areas;
    double coverage = 0.0;          ///< Total territory area / map area
    int64_t totalPopulation = 0;
    std::array<size_t, kTerrainCount> terrainCounts{};
};

[[nodiscard]] MapSummary summarizeMap(const std::vector<Territory>& territories,
                                      const MapConfig& config);

}  // namespace hierophant
