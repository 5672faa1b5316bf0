/**
 * @file map_generator.cpp
 * @brief Generation pipeline implementation
 *
 * Seed derivation for map seed s and generation index i:
 *   points              SeededRandom(s)
 *   terrain/population  SeededRandom(s + i)
 *   resources           SeededRandom(s + i + 1000)
 *   names               SeededRandom(s), SeededRandom(s + 1), ...
 *   colors              index i and s directly
 * s is first reduced modulo SeededRandom::kModulus, which leaves every
 * stream unchanged and keeps the offsets from overflowing.
 * Changing any of these changes every generated map for a given seed.
 */

#include "hierophant/map_generator.hpp"
#include "hierophant/attribute_generator.hpp"
#include "hierophant/errors.hpp"
#include "hierophant/log.hpp"
#include "hierophant/name_generator.hpp"
#include "hierophant/seeded_random.hpp"

#include <string>
#include <utility>

namespace hierophant {

namespace {

const Logger kLog("MapGenerator");

}  // namespace

std::string_view stageName(GenerationStage stage) {
    switch (stage) {
        case GenerationStage::Configured:        return "configured";
        case GenerationStage::PointsSampled:     return "points-sampled";
        case GenerationStage::PartitionComputed: return "partition-computed";
        case GenerationStage::Classified:        return "classified";
        case GenerationStage::Named:             return "named";
        case GenerationStage::Colored:           return "colored";
        case GenerationStage::Assembled:         return "assembled";
        case GenerationStage::Failed:            return "failed";
    }
    return "unknown";
}

// ============================================================================
// MapGenerator
// ============================================================================

MapGenerator::MapGenerator(MapConfig config, GeneratorSettings settings,
                           std::shared_ptr<const RegionPartitioner> partitioner)
    : config_(config)
    , seed_(SeededRandom::reduceSeed(config.seed))
    , settings_(settings)
    , partitioner_(std::move(partitioner)) {
    validateMapConfig(config_);
    validateSamplerSettings(settings_.sampler, config_.width, config_.height);
    if (!partitioner_) {
        partitioner_ = std::make_shared<HalfPlanePartitioner>();
    }
}

std::vector<Territory> MapGenerator::generate() {
    if (stage_ != GenerationStage::Configured) {
        throw std::logic_error("MapGenerator::generate() called twice");
    }

    try {
        runSampling();
        runPartition();
        runClassification();
        runNaming();
        runColoring();
        auto territories = runAssembly();
        kLog.info("generated " + std::to_string(territories.size()) + " of " +
                  std::to_string(config_.territoryCount) + " territories (seed " +
                  std::to_string(config_.seed) + ")");
        return territories;
    } catch (const std::exception& e) {
        kLog.error(std::string("generation failed at stage '") +
                   std::string(stageName(stage_)) + "': " + e.what());
        stage_ = GenerationStage::Failed;
        throw;
    }
}

void MapGenerator::advance(GenerationStage next) {
    stage_ = next;
    kLog.debug("stage " + std::string(stageName(next)));
}

void MapGenerator::runSampling() {
    points_ = hierophant::samplePoints(config_.territoryCount, config_.width, config_.height,
                                       seed_, *partitioner_, settings_.sampler);
    advance(GenerationStage::PointsSampled);
}

void MapGenerator::runPartition() {
    const Bounds bounds = Bounds::fromSize(config_.width, config_.height);
    CellList cells = partitioner_->partition(points_, bounds);

    drafts_.clear();
    dropped_.clear();
    for (size_t i = 0; i < points_.size(); ++i) {
        if (i >= cells.size() || !cells[i] || cells[i]->size() < 3) {
            if (settings_.degenerateCells == DegenerateCellPolicy::Fail) {
                throw DegenerateCellError("point " + std::to_string(i) + " has no cell", i);
            }
            kLog.warn("dropping territory " + std::to_string(i) + ": no cell for its point");
            dropped_.push_back(i);
            continue;
        }

        Draft draft;
        draft.index = i;
        draft.center = points_[i];
        draft.border = std::move(*cells[i]);
        draft.area = polygonArea(draft.border);
        drafts_.push_back(std::move(draft));
    }

    if (drafts_.empty()) {
        throw DegenerateCellError("no point produced a cell", 0);
    }
    advance(GenerationStage::PartitionComputed);
}

void MapGenerator::runClassification() {
    for (auto& draft : drafts_) {
        const int64_t pointSeed = seed_ + static_cast<int64_t>(draft.index);
        draft.metadata = generateMetadata(draft.center, config_.width, config_.height,
                                          draft.area, pointSeed);
    }
    advance(GenerationStage::Classified);
}

void MapGenerator::runNaming() {
    // Names are drawn for every requested index so dropped cells don't shift them
    auto names = generateUniqueNames(static_cast<size_t>(config_.territoryCount), seed_,
                                     settings_.nameAttempts);
    for (auto& draft : drafts_) {
        draft.name = std::move(names[draft.index]);
    }
    advance(GenerationStage::Named);
}

void MapGenerator::runColoring() {
    for (auto& draft : drafts_) {
        const int index = static_cast<int>(draft.index);
        switch (settings_.colorMode) {
            case ColorMode::Terrain:
                draft.color = terrainColor(draft.metadata.terrain, index, seed_);
                break;
            case ColorMode::Palette:
                draft.color = paletteColor(index, seed_);
                break;
        }
    }
    advance(GenerationStage::Colored);
}

std::vector<Territory> MapGenerator::runAssembly() {
    std::vector<Territory> territories;
    territories.reserve(drafts_.size());
    for (auto& draft : drafts_) {
        Territory t;
        t.id = territoryId(draft.index);
        t.name = std::move(draft.name);
        t.color = std::move(draft.color);
        t.center = draft.center;
        t.borderPoints = std::move(draft.border);
        t.area = draft.area;
        t.metadata = std::move(draft.metadata);
        territories.push_back(std::move(t));
    }
    drafts_.clear();
    advance(GenerationStage::Assembled);
    return territories;
}

std::vector<Territory> generateMap(const MapConfig& config) {
    MapGenerator generator(config);
    return generator.generate();
}

// ============================================================================
// Summary
// ============================================================================

MapSummary summarizeMap(const std::vector<Territory>& territories, const MapConfig& config) {
    MapSummary summary;
    summary.territoryCount = territories.size();
    summary.mapArea = config.width * config.height;

    std::vector<double> areas;
    areas.reserve(territories.size());
    for (const auto& t : territories) {
        areas.push_back(t.area);
        summary.totalPopulation += t.metadata.population;
        const size_t ti = terrainIndex(t.metadata.terrain);
        if (ti < kTerrainCount) {
            ++summary.terrainCounts[ti];
        }
    }
    summary.areas = summarizeAreas(areas);
    if (summary.mapArea > 0.0) {
        summary.coverage = summary.areas.total / summary.mapArea;
    }
    return summary;
}

}  // namespace hierophant
