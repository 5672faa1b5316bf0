#include "hierophant/attribute_generator.hpp"
#include "hierophant/seeded_random.hpp"
#include "hierophant/terrain_classifier.hpp"

#include <algorithm>
#include <cmath>

namespace hierophant {

namespace {

const std::array<std::string_view, 12> kCultures = {
    "Gothic", "Norman", "Saxon", "Celtic", "Frankish", "Byzantine",
    "Slavic", "Norse", "Iberian", "Lombard", "Moorish", "Venetian",
};

constexpr int kFallbackResource = 50;
constexpr int kFallbackPopulation = 5000;

bool isKnownTerrain(Terrain terrain) {
    return terrainIndex(terrain) < kTerrainCount;
}

// Rounds halves toward positive infinity
int64_t roundHalfUp(double value) {
    return static_cast<int64_t>(std::floor(value + 0.5));
}

}  // namespace

const std::array<std::string_view, 12>& cultureNames() {
    return kCultures;
}

ResourceRanges resourceRanges(Terrain terrain) {
    switch (terrain) {
        case Terrain::Plains:    return {{70, 95}, {40, 60}, {50, 70}};
        case Terrain::Forest:    return {{60, 80}, {30, 50}, {40, 60}};
        case Terrain::Mountains: return {{20, 40}, {70, 95}, {60, 85}};
        case Terrain::Desert:    return {{15, 35}, {50, 80}, {30, 50}};
        case Terrain::Hills:     return {{50, 70}, {55, 75}, {55, 75}};
        case Terrain::Coastal:   return {{65, 85}, {60, 85}, {45, 65}};
    }
    return {{kFallbackResource, kFallbackResource},
            {kFallbackResource, kFallbackResource},
            {kFallbackResource, kFallbackResource}};
}

IntRange basePopulationRange(Terrain terrain) {
    switch (terrain) {
        case Terrain::Plains:    return {8000, 15000};
        case Terrain::Forest:    return {5000, 10000};
        case Terrain::Mountains: return {2000, 5000};
        case Terrain::Desert:    return {1000, 4000};
        case Terrain::Hills:     return {6000, 12000};
        case Terrain::Coastal:   return {10000, 18000};
    }
    return {kFallbackPopulation, kFallbackPopulation};
}

Resources rollResources(Terrain terrain, int64_t seed) {
    if (!isKnownTerrain(terrain)) {
        return {kFallbackResource, kFallbackResource, kFallbackResource};
    }

    SeededRandom rng(seed);
    const ResourceRanges ranges = resourceRanges(terrain);
    Resources r;
    r.food = rng.nextInt(ranges.food.min, ranges.food.max);
    r.gold = rng.nextInt(ranges.gold.min, ranges.gold.max);
    r.military = rng.nextInt(ranges.military.min, ranges.military.max);
    return r;
}

int developmentScore(const Resources& resources) {
    double weighted = resources.gold * 0.4 + resources.food * 0.3 + resources.military * 0.3;
    return static_cast<int>(roundHalfUp(weighted));
}

int64_t scalePopulation(int basePopulation, double area, double width, double height) {
    const double averageArea = (width * height) / kPopulationAreaDivisor;
    const double multiplier = std::sqrt(area / averageArea);
    return std::max<int64_t>(1, roundHalfUp(basePopulation * multiplier));
}

TerritoryMetadata generateMetadata(const glm::dvec2& center, double width, double height,
                                   double area, int64_t pointSeed) {
    const int64_t seed = SeededRandom::reduceSeed(pointSeed);
    SeededRandom rng(seed);

    TerritoryMetadata meta;
    meta.terrain = classifyTerrain(center, width, height, seed);
    meta.resources = rollResources(meta.terrain, seed + kResourceSeedOffset);

    int basePopulation = kFallbackPopulation;
    if (isKnownTerrain(meta.terrain)) {
        const IntRange range = basePopulationRange(meta.terrain);
        basePopulation = rng.nextInt(range.min, range.max);
    }
    meta.population = scalePopulation(basePopulation, area, width, height);

    meta.development = developmentScore(meta.resources);

    const int cultureIndex = rng.nextInt(0, static_cast<int>(kCultures.size()) - 1);
    meta.culture = std::string(kCultures[static_cast<size_t>(cultureIndex)]);
    return meta;
}

}  // namespace hierophant
