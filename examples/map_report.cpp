/**
 * @file map_report.cpp
 * @brief Generate a territory map and print it as a text report
 *
 * Usage:
 *   hierophant_map_report [--config file.conf] [--width W] [--height H]
 *                         [--count N] [--seed S|now] [--iterations K]
 *                         [--palette] [--verbose]
 *
 * Command-line values override the config file. A seed is required, either
 * from the config file or --seed; "--seed now" uses the wall clock.
 */

#include "hierophant/errors.hpp"
#include "hierophant/log.hpp"
#include "hierophant/map_config.hpp"
#include "hierophant/map_generator.hpp"

#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

using namespace hierophant;

namespace {

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0
              << " [--config file] [--width W] [--height H] [--count N]"
                 " [--seed S|now] [--iterations K] [--palette] [--verbose]\n";
}

int64_t wallClockSeed() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void printReport(const std::vector<Territory>& territories, const MapConfig& config) {
    const MapSummary summary = summarizeMap(territories, config);

    std::cout << "Territories: " << summary.territoryCount << "\n"
              << "Map Size:    " << config.width << " x " << config.height << "\n"
              << "Seed:        " << config.seed << "\n"
              << "Coverage:    " << std::fixed << std::setprecision(4) << summary.coverage << "\n"
              << "Mean area:   " << std::setprecision(1) << summary.areas.mean << "\n"
              << "Population:  " << summary.totalPopulation << "\n"
              << "Terrain:    ";
    for (Terrain t : kAllTerrains) {
        std::cout << " " << terrainName(t) << "=" << summary.terrainCounts[terrainIndex(t)];
    }
    std::cout << "\n\n";

    for (const auto& t : territories) {
        std::cout << std::left << std::setw(14) << t.id
                  << std::setw(18) << t.name
                  << std::setw(9) << t.color
                  << std::setw(11) << terrainName(t.metadata.terrain)
                  << std::right << std::setw(8) << t.metadata.population << "  "
                  << std::left << std::setw(10) << t.metadata.culture
                  << std::right << std::setw(4) << t.metadata.development << "  "
                  << std::setprecision(1) << t.area << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> configPath;
    std::optional<double> width, height;
    std::optional<int> count, iterations;
    std::optional<int64_t> seed;
    bool palette = false;
    bool verbose = false;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw ConfigError("missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--config") {
                configPath = value();
            } else if (arg == "--width") {
                width = std::stod(value());
            } else if (arg == "--height") {
                height = std::stod(value());
            } else if (arg == "--count") {
                count = std::stoi(value());
            } else if (arg == "--seed") {
                std::string s = value();
                seed = (s == "now") ? wallClockSeed() : std::stoll(s);
            } else if (arg == "--iterations") {
                iterations = std::stoi(value());
            } else if (arg == "--palette") {
                palette = true;
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                throw ConfigError("unknown argument: " + arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        printUsage(argv[0]);
        return 2;
    }

    setLogLevel(verbose ? LogLevel::Debug : LogLevel::Warn);

    try {
        MapSettings settings;
        if (configPath) {
            settings = loadMapSettingsFile(*configPath);
        } else if (seed) {
            settings.config = {kDefaultMapWidth, kDefaultMapHeight, kDefaultTerritoryCount, *seed};
        } else {
            throw ConfigError("no seed given; pass --seed N, --seed now or --config file");
        }

        if (width) settings.config.width = *width;
        if (height) settings.config.height = *height;
        if (count) settings.config.territoryCount = *count;
        if (seed) settings.config.seed = *seed;
        if (iterations) settings.generator.sampler.relaxationIterations = *iterations;
        if (palette) settings.generator.colorMode = ColorMode::Palette;

        MapGenerator generator(settings.config, settings.generator);
        auto territories = generator.generate();
        printReport(territories, settings.config);
    } catch (const ConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Generation failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
