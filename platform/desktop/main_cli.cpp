/**
 * @file main_cli.cpp
 * @brief Command-line interface for the visit finder
 *
 * Loads a Google Takeout location history (or its cached snapshot), then
 * reports every sustained visit to a target point.
 *
 * @note Configuration comes from visitfinder.toml when present; flags override it
 * @note Exit codes: 0 success, 1 runtime error, 2 usage error
 */

#include "SearchConfig.hpp"
#include "TomlConfig.hpp"
#include "Units.hpp"
#include "LocationHistory.hpp"
#include "PointCache.hpp"
#include "Errors.hpp"
#include "domain/EventBus.hpp"
#include "domain/VisitSearch.hpp"
#include "adapters/ConsoleReporter.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace visits;

/**
 * @brief Display program usage information
 * @param programName Name of the executable (from argv[0])
 */
void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] /path/to/Location\\ History.json\n"
              << "Options:\n"
              << "  --config [file]       Configuration file (default: visitfinder.toml)\n"
              << "  --lat [degrees]       Latitude of target location (default: 36.461755)\n"
              << "  --long [degrees]      Longitude of target location (default: -116.866612)\n"
              << "  --threshold [dist]    Distance that counts as being at the location,\n"
              << "                        with unit km, m, mi or ft (default: 50m)\n"
              << "  --no-cache            Do not read or write the <file>.dat cache\n"
              << "  --debug               Show per-point and dropped-visit logging\n"
              << "  --help                Show this help message\n"
              << "\nConfiguration file format (TOML):\n"
              << "  [search]\n"
              << "  latitude = 36.461755\n"
              << "  longitude = -116.866612\n"
              << "  threshold = \"50m\"\n"
              << std::endl;
}

/**
 * @brief Command-line values that override the configuration file
 */
struct CliOverrides {
    std::string configFile = "visitfinder.toml";
    std::optional<double> lat;
    std::optional<double> lon;
    std::optional<std::string> threshold;
    bool noCache = false;
    bool debug = false;
    std::vector<std::string> positional;
};

/**
 * @brief Load the point sequence, preferring the cache next to the takeout file
 *
 * The cache is written only when it was not used and the decoded history is
 * non-empty.
 *
 * @throws HistoryFormatError, CacheError
 */
std::vector<TimedPoint> loadPoints(const SearchConfig& config) {
    const PointCache cache(PointCache::pathFor(config.takeoutFile));

    if (config.cacheData) {
        if (auto cached = cache.load()) {
            std::cout << "[Cache] Using " << cache.path() << std::endl;
            return std::move(*cached);
        }
    }

    auto points = LocationHistory::loadFile(config.takeoutFile);

    if (config.cacheData && !points.empty()) {
        cache.store(points);
        std::cout << "[Cache] Wrote " << cache.path() << std::endl;
    }
    return points;
}

int main(int argc, char* argv[]) {
    CliOverrides cli;

    // Parse command line arguments
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                cli.configFile = argv[++i];
            } else if (arg == "--lat" && i + 1 < argc) {
                cli.lat = std::stod(argv[++i]);
            } else if (arg == "--long" && i + 1 < argc) {
                cli.lon = std::stod(argv[++i]);
            } else if (arg == "--threshold" && i + 1 < argc) {
                cli.threshold = argv[++i];
            } else if (arg == "--no-cache") {
                cli.noCache = true;
            } else if (arg == "--debug") {
                cli.debug = true;
            } else if (!arg.empty() && arg[0] == '-' && arg.size() > 1) {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 2;
            } else {
                cli.positional.push_back(arg);
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 2;
    }

    if (cli.positional.size() != 1) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        SearchConfig config = TomlConfig::loadFromFile(cli.configFile);
        config.takeoutFile = cli.positional[0];
        if (cli.lat) config.target.lat = *cli.lat;
        if (cli.lon) config.target.lon = *cli.lon;
        if (cli.threshold) config.threshold = *cli.threshold;
        if (cli.noCache) config.cacheData = false;
        if (cli.debug) config.debug = true;
        TomlConfig::validate(config);

        std::cout << "[Search] Using target (" << std::fixed;
        std::cout.precision(6);
        std::cout << config.target.lat << ", " << config.target.lon << ")" << std::endl;
        std::cout.unsetf(std::ios::floatfield);

        config.thresholdKm = Units::parseDistanceKm(config.threshold);
        std::cout << "[Search] Using distance " << config.thresholdKm << "km" << std::endl;

        auto eventBus = std::make_shared<domain::EventBus>();
        adapters::ConsoleReporter reporter(std::cout, config.debug);
        reporter.attach(*eventBus);

        // Unreachable targets fail here, before the history is read or cached
        const domain::VisitSearch search(config, eventBus);
        const BoundingBox box = search.solveBox();

        auto points = loadPoints(config);
        std::cout << "[History] Loaded " << points.size() << " pinpoints" << std::endl;

        const auto result = search.run(std::move(points), box);

        if (config.debug) {
            std::cout << "[Search] Bounding box: NE (" << result.box.northEast.lat << ", "
                      << result.box.northEast.lon << ") SW (" << result.box.southWest.lat << ", "
                      << result.box.southWest.lon << "), " << result.candidateCount
                      << " candidates" << std::endl;
        }
        if (result.reordered) {
            std::cerr << "[History] Warning: points were not in chronological order and were sorted"
                      << std::endl;
        }

        eventBus->processEvents();

        if (result.visits.empty()) {
            std::cout << "[Search] No visits found" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
