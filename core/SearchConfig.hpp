/**
 * @file SearchConfig.hpp
 * @brief Run parameters for a visit search
 *
 * Built once at startup (defaults, then the TOML file, then command-line
 * overrides) and passed by const reference to every component that needs it.
 */

#pragma once

#include "GeoTypes.hpp"
#include <cstddef>
#include <string>

namespace visits {

struct SearchConfig {
    std::string takeoutFile;                  ///< Location History JSON export
    GeoPoint target = {36.461755, -116.866612}; ///< Point being searched for (decimal degrees)
    std::string threshold = "50m";            ///< Distance with unit suffix, as entered
    double thresholdKm = 0.05;                ///< Parsed form of threshold
    int minRunLength = 10;                    ///< Points needed to qualify a visit and to end one
    double boxMargin = 2.0;                   ///< Bounding box radius as a multiple of the threshold
    std::size_t indexNodeSize = 64;           ///< Maximum entries per spatial index node
    bool cacheData = true;                    ///< Read/write <takeoutFile>.dat
    bool debug = false;                       ///< Report per-point and dropped-run events

    // Radius handed to the bounding box solver.
    double searchRadiusKm() const { return thresholdKm * boxMargin; }
};

} // namespace visits
