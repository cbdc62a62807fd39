#pragma once

#include "GeoTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace visits {

// Google Takeout "Location History.json" decoding.
class LocationHistory {
public:
    static std::vector<TimedPoint> loadFile(const std::string& path);
    static std::vector<TimedPoint> parse(const std::string& json);
    static std::vector<TimedPoint> decode(const nlohmann::json& json);

    static TimedPoint jsonToPoint(const nlohmann::json& json);

private:
    static constexpr double E7 = 1e7;

    static Timestamp parseTimestampMs(const std::string& timestampMs);
};

} // namespace visits
