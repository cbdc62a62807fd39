#include "LocationHistory.hpp"
#include "Errors.hpp"
#include "TimeFormat.hpp"
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace visits {

std::vector<TimedPoint> LocationHistory::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw HistoryFormatError("Error opening takeout file: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        throw HistoryFormatError("Error loading takeout file " + path + ": " + e.what());
    }
    return decode(document);
}

std::vector<TimedPoint> LocationHistory::parse(const std::string& json) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        throw HistoryFormatError(std::string("Error loading takeout data: ") + e.what());
    }
    return decode(document);
}

std::vector<TimedPoint> LocationHistory::decode(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("locations") || !json["locations"].is_array()) {
        throw HistoryFormatError("Takeout data has no \"locations\" array");
    }

    const auto& locations = json["locations"];
    std::vector<TimedPoint> points;
    points.reserve(locations.size());

    for (size_t idx = 0; idx < locations.size(); ++idx) {
        try {
            points.push_back(jsonToPoint(locations[idx]));
        } catch (const HistoryFormatError& e) {
            throw HistoryFormatError("Location " + std::to_string(idx) + ": " + e.what());
        } catch (const nlohmann::json::exception& e) {
            throw HistoryFormatError("Location " + std::to_string(idx) + ": " + e.what());
        }
    }
    return points;
}

TimedPoint LocationHistory::jsonToPoint(const nlohmann::json& json) {
    TimedPoint point;
    point.lat = static_cast<double>(json.at("latitudeE7").get<int64_t>()) / E7;
    point.lon = static_cast<double>(json.at("longitudeE7").get<int64_t>()) / E7;

    if (json.contains("timestampMs")) {
        point.time = parseTimestampMs(json["timestampMs"].get<std::string>());
    } else if (json.contains("timestamp")) {
        const auto text = json["timestamp"].get<std::string>();
        const auto parsed = parseIso8601(text);
        if (!parsed) {
            throw HistoryFormatError("Error parsing time \"" + text + "\"");
        }
        point.time = *parsed;
    } else {
        throw HistoryFormatError("missing timestamp");
    }
    return point;
}

Timestamp LocationHistory::parseTimestampMs(const std::string& timestampMs) {
    // Milliseconds since the epoch; the last three digits are dropped.
    if (timestampMs.size() <= 3) {
        throw HistoryFormatError("Error parsing time \"" + timestampMs + "\"");
    }
    const std::string seconds = timestampMs.substr(0, timestampMs.size() - 3);

    size_t consumed = 0;
    int64_t value = 0;
    try {
        value = std::stoll(seconds, &consumed);
    } catch (const std::exception&) {
        throw HistoryFormatError("Error parsing time \"" + seconds + "\"");
    }
    if (consumed != seconds.size() ||
        !std::isdigit(static_cast<unsigned char>(timestampMs[timestampMs.size() - 1]))) {
        throw HistoryFormatError("Error parsing time \"" + seconds + "\"");
    }
    return fromEpochSeconds(value);
}

} // namespace visits
