#include "PointCache.hpp"
#include "Errors.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace visits {

PointCache::PointCache(std::string path) : path_(std::move(path)) {}

std::string PointCache::pathFor(const std::string& takeoutFile) {
    return takeoutFile + ".dat";
}

std::optional<std::vector<TimedPoint>> PointCache::load() const {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            throw CacheError("Error opening cache file " + path_ + ": " + ec.message());
        }
        return std::nullopt;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw CacheError("Error opening cache file: " + path_);
    }
    const std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                     std::istreambuf_iterator<char>());

    std::vector<TimedPoint> points;
    try {
        const auto document = nlohmann::json::from_cbor(bytes);
        if (document.value("version", 0) != FORMAT_VERSION) {
            throw CacheError("Error loading cache file " + path_ + ": unsupported version");
        }
        const auto& entries = document.at("points");
        points.reserve(entries.size());
        for (const auto& entry : entries) {
            TimedPoint point;
            point.lat = entry.at(0).get<double>();
            point.lon = entry.at(1).get<double>();
            point.time = fromEpochSeconds(entry.at(2).get<int64_t>());
            points.push_back(point);
        }
    } catch (const nlohmann::json::exception& e) {
        throw CacheError("Error loading cache file " + path_ + ": " + e.what());
    }
    return points;
}

void PointCache::store(const std::vector<TimedPoint>& points) const {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& point : points) {
        entries.push_back(nlohmann::json::array({point.lat, point.lon, toEpochSeconds(point.time)}));
    }
    nlohmann::json document;
    document["version"] = FORMAT_VERSION;
    document["points"] = std::move(entries);

    const std::vector<uint8_t> bytes = nlohmann::json::to_cbor(document);

    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw CacheError("Error opening cache file for write: " + path_);
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw CacheError("Error writing cache file: " + path_);
    }
}

} // namespace visits
