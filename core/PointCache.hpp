#pragma once

#include "GeoTypes.hpp"
#include <optional>
#include <string>
#include <vector>

namespace visits {

/**
 * @brief CBOR snapshot of a decoded point sequence
 *
 * Stored next to the takeout file as `<input>.dat` so later runs skip the JSON
 * decode. Document layout: {"version": 1, "points": [[lat, long, epochSeconds], ...]}.
 */
class PointCache {
public:
    static constexpr int FORMAT_VERSION = 1;

    explicit PointCache(std::string path);

    static std::string pathFor(const std::string& takeoutFile);

    const std::string& path() const { return path_; }

    /**
     * @return Cached points, or std::nullopt if no cache file exists
     * @throws CacheError if the file exists but cannot be read or decoded
     */
    std::optional<std::vector<TimedPoint>> load() const;

    /**
     * @throws CacheError if the file cannot be written
     */
    void store(const std::vector<TimedPoint>& points) const;

private:
    std::string path_;
};

} // namespace visits
