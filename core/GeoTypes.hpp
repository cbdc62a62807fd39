#pragma once

#include <chrono>
#include <cstdint>
#include <utility>

namespace visits {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

inline Timestamp fromEpochSeconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

inline int64_t toEpochSeconds(Timestamp time) {
    return time.time_since_epoch().count();
}

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

inline bool operator==(const GeoPoint& a, const GeoPoint& b) {
    return a.lat == b.lat && a.lon == b.lon;
}

struct TimedPoint {
    double lat = 0.0;
    double lon = 0.0;
    Timestamp time{};

    GeoPoint position() const { return GeoPoint{lat, lon}; }

    // (x, y) as seen by the spatial index: latitude, longitude.
    std::pair<double, double> coordinates() const { return {lat, lon}; }
};

inline bool operator==(const TimedPoint& a, const TimedPoint& b) {
    return a.lat == b.lat && a.lon == b.lon && a.time == b.time;
}

struct BoundingBox {
    GeoPoint northEast;
    GeoPoint southWest;

    bool contains(const GeoPoint& p) const {
        return p.lat >= southWest.lat && p.lat <= northEast.lat &&
               p.lon >= southWest.lon && p.lon <= northEast.lon;
    }
};

struct VisitRecord {
    Timestamp start{};
    Timestamp end{};
    int totalInside = 0;
    int maxConsecutiveInside = 0;

    std::chrono::seconds duration() const { return end - start; }
};

inline bool operator==(const VisitRecord& a, const VisitRecord& b) {
    return a.start == b.start && a.end == b.end &&
           a.totalInside == b.totalInside &&
           a.maxConsecutiveInside == b.maxConsecutiveInside;
}

} // namespace visits
