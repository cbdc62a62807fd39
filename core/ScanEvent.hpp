#pragma once

#include "GeoTypes.hpp"
#include <cstddef>
#include <string>

namespace visits {

enum class EventType {
    PointInside,
    PointSkipped,
    VisitFound,
    VisitDropped
};

struct ScanEvent {
    EventType eventType = EventType::PointInside;
    size_t index = 0;           // position in the point sequence
    Timestamp time{};
    double distanceKm = 0.0;    // PointInside
    VisitRecord visit;          // VisitFound, VisitDropped
    std::string reason;         // PointSkipped
};

std::string eventTypeToString(EventType type);

} // namespace visits
