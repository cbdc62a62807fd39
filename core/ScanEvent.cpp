#include "ScanEvent.hpp"
#include <unordered_map>

namespace visits {

std::string eventTypeToString(EventType type) {
    static const std::unordered_map<EventType, std::string> typeMap = {
        {EventType::PointInside, "point_inside"},
        {EventType::PointSkipped, "point_skipped"},
        {EventType::VisitFound, "visit_found"},
        {EventType::VisitDropped, "visit_dropped"}
    };

    auto it = typeMap.find(type);
    return (it != typeMap.end()) ? it->second : "unknown";
}

} // namespace visits
