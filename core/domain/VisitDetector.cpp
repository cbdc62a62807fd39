#include "VisitDetector.hpp"
#include "../Errors.hpp"
#include "../Geo.hpp"
#include <algorithm>
#include <utility>

namespace visits::domain {

VisitDetector::VisitDetector(DetectorSettings settings,
                             std::shared_ptr<ports::IEventBus> eventBus,
                             DistanceFunction distance)
    : settings_(settings)
    , eventBus_(std::move(eventBus))
    , distance_(distance ? std::move(distance) : DistanceFunction(&Geo::distanceKm)) {
}

std::vector<VisitRecord> VisitDetector::detect(const std::vector<TimedPoint>& points,
                                               const CandidateSet& candidates) const {
    std::vector<VisitRecord> visits;
    if (candidates.empty() || points.empty()) {
        return visits;
    }

    const size_t first = candidates.first();
    const size_t last = std::min(candidates.last(), points.size() - 1);
    RunState run;

    for (size_t idx = first; idx <= last; ++idx) {
        const TimedPoint& point = points[idx];
        bool skipped = false;
        double d = settings_.thresholdKm * 2;

        if (candidates.contains(idx)) {
            try {
                d = distance_(point.position(), settings_.target);
            } catch (const NoConvergence& e) {
                ScanEvent event;
                event.eventType = EventType::PointSkipped;
                event.index = idx;
                event.time = point.time;
                event.reason = e.what();
                publish(event);
                skipped = true;
            }
        }

        if (!skipped) {
            if (d < settings_.thresholdKm) {
                ScanEvent event;
                event.eventType = EventType::PointInside;
                event.index = idx;
                event.time = point.time;
                event.distanceKm = d;
                publish(event);
                recordInside(run, point);
            } else {
                recordOutside(run);
            }
        }

        if (run.consecutiveOutside >= settings_.minRunLength || idx == last) {
            closeRun(run, visits);
        }
    }
    return visits;
}

void VisitDetector::recordInside(RunState& run, const TimedPoint& point) const {
    if (run.totalInside == 0) {
        run.start = point.time;
    }
    run.end = point.time;
    run.totalInside++;
    run.consecutiveInside++;
    if (run.consecutiveInside > run.maxConsecutiveInside) {
        run.maxConsecutiveInside = run.consecutiveInside;
    }
    run.consecutiveOutside = 0;
}

void VisitDetector::recordOutside(RunState& run) const {
    run.consecutiveOutside++;
    run.consecutiveInside = 0;
}

void VisitDetector::closeRun(RunState& run, std::vector<VisitRecord>& visits) const {
    VisitRecord record;
    record.start = run.start;
    record.end = run.end;
    record.totalInside = run.totalInside;
    record.maxConsecutiveInside = run.maxConsecutiveInside;

    if (run.maxConsecutiveInside >= settings_.minRunLength) {
        visits.push_back(record);
        ScanEvent event;
        event.eventType = EventType::VisitFound;
        event.time = record.start;
        event.visit = record;
        publish(event);
    } else if (run.totalInside > 0) {
        ScanEvent event;
        event.eventType = EventType::VisitDropped;
        event.time = record.start;
        event.visit = record;
        publish(event);
    }

    run.totalInside = 0;
    run.maxConsecutiveInside = 0;
}

void VisitDetector::publish(const ScanEvent& event) const {
    if (eventBus_) {
        eventBus_->publish(event);
    }
}

} // namespace visits::domain
