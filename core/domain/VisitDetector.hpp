#pragma once

#include "../GeoTypes.hpp"
#include "../ports/IEventBus.hpp"
#include "CandidateSet.hpp"
#include <functional>
#include <memory>
#include <vector>

namespace visits::domain {

struct DetectorSettings {
    GeoPoint target;
    double thresholdKm = 0.05;
    int minRunLength = 10;
};

/**
 * @brief Turns candidate indices into visits with gap hysteresis
 *
 * Scans the contiguous index span from the smallest to the largest candidate.
 * Candidates are measured exactly; other points in the span count as outside.
 * A run closes after minRunLength consecutive outside points or at the end of
 * the span, and qualifies as a visit when it held minRunLength consecutive
 * inside points at some stage.
 *
 * Points whose distance cannot be computed (NoConvergence) are skipped without
 * touching the counters and reported as PointSkipped.
 */
class VisitDetector {
public:
    using DistanceFunction = std::function<double(const GeoPoint&, const GeoPoint&)>;

    VisitDetector(DetectorSettings settings,
                  std::shared_ptr<ports::IEventBus> eventBus,
                  DistanceFunction distance = nullptr);

    std::vector<VisitRecord> detect(const std::vector<TimedPoint>& points,
                                    const CandidateSet& candidates) const;

    const DetectorSettings& settings() const { return settings_; }

private:
    struct RunState {
        Timestamp start{};
        Timestamp end{};
        int totalInside = 0;
        int consecutiveInside = 0;
        int maxConsecutiveInside = 0;
        int consecutiveOutside = 0;
    };

    void recordInside(RunState& run, const TimedPoint& point) const;
    void recordOutside(RunState& run) const;
    void closeRun(RunState& run, std::vector<VisitRecord>& visits) const;
    void publish(const ScanEvent& event) const;

    DetectorSettings settings_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    DistanceFunction distance_;
};

} // namespace visits::domain
