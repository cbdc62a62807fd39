#include "VisitSearch.hpp"
#include "../BoundingBox.hpp"
#include "CandidateSet.hpp"
#include "SpatialIndex.hpp"
#include "VisitDetector.hpp"
#include <algorithm>
#include <utility>

namespace visits::domain {

VisitSearch::VisitSearch(SearchConfig config, std::shared_ptr<ports::IEventBus> eventBus)
    : config_(std::move(config))
    , eventBus_(std::move(eventBus)) {
}

BoundingBox VisitSearch::solveBox() const {
    return BoundingBoxSolver::solve(config_.target, config_.searchRadiusKm());
}

SearchResult VisitSearch::run(std::vector<TimedPoint> points) const {
    const BoundingBox box = solveBox();
    return run(std::move(points), box);
}

SearchResult VisitSearch::run(std::vector<TimedPoint> points, const BoundingBox& box) const {
    SearchResult result;
    result.box = box;

    if (!isChronological(points)) {
        std::stable_sort(points.begin(), points.end(),
                         [](const TimedPoint& a, const TimedPoint& b) { return a.time < b.time; });
        result.reordered = true;
    }

    const SpatialIndex<TimedPoint> index(points, config_.indexNodeSize);
    const CandidateSet candidates(index.range(result.box.southWest.lat, result.box.southWest.lon,
                                              result.box.northEast.lat, result.box.northEast.lon));
    result.candidateCount = candidates.size();
    if (candidates.empty()) {
        return result;
    }

    DetectorSettings settings;
    settings.target = config_.target;
    settings.thresholdKm = config_.thresholdKm;
    settings.minRunLength = config_.minRunLength;

    const VisitDetector detector(settings, eventBus_);
    result.visits = detector.detect(points, candidates);
    return result;
}

bool VisitSearch::isChronological(const std::vector<TimedPoint>& points) {
    return std::is_sorted(points.begin(), points.end(),
                          [](const TimedPoint& a, const TimedPoint& b) { return a.time < b.time; });
}

} // namespace visits::domain
