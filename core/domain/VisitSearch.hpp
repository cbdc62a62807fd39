#pragma once

#include "../GeoTypes.hpp"
#include "../SearchConfig.hpp"
#include "../ports/IEventBus.hpp"
#include <cstddef>
#include <memory>
#include <vector>

namespace visits::domain {

struct SearchResult {
    BoundingBox box;
    size_t candidateCount = 0;
    bool reordered = false;                 ///< input was not chronological and got sorted
    std::vector<VisitRecord> visits;
};

/**
 * @brief Bounding box -> spatial index -> visit detector
 *
 * The box is solved for thresholdKm * boxMargin around the target; only the
 * points inside it are measured exactly. Input that is not in ascending time
 * order is stable-sorted by timestamp first, so that visit start and end times
 * keep their meaning for newest-first exports.
 */
class VisitSearch {
public:
    VisitSearch(SearchConfig config, std::shared_ptr<ports::IEventBus> eventBus);

    /**
     * @brief Box of radius thresholdKm * boxMargin around the target
     * @throws TooCloseToPoleOrMeridian, NoConvergence when the box cannot be solved
     */
    BoundingBox solveBox() const;

    /**
     * @throws TooCloseToPoleOrMeridian, NoConvergence when the box cannot be solved
     */
    SearchResult run(std::vector<TimedPoint> points) const;

    // Same as run(points), with a box already obtained from solveBox().
    SearchResult run(std::vector<TimedPoint> points, const BoundingBox& box) const;

    static bool isChronological(const std::vector<TimedPoint>& points);

private:
    SearchConfig config_;
    std::shared_ptr<ports::IEventBus> eventBus_;
};

} // namespace visits::domain
