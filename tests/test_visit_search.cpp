#include <gtest/gtest.h>
#include "../core/domain/VisitSearch.hpp"
#include "../core/domain/EventBus.hpp"
#include "../core/Errors.hpp"
#include "../core/Geo.hpp"
#include <algorithm>
#include <memory>
#include <vector>

using namespace visits;
using namespace visits::domain;

namespace {

TimedPoint pointAt(const GeoPoint& origin, double bearing, double km, int64_t seconds) {
    const GeoPoint p = Geo::destination(origin, bearing, km);
    TimedPoint tp;
    tp.lat = p.lat;
    tp.lon = p.lon;
    tp.time = fromEpochSeconds(seconds);
    return tp;
}

} // namespace

class VisitSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.target = {36.461755, -116.866612};
        config_.thresholdKm = 0.05;
        eventBus_ = std::make_shared<EventBus>();
    }

    // A drive in from 5 km away, 20 minutes parked near the target, a drive out.
    std::vector<TimedPoint> day() const {
        std::vector<TimedPoint> points;
        int64_t t = 1500000000;
        for (int i = 50; i > 0; --i) {
            points.push_back(pointAt(config_.target, 200.0, i * 0.1, t += 60));
        }
        for (int i = 0; i < 20; ++i) {
            points.push_back(pointAt(config_.target, i * 18.0, 0.02, t += 60));
        }
        for (int i = 1; i <= 50; ++i) {
            points.push_back(pointAt(config_.target, 20.0, i * 0.1, t += 60));
        }
        return points;
    }

    SearchConfig config_;
    std::shared_ptr<EventBus> eventBus_;
};

TEST_F(VisitSearchTest, FindsParkedStretch) {
    const auto points = day();
    const VisitSearch search(config_, eventBus_);
    const auto result = search.run(points);

    EXPECT_FALSE(result.reordered);
    EXPECT_GE(result.candidateCount, 20u);
    EXPECT_LT(result.candidateCount, points.size());
    ASSERT_EQ(result.visits.size(), 1u);
    EXPECT_EQ(result.visits[0].totalInside, 20);
    EXPECT_EQ(result.visits[0].maxConsecutiveInside, 20);
    EXPECT_EQ(result.visits[0].start, points[50].time);
    EXPECT_EQ(result.visits[0].end, points[69].time);
}

TEST_F(VisitSearchTest, NewestFirstInputIsSorted) {
    auto points = day();
    const auto forward = VisitSearch(config_, eventBus_).run(points);

    std::reverse(points.begin(), points.end());
    EXPECT_FALSE(VisitSearch::isChronological(points));
    const auto backward = VisitSearch(config_, eventBus_).run(points);

    EXPECT_TRUE(backward.reordered);
    EXPECT_EQ(backward.visits, forward.visits);
}

TEST_F(VisitSearchTest, PointsInBoxButBeyondThresholdAreNotVisits) {
    std::vector<TimedPoint> points;
    for (int i = 0; i < 30; ++i) {
        points.push_back(pointAt(config_.target, 90.0, 0.07, 1500000000 + i * 60));
    }
    const auto result = VisitSearch(config_, eventBus_).run(points);

    EXPECT_EQ(result.candidateCount, 30u);
    EXPECT_TRUE(result.visits.empty());
}

TEST_F(VisitSearchTest, FarAwayHistoryHasNoCandidates) {
    std::vector<TimedPoint> points;
    for (int i = 0; i < 30; ++i) {
        points.push_back(pointAt({40.7128, -74.0060}, 0.0, 0.01 * i, 1500000000 + i * 60));
    }
    const auto result = VisitSearch(config_, eventBus_).run(points);

    EXPECT_EQ(result.candidateCount, 0u);
    EXPECT_TRUE(result.visits.empty());
}

TEST_F(VisitSearchTest, TargetNearPoleFails) {
    config_.target = {89.999, 10.0};
    config_.thresholdKm = 50.0;
    const VisitSearch search(config_, eventBus_);
    EXPECT_THROW(search.run({}), TooCloseToPoleOrMeridian);
}

TEST_F(VisitSearchTest, BoxUsesMarginedRadius) {
    const auto result = VisitSearch(config_, eventBus_).run({});
    const double north = Geo::distanceKm(config_.target, {result.box.northEast.lat, config_.target.lon});
    EXPECT_NEAR(north, config_.thresholdKm * config_.boxMargin, 0.0001);
}

TEST_F(VisitSearchTest, BoxIsSolvedWithoutAnyPoints) {
    config_.target = {0.0, 179.9999};
    config_.thresholdKm = 5.0;
    const VisitSearch search(config_, eventBus_);
    EXPECT_THROW(search.solveBox(), TooCloseToPoleOrMeridian);
}

TEST_F(VisitSearchTest, PresolvedBoxGivesSameResult) {
    const auto points = day();
    const VisitSearch search(config_, eventBus_);
    const BoundingBox box = search.solveBox();

    const auto direct = search.run(points);
    const auto presolved = search.run(points, box);

    EXPECT_EQ(presolved.box.northEast, direct.box.northEast);
    EXPECT_EQ(presolved.box.southWest, direct.box.southWest);
    EXPECT_EQ(presolved.candidateCount, direct.candidateCount);
    EXPECT_EQ(presolved.visits, direct.visits);
}
