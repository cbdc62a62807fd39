#include <gtest/gtest.h>
#include "../core/domain/EventBus.hpp"
#include "../core/adapters/ConsoleReporter.hpp"
#include "../core/TimeFormat.hpp"
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace visits;

namespace {

ScanEvent visitEvent(EventType type, int64_t start, int64_t end, int total, int maxConsecutive) {
    ScanEvent event;
    event.eventType = type;
    event.visit.start = fromEpochSeconds(start);
    event.visit.end = fromEpochSeconds(end);
    event.visit.totalInside = total;
    event.visit.maxConsecutiveInside = maxConsecutive;
    event.time = event.visit.start;
    return event;
}

} // namespace

TEST(EventBusTest, DispatchesOnlyToSubscribers) {
    domain::EventBus bus;
    int found = 0;
    int inside = 0;
    bus.subscribe(EventType::VisitFound, [&](const ScanEvent&) { found++; });
    bus.subscribe(EventType::PointInside, [&](const ScanEvent&) { inside++; });

    ScanEvent e;
    e.eventType = EventType::VisitFound;
    bus.publish(e);
    e.eventType = EventType::PointInside;
    bus.publish(e);
    bus.publish(e);

    EXPECT_EQ(found, 0); // queued until processed
    bus.processEvents();
    EXPECT_EQ(found, 1);
    EXPECT_EQ(inside, 2);
}

TEST(EventBusTest, EventsWithoutSubscribersAreNotQueued) {
    domain::EventBus bus;
    ScanEvent e;
    e.eventType = EventType::PointSkipped;
    bus.publish(e);
    EXPECT_EQ(bus.pending(), 0u);
}

TEST(EventBusTest, FailingHandlerDoesNotStopOthers) {
    domain::EventBus bus;
    int calls = 0;
    bus.subscribe(EventType::VisitFound, [](const ScanEvent&) { throw std::runtime_error("boom"); });
    bus.subscribe(EventType::VisitFound, [&](const ScanEvent&) { calls++; });

    ScanEvent e;
    e.eventType = EventType::VisitFound;
    bus.publish(e);
    bus.processEvents();
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(bus.failedDeliveries(), 1u);
}

TEST(EventBusTest, DeliversInPublishOrderAcrossTypes) {
    domain::EventBus bus;
    std::vector<size_t> seen;
    const auto record = [&](const ScanEvent& event) { seen.push_back(event.index); };
    bus.subscribe(EventType::PointInside, record);
    bus.subscribe(EventType::VisitFound, record);

    const EventType types[] = {EventType::PointInside, EventType::VisitFound,
                               EventType::PointInside, EventType::VisitFound};
    for (size_t i = 0; i < 4; ++i) {
        ScanEvent e;
        e.eventType = types[i];
        e.index = i;
        bus.publish(e);
    }
    bus.processEvents();
    EXPECT_EQ(seen, (std::vector<size_t>{0, 1, 2, 3}));
    EXPECT_EQ(bus.pending(), 0u);
}

TEST(EventBusTest, EventsPublishedByHandlersGoOutInSamePass) {
    domain::EventBus bus;
    std::vector<size_t> dropped;
    bus.subscribe(EventType::VisitDropped, [&](const ScanEvent& event) { dropped.push_back(event.index); });
    bus.subscribe(EventType::PointSkipped, [&](const ScanEvent& event) {
        ScanEvent follow;
        follow.eventType = EventType::VisitDropped;
        follow.index = event.index + 100;
        bus.publish(follow);
    });

    ScanEvent e;
    e.eventType = EventType::PointSkipped;
    e.index = 1;
    bus.publish(e);
    e.eventType = EventType::VisitDropped;
    e.index = 2;
    bus.publish(e);
    bus.processEvents();

    EXPECT_EQ(dropped, (std::vector<size_t>{2, 101}));
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    domain::EventBus bus;
    int calls = 0;
    bus.subscribe(EventType::VisitDropped, [&](const ScanEvent&) { calls++; });
    bus.unsubscribe(EventType::VisitDropped);

    ScanEvent e;
    e.eventType = EventType::VisitDropped;
    bus.publish(e);
    bus.processEvents();
    EXPECT_EQ(calls, 0);
}

TEST(ConsoleReporterTest, RendersVisits) {
    std::ostringstream out;
    domain::EventBus bus;
    adapters::ConsoleReporter reporter(out, false);
    reporter.attach(bus);

    bus.publish(visitEvent(EventType::VisitFound, 1500000000, 1500003723, 15, 12));
    bus.publish(visitEvent(EventType::VisitDropped, 1500000000, 1500000300, 5, 5));
    bus.processEvents();

    EXPECT_EQ(out.str(),
              "Visited for 1h2m3s starting at 2017-07-14 02:40:00 UTC (15 pinpoints / 12 max consecutive)\n");
    EXPECT_EQ(reporter.visitsReported(), 1);
}

TEST(ConsoleReporterTest, VerboseAddsDebugLines) {
    std::ostringstream out;
    domain::EventBus bus;
    adapters::ConsoleReporter reporter(out, true);
    reporter.attach(bus);

    ScanEvent inside;
    inside.eventType = EventType::PointInside;
    inside.time = fromEpochSeconds(1500000000);
    inside.distanceKm = 0.0123;
    bus.publish(inside);

    ScanEvent skipped;
    skipped.eventType = EventType::PointSkipped;
    skipped.index = 7;
    skipped.time = fromEpochSeconds(1500000060);
    skipped.reason = "no convergence";
    bus.publish(skipped);

    bus.publish(visitEvent(EventType::VisitDropped, 1500000000, 1500000300, 5, 5));
    bus.processEvents();

    EXPECT_EQ(out.str(),
              "Distance 12m at 2017-07-14 02:40:00 UTC\n"
              "Skipping point 7 at 2017-07-14 02:41:00 UTC: no convergence\n"
              "Dropped visit for 5m0s starting at 2017-07-14 02:40:00 UTC (5 pinpoints / 5 max consecutive)\n");
}

TEST(TimeFormatTest, Durations) {
    EXPECT_EQ(formatDuration(std::chrono::seconds(0)), "0s");
    EXPECT_EQ(formatDuration(std::chrono::seconds(12)), "12s");
    EXPECT_EQ(formatDuration(std::chrono::seconds(2700)), "45m0s");
    EXPECT_EQ(formatDuration(std::chrono::seconds(3600)), "1h0m0s");
    EXPECT_EQ(formatDuration(std::chrono::seconds(90061)), "25h1m1s");
}

TEST(TimeFormatTest, IsoRoundTrip) {
    const auto t = parseIso8601("2017-07-14T02:40:00Z");
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(formatUtc(*t), "2017-07-14 02:40:00 UTC");
    EXPECT_FALSE(parseIso8601("2017-07-14 02:40:00").has_value());
}
