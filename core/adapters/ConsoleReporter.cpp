#include "ConsoleReporter.hpp"
#include "../TimeFormat.hpp"
#include <cmath>

namespace visits::adapters {

namespace {

void writeVisit(std::ostream& out, const char* prefix, const VisitRecord& visit) {
    out << prefix << " for " << formatDuration(visit.duration())
        << " starting at " << formatUtc(visit.start)
        << " (" << visit.totalInside << " pinpoints / "
        << visit.maxConsecutiveInside << " max consecutive)" << std::endl;
}

} // namespace

ConsoleReporter::ConsoleReporter(std::ostream& out, bool verbose)
    : out_(out)
    , verbose_(verbose) {
}

void ConsoleReporter::attach(ports::IEventBus& eventBus) {
    eventBus.subscribe(EventType::VisitFound, [this](const ScanEvent& e) { onVisitFound(e); });
    if (!verbose_) {
        return;
    }
    eventBus.subscribe(EventType::VisitDropped, [this](const ScanEvent& e) { onVisitDropped(e); });
    eventBus.subscribe(EventType::PointInside, [this](const ScanEvent& e) { onPointInside(e); });
    eventBus.subscribe(EventType::PointSkipped, [this](const ScanEvent& e) { onPointSkipped(e); });
}

void ConsoleReporter::onVisitFound(const ScanEvent& event) {
    writeVisit(out_, "Visited", event.visit);
    ++visitsReported_;
}

void ConsoleReporter::onVisitDropped(const ScanEvent& event) {
    writeVisit(out_, "Dropped visit", event.visit);
}

void ConsoleReporter::onPointInside(const ScanEvent& event) {
    out_ << "Distance " << std::lround(event.distanceKm * 1000) << "m at "
         << formatUtc(event.time) << std::endl;
}

void ConsoleReporter::onPointSkipped(const ScanEvent& event) {
    out_ << "Skipping point " << event.index << " at " << formatUtc(event.time)
         << ": " << event.reason << std::endl;
}

} // namespace visits::adapters
