#pragma once

#include "../ports/IEventBus.hpp"
#include <ostream>

namespace visits::adapters {

// Renders scan events as text. Per-point and dropped-run lines only when verbose.
class ConsoleReporter {
public:
    ConsoleReporter(std::ostream& out, bool verbose);

    void attach(ports::IEventBus& eventBus);

    void onVisitFound(const ScanEvent& event);
    void onVisitDropped(const ScanEvent& event);
    void onPointInside(const ScanEvent& event);
    void onPointSkipped(const ScanEvent& event);

    int visitsReported() const { return visitsReported_; }

private:
    std::ostream& out_;
    bool verbose_;
    int visitsReported_ = 0;
};

} // namespace visits::adapters
