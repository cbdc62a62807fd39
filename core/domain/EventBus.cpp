#include "EventBus.hpp"
#include <exception>
#include <iostream>
#include <utility>

namespace visits::domain {

void EventBus::publish(const ScanEvent& event) {
    if (handlers_.count(event.eventType) == 0) {
        return;
    }
    pending_.push_back(event);
}

void EventBus::subscribe(EventType eventType, Handler handler) {
    handlers_[eventType].push_back(std::move(handler));
}

void EventBus::unsubscribe(EventType eventType) {
    handlers_.erase(eventType);
}

void EventBus::processEvents() {
    // A scan publishes everything before the first dispatch; events raised by
    // handlers land in pending_ and go out with the next batch.
    while (!pending_.empty()) {
        std::vector<ScanEvent> batch;
        batch.swap(pending_);
        for (const auto& event : batch) {
            dispatch(event);
        }
    }
}

void EventBus::dispatch(const ScanEvent& event) {
    const auto it = handlers_.find(event.eventType);
    if (it == handlers_.end()) {
        return;
    }
    for (const auto& handler : it->second) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            ++failedDeliveries_;
            std::cerr << "[Events] " << eventTypeToString(event.eventType) << " at index "
                      << event.index << " not delivered: " << e.what() << std::endl;
        }
    }
}

} // namespace visits::domain
