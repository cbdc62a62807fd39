#pragma once

#include "../ports/IEventBus.hpp"
#include <cstddef>
#include <unordered_map>
#include <vector>

namespace visits::domain {

/**
 * @brief Collects scan events and hands them to subscribers in publish order
 *
 * Events of a type nobody subscribed to are dropped at publish. A handler
 * that throws is logged and counted; the remaining handlers still run.
 */
class EventBus : public ports::IEventBus {
public:
    EventBus() = default;
    ~EventBus() override = default;

    void publish(const ScanEvent& event) override;
    void subscribe(EventType eventType, Handler handler) override;
    void unsubscribe(EventType eventType) override;
    void processEvents() override;

    size_t pending() const { return pending_.size(); }
    size_t failedDeliveries() const { return failedDeliveries_; }

private:
    void dispatch(const ScanEvent& event);

    std::unordered_map<EventType, std::vector<Handler>> handlers_;
    std::vector<ScanEvent> pending_;
    size_t failedDeliveries_ = 0;
};

} // namespace visits::domain
