#pragma once

#include "../ScanEvent.hpp"
#include <functional>

namespace visits::ports {

class IEventBus {
public:
    virtual ~IEventBus() = default;

    using Handler = std::function<void(const ScanEvent&)>;

    virtual void publish(const ScanEvent& event) = 0;
    virtual void subscribe(EventType eventType, Handler handler) = 0;
    virtual void unsubscribe(EventType eventType) = 0;
    virtual void processEvents() = 0;
};

} // namespace visits::ports
