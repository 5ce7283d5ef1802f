#pragma once

#include "events.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <cstdint>

// Typed publish/subscribe over EngineEvent.
//
// Handlers run on the publishing thread, outside the emitter lock, so a
// handler may subscribe or unsubscribe. A handler that throws is logged and
// skipped; the remaining handlers still receive the event.
class TradeEventEmitter {
public:
    using Handler = std::function<void(const EngineEvent&)>;
    using SubscriptionId = uint64_t;

    // Receive every event
    SubscriptionId subscribe(Handler handler);

    // Receive only events of type E
    template <typename E>
    SubscriptionId on(std::function<void(const E&)> handler) {
        return subscribe([handler = std::move(handler)](const EngineEvent& event) {
            if (const auto* typed = std::get_if<E>(&event)) {
                handler(*typed);
            }
        });
    }

    void unsubscribe(SubscriptionId id);
    void publish(const EngineEvent& event);
    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_ = 1;
};
