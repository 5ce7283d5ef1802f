#include "event_emitter.hpp"
#include <spdlog/spdlog.h>
#include <vector>

std::string to_string(HeartbeatReason reason) {
    switch (reason) {
        case HeartbeatReason::TokenNotInTransaction: return "token_not_in_transaction";
        case HeartbeatReason::TokenMismatch: return "token_mismatch";
        case HeartbeatReason::NoTokenFound: return "no_token_found";
    }
    return "unknown";
}

namespace {

struct EventNamer {
    std::string operator()(const ConnectedEvent&) const { return "connected"; }
    std::string operator()(const DisconnectedEvent&) const { return "disconnected"; }
    std::string operator()(const TradeEvent&) const { return "trade"; }
    std::string operator()(const ErrorEvent&) const { return "error"; }
    std::string operator()(const ConnectionStaleEvent&) const { return "connection_stale"; }
    std::string operator()(const HeartbeatEvent&) const { return "heartbeat"; }
    std::string operator()(const MaxReconnectAttemptsEvent&) const { return "max-reconnect-attempts"; }
};

} // namespace

std::string event_name(const EngineEvent& event) {
    return std::visit(EventNamer{}, event);
}

TradeEventEmitter::SubscriptionId TradeEventEmitter::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void TradeEventEmitter::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

void TradeEventEmitter::publish(const EngineEvent& event) {
    std::vector<Handler> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(handlers_.size());
        for (const auto& [id, handler] : handlers_) {
            snapshot.push_back(handler);
        }
    }

    for (const auto& handler : snapshot) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            spdlog::error("Handler for '{}' event threw: {}", event_name(event), e.what());
        }
    }
}

size_t TradeEventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}
