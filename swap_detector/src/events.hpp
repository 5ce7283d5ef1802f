#pragma once

#include "types.hpp"
#include <string>
#include <variant>
#include <vector>

struct ConnectedEvent {
    std::string pool_address;
    std::string token_mint;
};

struct DisconnectedEvent {
    std::string pool_address;
};

struct ErrorEvent {
    std::string message;
};

struct ConnectionStaleEvent {
    int64_t seconds_since_activity = 0;
    std::vector<std::string> monitored_tokens;
};

enum class HeartbeatReason {
    TokenNotInTransaction,
    TokenMismatch,
    NoTokenFound
};

std::string to_string(HeartbeatReason reason);

// Transaction was fetched and inspected but produced no trade
struct HeartbeatEvent {
    std::string signature;
    HeartbeatReason reason = HeartbeatReason::NoTokenFound;
    std::string expected_mint;
};

struct MaxReconnectAttemptsEvent {
    int attempts = 0;
};

using EngineEvent = std::variant<
    ConnectedEvent,
    DisconnectedEvent,
    TradeEvent,
    ErrorEvent,
    ConnectionStaleEvent,
    HeartbeatEvent,
    MaxReconnectAttemptsEvent>;

// Wire name used on the diagnostics stream and in logs
std::string event_name(const EngineEvent& event);
