#include "types.hpp"

std::string to_string(TradeSide side) {
    return side == TradeSide::Buy ? "buy" : "sell";
}

std::string to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Subscribing: return "subscribing";
        case ConnectionState::Subscribed: return "subscribed";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Failed: return "failed";
    }
    return "unknown";
}
