#pragma once

#include "events.hpp"
#include <string>
#include <memory>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus {
public:
    RedisBus(const std::string& redis_url,
             const std::string& stream_trades,
             const std::string& stream_diagnostics);

    // Trades go to the trade stream, everything else to diagnostics
    void publish_event(const EngineEvent& event);
    void publish(const std::string& stream, const nlohmann::json& data);
    bool ping();

    static nlohmann::json to_json(const EngineEvent& event);

private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string stream_trades_;
    std::string stream_diagnostics_;
};
