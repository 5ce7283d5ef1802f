#pragma once

#include "redis_bus.hpp"
#include "rpc_client.hpp"
#include "swap_detector.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <vector>

class HealthCheck {
public:
    HealthCheck(std::vector<std::shared_ptr<SwapDetector>> detectors,
                std::shared_ptr<RedisBus> redis,
                std::shared_ptr<RpcClient> rpc);

    nlohmann::json get_status();
    std::vector<std::string> monitored_tokens() const;

private:
    std::vector<std::shared_ptr<SwapDetector>> detectors_;
    std::shared_ptr<RedisBus> redis_;
    std::shared_ptr<RpcClient> rpc_;
};
