#pragma once

#include <chrono>
#include <string>
#include <vector>

struct ClassifierSettings {
    double vault_multiplier = 50.0;
    double token_dust_floor = 0.01;
    double sol_materiality_floor = 0.001;
    double min_trade_sol = 0.0001;
};

struct ConnectionSettings {
    std::chrono::milliseconds health_check_interval{30'000};
    std::chrono::milliseconds max_inactivity{120'000};
    std::chrono::milliseconds reconnect_base{1'000};
    std::chrono::milliseconds reconnect_max{30'000};
    int max_reconnect_attempts = 10;
    std::string subscribe_commitment = "processed";
};

struct LocatorSettings {
    std::chrono::milliseconds cache_ttl{5 * 60 * 1000};
    double min_liquidity_usd = 50.0;
};

struct PipelineSettings {
    std::string fetch_commitment = "confirmed";
    size_t dedup_capacity = 1000;
    std::vector<std::string> extra_log_patterns;
};
