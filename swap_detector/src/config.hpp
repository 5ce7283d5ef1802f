#pragma once

#include "settings.hpp"
#include <string>
#include <vector>
#include <cstdlib>

struct Config {
    // Solana
    std::vector<std::string> rpc_urls;
    std::string ws_url;
    std::string subscribe_commitment;
    std::string fetch_commitment;

    // Pool metadata APIs
    std::string raydium_api_base;
    std::string dexscreener_api_base;
    int request_timeout_ms;

    // Tokens to watch at startup (comma separated mints)
    std::vector<std::string> track_tokens;

    // Redis
    std::string redis_url;
    std::string stream_trades;
    std::string stream_diagnostics;

    // Connection lifecycle
    int health_check_interval_sec;
    int max_inactivity_sec;
    int reconnect_base_ms;
    int reconnect_max_ms;
    int max_reconnect_attempts;

    // Pool discovery
    int pool_cache_ttl_sec;
    double min_liquidity_usd;

    // Classifier
    double vault_multiplier;
    double token_dust_floor;
    double sol_materiality_floor;
    double min_trade_sol;

    // Pipeline
    int dedup_capacity;
    int pipeline_workers;
    std::vector<std::string> extra_log_patterns;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;

    ClassifierSettings classifier_settings() const;
    ConnectionSettings connection_settings() const;
    LocatorSettings locator_settings() const;
    PipelineSettings pipeline_settings() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
