#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.rpc_urls = util::split(get_env("SOLANA_RPC_URLS", "https://api.mainnet-beta.solana.com"), ',');
    cfg.ws_url = get_env("SOLANA_WS_URL", "wss://api.mainnet-beta.solana.com");
    cfg.subscribe_commitment = get_env("SUBSCRIBE_COMMITMENT", "processed");
    cfg.fetch_commitment = get_env("FETCH_COMMITMENT", "confirmed");

    cfg.raydium_api_base = get_env("RAYDIUM_API_BASE", "https://api.raydium.io/v2");
    cfg.dexscreener_api_base = get_env("DEXSCREENER_API_BASE", "https://api.dexscreener.com/latest/dex");
    cfg.request_timeout_ms = get_env_int("REQUEST_TIMEOUT_MS", 8000);

    cfg.track_tokens = util::split(get_env("TRACK_TOKENS"), ',');

    cfg.redis_url = get_env("REDIS_URL", "redis://localhost:6379");
    cfg.stream_trades = get_env("STREAM_TRADES", "soul.swaps.trades");
    cfg.stream_diagnostics = get_env("STREAM_DIAGNOSTICS", "soul.swaps.diagnostics");

    cfg.health_check_interval_sec = get_env_int("HEALTH_CHECK_INTERVAL_SEC", 30);
    cfg.max_inactivity_sec = get_env_int("MAX_INACTIVITY_SEC", 120);
    cfg.reconnect_base_ms = get_env_int("RECONNECT_BASE_MS", 1000);
    cfg.reconnect_max_ms = get_env_int("RECONNECT_MAX_MS", 30000);
    cfg.max_reconnect_attempts = get_env_int("MAX_RECONNECT_ATTEMPTS", 10);

    cfg.pool_cache_ttl_sec = get_env_int("POOL_CACHE_TTL_SEC", 300);
    cfg.min_liquidity_usd = get_env_double("MIN_LIQUIDITY_USD", 50.0);

    cfg.vault_multiplier = get_env_double("VAULT_MULTIPLIER", 50.0);
    cfg.token_dust_floor = get_env_double("TOKEN_DUST_FLOOR", 0.01);
    cfg.sol_materiality_floor = get_env_double("SOL_MATERIALITY_FLOOR", 0.001);
    cfg.min_trade_sol = get_env_double("MIN_TRADE_SOL", 0.0001);

    cfg.dedup_capacity = get_env_int("DEDUP_CAPACITY", 1000);
    cfg.pipeline_workers = get_env_int("PIPELINE_WORKERS", 4);
    cfg.extra_log_patterns = util::split(get_env("EXTRA_LOG_PATTERNS"), ',');

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "swapwatch");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    if (rpc_urls.empty()) {
        throw std::runtime_error("SOLANA_RPC_URLS is required");
    }
    if (ws_url.rfind("wss://", 0) != 0) {
        throw std::runtime_error("SOLANA_WS_URL must be a wss:// URL");
    }
    if (health_check_interval_sec <= 0 || max_inactivity_sec <= 0) {
        throw std::runtime_error("Health check interval and max inactivity must be positive");
    }
    if (max_inactivity_sec <= health_check_interval_sec) {
        throw std::runtime_error("MAX_INACTIVITY_SEC must exceed HEALTH_CHECK_INTERVAL_SEC");
    }
    if (reconnect_base_ms <= 0 || reconnect_max_ms < reconnect_base_ms) {
        throw std::runtime_error("Invalid reconnect backoff bounds");
    }
    if (max_reconnect_attempts <= 0) {
        throw std::runtime_error("MAX_RECONNECT_ATTEMPTS must be positive");
    }
    if (dedup_capacity <= 0 || pipeline_workers <= 0) {
        throw std::runtime_error("DEDUP_CAPACITY and PIPELINE_WORKERS must be positive");
    }
    if (vault_multiplier <= 1.0) {
        throw std::runtime_error("VAULT_MULTIPLIER must be greater than 1");
    }
    for (const auto& mint : track_tokens) {
        if (!util::is_valid_solana_address(mint)) {
            throw std::runtime_error("Invalid mint in TRACK_TOKENS: " + mint);
        }
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  RPC endpoints: {}", rpc_urls.size());
    spdlog::info("  Health check: every {}s, stale after {}s",
                 health_check_interval_sec, max_inactivity_sec);
    spdlog::info("  Reconnect: {}ms..{}ms, max {} attempts",
                 reconnect_base_ms, reconnect_max_ms, max_reconnect_attempts);
}

ClassifierSettings Config::classifier_settings() const {
    ClassifierSettings s;
    s.vault_multiplier = vault_multiplier;
    s.token_dust_floor = token_dust_floor;
    s.sol_materiality_floor = sol_materiality_floor;
    s.min_trade_sol = min_trade_sol;
    return s;
}

ConnectionSettings Config::connection_settings() const {
    ConnectionSettings s;
    s.health_check_interval = std::chrono::seconds(health_check_interval_sec);
    s.max_inactivity = std::chrono::seconds(max_inactivity_sec);
    s.reconnect_base = std::chrono::milliseconds(reconnect_base_ms);
    s.reconnect_max = std::chrono::milliseconds(reconnect_max_ms);
    s.max_reconnect_attempts = max_reconnect_attempts;
    s.subscribe_commitment = subscribe_commitment;
    return s;
}

LocatorSettings Config::locator_settings() const {
    LocatorSettings s;
    s.cache_ttl = std::chrono::seconds(pool_cache_ttl_sec);
    s.min_liquidity_usd = min_liquidity_usd;
    return s;
}

PipelineSettings Config::pipeline_settings() const {
    PipelineSettings s;
    s.fetch_commitment = fetch_commitment;
    s.dedup_capacity = static_cast<size_t>(dedup_capacity);
    s.extra_log_patterns = extra_log_patterns;
    return s;
}
