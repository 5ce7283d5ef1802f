#include <catch2/catch_test_macros.hpp>
#include "../src/config.hpp"
#include <stdlib.h>
#include <stdexcept>

namespace {

const char* const CONFIG_VARS[] = {
    "SOLANA_RPC_URLS", "SOLANA_WS_URL", "TRACK_TOKENS", "HEALTH_CHECK_INTERVAL_SEC",
    "MAX_INACTIVITY_SEC", "RECONNECT_BASE_MS", "RECONNECT_MAX_MS", "MAX_RECONNECT_ATTEMPTS",
    "VAULT_MULTIPLIER", "DEDUP_CAPACITY", "PIPELINE_WORKERS", "EXTRA_LOG_PATTERNS",
    "POOL_CACHE_TTL_SEC", "SUBSCRIBE_COMMITMENT", "FETCH_COMMITMENT"
};

void clear_env() {
    for (const char* name : CONFIG_VARS) unsetenv(name);
}

}

TEST_CASE("Config from environment", "[config]") {
    clear_env();

    SECTION("Defaults are valid") {
        auto cfg = Config::from_env();
        REQUIRE(cfg.rpc_urls.size() == 1);
        REQUIRE(cfg.ws_url == "wss://api.mainnet-beta.solana.com");
        REQUIRE(cfg.track_tokens.empty());
        REQUIRE(cfg.stream_trades == "soul.swaps.trades");
        REQUIRE_NOTHROW(cfg.validate());

        auto conn = cfg.connection_settings();
        REQUIRE(conn.health_check_interval == std::chrono::seconds(30));
        REQUIRE(conn.max_inactivity == std::chrono::seconds(120));
        REQUIRE(conn.reconnect_base == std::chrono::milliseconds(1000));
        REQUIRE(conn.reconnect_max == std::chrono::milliseconds(30000));
        REQUIRE(conn.max_reconnect_attempts == 10);
        REQUIRE(conn.subscribe_commitment == "processed");

        REQUIRE(cfg.locator_settings().cache_ttl == std::chrono::minutes(5));
        REQUIRE(cfg.pipeline_settings().fetch_commitment == "confirmed");
        REQUIRE(cfg.pipeline_settings().dedup_capacity == 1000);
        REQUIRE(cfg.classifier_settings().vault_multiplier == 50.0);
    }

    SECTION("Lists are comma separated") {
        setenv("SOLANA_RPC_URLS", "https://a.example, https://b.example", 1);
        setenv("TRACK_TOKENS", "EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v", 1);
        setenv("EXTRA_LOG_PATTERNS", "Instruction: Route,Instruction: SharedAccountsRoute", 1);

        auto cfg = Config::from_env();
        REQUIRE(cfg.rpc_urls.size() == 2);
        REQUIRE(cfg.rpc_urls[1] == "https://b.example");
        REQUIRE(cfg.track_tokens.size() == 1);
        REQUIRE(cfg.extra_log_patterns.size() == 2);
        REQUIRE_NOTHROW(cfg.validate());
    }

    SECTION("Unparseable numbers fall back to defaults") {
        setenv("MAX_RECONNECT_ATTEMPTS", "lots", 1);
        auto cfg = Config::from_env();
        REQUIRE(cfg.max_reconnect_attempts == 10);
    }

    SECTION("Inactivity window must exceed the check interval") {
        setenv("HEALTH_CHECK_INTERVAL_SEC", "60", 1);
        setenv("MAX_INACTIVITY_SEC", "60", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
    }

    SECTION("Plain ws:// is rejected") {
        setenv("SOLANA_WS_URL", "ws://api.mainnet-beta.solana.com", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
    }

    SECTION("Invalid tracked mints are rejected") {
        setenv("TRACK_TOKENS", "not-a-mint", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
    }

    SECTION("Backoff bounds must be ordered") {
        setenv("RECONNECT_BASE_MS", "5000", 1);
        setenv("RECONNECT_MAX_MS", "1000", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
    }

    SECTION("Vault multiplier must exceed one") {
        setenv("VAULT_MULTIPLIER", "1", 1);
        REQUIRE_THROWS_AS(Config::from_env().validate(), std::runtime_error);
    }

    clear_env();
}
