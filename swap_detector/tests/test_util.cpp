#include <catch2/catch_test_macros.hpp>
#include "../src/util.hpp"
#include <stdexcept>

TEST_CASE("String helpers", "[util]") {
    SECTION("split trims and drops empty fields") {
        auto parts = util::split(" a, b ,,c ", ',');
        REQUIRE(parts.size() == 3);
        REQUIRE(parts[0] == "a");
        REQUIRE(parts[1] == "b");
        REQUIRE(parts[2] == "c");
        REQUIRE(util::split("", ',').empty());
    }

    SECTION("short_addr keeps head and tail") {
        REQUIRE(util::short_addr("58oQChx4yWmvKdwLLZzBi4ChoCc2fqCUWBkwMihLYQo2") == "58oQCh...YQo2");
        REQUIRE(util::short_addr("short") == "short");
    }

    SECTION("iequals ignores case") {
        REQUIRE(util::iequals("AbC", "aBc"));
        REQUIRE_FALSE(util::iequals("abc", "abcd"));
        REQUIRE_FALSE(util::iequals("abc", "abd"));
    }
}

TEST_CASE("Solana address validation", "[util]") {
    REQUIRE(util::is_valid_solana_address("So11111111111111111111111111111111111111112"));
    REQUIRE(util::is_valid_solana_address("EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v"));

    REQUIRE_FALSE(util::is_valid_solana_address("tooshort"));
    // 0, O, I and l are not in the base58 alphabet
    REQUIRE_FALSE(util::is_valid_solana_address("0o11111111111111111111111111111111111111112"));
    REQUIRE_FALSE(util::is_valid_solana_address("So1111111111111111111111111111111111111111I"));
}

TEST_CASE("URL parsing", "[util]") {
    SECTION("wss defaults to port 443") {
        auto url = util::parse_url("wss://api.mainnet-beta.solana.com");
        REQUIRE(url.scheme == "wss");
        REQUIRE(url.host == "api.mainnet-beta.solana.com");
        REQUIRE(url.port == "443");
        REQUIRE(url.target == "/");
    }

    SECTION("Explicit port and path are kept") {
        auto url = util::parse_url("ws://localhost:8900/rpc?api-key=abc");
        REQUIRE(url.scheme == "ws");
        REQUIRE(url.host == "localhost");
        REQUIRE(url.port == "8900");
        REQUIRE(url.target == "/rpc?api-key=abc");
    }

    SECTION("Malformed URLs throw") {
        REQUIRE_THROWS_AS(util::parse_url("api.mainnet-beta.solana.com"), std::invalid_argument);
        REQUIRE_THROWS_AS(util::parse_url("wss://"), std::invalid_argument);
        REQUIRE_THROWS_AS(util::parse_url("wss://host:abc/"), std::invalid_argument);
    }
}
