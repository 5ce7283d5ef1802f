#include <catch2/catch_test_macros.hpp>
#include "../src/pool_locator.hpp"
#include "../src/pool_sources.hpp"
#include "../src/errors.hpp"
#include "fakes.hpp"

using namespace fixtures;

namespace {

const std::string RAYDIUM = "https://raydium.test";
const std::string DEXSCREENER = "https://dexscreener.test";
const std::string SOL = mints::NATIVE_SOL;

std::string raydium_body(const std::string& pool_id) {
    nlohmann::json body = {
        {"success", true},
        {"data", nlohmann::json::array({
            {{"id", pool_id}, {"mintA", TOKEN_MINT}, {"mintB", SOL},
             {"mintDecimalsA", 6}, {"mintDecimalsB", 9},
             {"programId", programs::RAYDIUM_AMM_V4}}
        })}
    };
    return body.dump();
}

nlohmann::json dex_pair(const std::string& address, const std::string& dex, double liquidity,
                    const std::string& base = TOKEN_MINT, const std::string& quote = SOL) {
    return {
        {"chainId", "solana"},
        {"dexId", dex},
        {"pairAddress", address},
        {"baseToken", {{"address", base}}},
        {"quoteToken", {{"address", quote}}},
        {"liquidity", {{"usd", liquidity}}},
        {"volume", {{"h24", 1500.0}}},
        {"txns", {{"h24", {{"buys", 12}, {"sells", 9}}}}}
    };
}

struct LocatorFixture {
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    std::shared_ptr<FakeRpcClient> rpc = std::make_shared<FakeRpcClient>();
    std::shared_ptr<ManualScheduler> clock = std::make_shared<ManualScheduler>();
    PoolLocator locator{
        {std::make_shared<RaydiumPoolSource>(RAYDIUM, http),
         std::make_shared<DexScreenerPoolSource>(DEXSCREENER, http, 50.0),
         std::make_shared<OnChainPoolSource>(rpc)},
        clock,
        LocatorSettings{}};
};

}

TEST_CASE("Pool resolution across tiers", "[locator]") {
    LocatorFixture f;

    SECTION("Raydium hit is returned and cached") {
        f.http->respond(RAYDIUM, 200, raydium_body(POOL));

        auto pool = f.locator.resolve(TOKEN_MINT);
        REQUIRE(pool.pool_address == POOL);
        REQUIRE(pool.base_mint == TOKEN_MINT);
        REQUIRE(pool.quote_mint == SOL);
        REQUIRE(pool.source == "raydium-api");

        // Second lookup inside the TTL makes no network call
        f.clock->advance(std::chrono::minutes(4));
        REQUIRE(f.locator.resolve(TOKEN_MINT).pool_address == POOL);
        REQUIRE(f.http->calls() == 1);
        REQUIRE(f.http->requests[0].first.find("mintB=" + SOL) != std::string::npos);
    }

    SECTION("Expired entries are fetched again") {
        f.http->respond(RAYDIUM, 200, raydium_body(POOL));
        f.locator.resolve(TOKEN_MINT);

        f.clock->advance(std::chrono::minutes(5));
        REQUIRE_FALSE(f.locator.cached(TOKEN_MINT).has_value());
        f.locator.resolve(TOKEN_MINT);
        REQUIRE(f.http->calls() == 2);
    }

    SECTION("Failing tier falls through to DexScreener") {
        f.http->fail(RAYDIUM);
        nlohmann::json body = {{"pairs", nlohmann::json::array({dex_pair(POOL, "raydium", 25000.0)})}};
        f.http->respond(DEXSCREENER, 200, body.dump());

        auto pool = f.locator.resolve(TOKEN_MINT);
        REQUIRE(pool.pool_address == POOL);
        REQUIRE(pool.source == "dexscreener");
        REQUIRE(pool.program_id == programs::RAYDIUM_AMM_V4);
    }

    SECTION("Empty API results fall through to the on-chain scan") {
        f.http->respond(RAYDIUM, 200, R"({"success":true,"data":[]})");
        f.http->respond(DEXSCREENER, 200, R"({"pairs":null})");

        f.rpc->program_accounts = [](const std::string& program, size_t size,
                                     const std::vector<MemcmpFilter>& filters) {
            std::vector<std::string> found;
            // Pool lists SOL as base and the token as quote
            if (program == programs::RAYDIUM_AMM_V4 && size == 752 && filters.size() == 2 &&
                filters[0].offset == 400 && filters[0].bytes == mints::NATIVE_SOL &&
                filters[1].offset == 432 && filters[1].bytes == TOKEN_MINT) {
                found.push_back(POOL);
            }
            return found;
        };

        auto pool = f.locator.resolve(TOKEN_MINT);
        REQUIRE(pool.pool_address == POOL);
        REQUIRE(pool.source == "on-chain");
        REQUIRE(pool.base_mint == SOL);
        REQUIRE(pool.quote_mint == TOKEN_MINT);
        REQUIRE(f.rpc->program_account_calls == 2);
    }

    SECTION("No tier knows the token") {
        f.http->fail(RAYDIUM);
        f.http->respond(DEXSCREENER, 500, "oops");

        try {
            f.locator.resolve(TOKEN_MINT);
            FAIL("expected PoolNotFoundError");
        } catch (const PoolNotFoundError& e) {
            REQUIRE(e.token_mint() == TOKEN_MINT);
            std::vector<std::string> expected{"raydium-api", "dexscreener", "on-chain"};
            REQUIRE(e.tiers_attempted() == expected);
        }
        REQUIRE(f.locator.cache_size() == 0);
    }

    SECTION("Invalidate and clear_expired drop entries") {
        f.http->respond(RAYDIUM, 200, raydium_body(POOL));
        f.locator.resolve(TOKEN_MINT);
        REQUIRE(f.locator.cache_size() == 1);

        f.locator.invalidate(TOKEN_MINT);
        REQUIRE(f.locator.cache_size() == 0);

        f.locator.resolve(TOKEN_MINT);
        f.clock->advance(std::chrono::minutes(6));
        f.locator.clear_expired();
        REQUIRE(f.locator.cache_size() == 0);
    }
}

TEST_CASE("DexScreener pair selection", "[locator]") {
    DexScreenerPoolSource source(DEXSCREENER, std::make_shared<FakeHttpClient>(), 50.0);

    SECTION("Highest liquidity SOL pair wins") {
        auto pairs = nlohmann::json::array({
            dex_pair("PoolSmall111111111111111111111111111111111", "orca", 900.0),
            dex_pair("PoolBig11111111111111111111111111111111111", "meteora", 40000.0),
            dex_pair("PoolUsdc1111111111111111111111111111111111", "raydium", 90000.0, TOKEN_MINT, OTHER_MINT)
        });

        auto pool = source.select_pair(TOKEN_MINT, pairs);
        REQUIRE(pool.has_value());
        REQUIRE(pool->pool_address == "PoolBig11111111111111111111111111111111111");
        REQUIRE(pool->program_id == programs::METEORA_DLMM);
    }

    SECTION("Token on the quote side swaps the decimals") {
        auto pool = source.select_pair(TOKEN_MINT, nlohmann::json::array({
            dex_pair(POOL, "raydium", 1000.0, SOL, TOKEN_MINT)
        }));
        REQUIRE(pool.has_value());
        REQUIRE(pool->base_mint == SOL);
        REQUIRE(pool->base_decimals == 9);
        REQUIRE(pool->quote_decimals == 6);
    }

    SECTION("Quality gates") {
        auto thin = dex_pair(POOL, "raydium", 10.0);
        auto dead = dex_pair(POOL, "raydium", 1000.0);
        dead["volume"]["h24"] = 0;
        auto no_trades = dex_pair(POOL, "raydium", 1000.0);
        no_trades["txns"]["h24"] = {{"buys", 0}, {"sells", 0}};
        auto other_chain = dex_pair(POOL, "raydium", 1000.0);
        other_chain["chainId"] = "ethereum";
        auto unsupported = dex_pair(POOL, "pumpswap", 1000.0);

        auto pairs = nlohmann::json::array({thin, dead, no_trades, other_chain, unsupported});
        REQUIRE_FALSE(source.select_pair(TOKEN_MINT, pairs).has_value());
    }

    SECTION("Dex and label mapping") {
        auto none = nlohmann::json::array();
        REQUIRE(DexScreenerPoolSource::program_for_dex("raydium", none) == programs::RAYDIUM_AMM_V4);
        REQUIRE(DexScreenerPoolSource::program_for_dex("raydium", nlohmann::json::array({"CPMM"})) == programs::RAYDIUM_CPMM);
        REQUIRE(DexScreenerPoolSource::program_for_dex("raydium", nlohmann::json::array({"CLMM"})).empty());
        REQUIRE(DexScreenerPoolSource::program_for_dex("meteora", nlohmann::json::array({"DLMM"})) == programs::METEORA_DLMM);
        REQUIRE(DexScreenerPoolSource::program_for_dex("meteora", nlohmann::json::array({"DYN"})).empty());
        REQUIRE(DexScreenerPoolSource::program_for_dex("orca", none) == programs::ORCA_WHIRLPOOL);
        REQUIRE(DexScreenerPoolSource::program_for_dex("pumpswap", none).empty());
    }
}
