#pragma once

#include "types.hpp"
#include "http_client.hpp"
#include "rpc_client.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

// One discovery tier. lookup() returns nullopt when the source has no
// SOL-paired pool for the mint and throws when the source itself failed.
class PoolSource {
public:
    virtual ~PoolSource() = default;

    virtual std::string name() const = 0;
    virtual std::optional<PoolRecord> lookup(const std::string& token_mint) = 0;
};

// Tier 1: Raydium pool API, filtered server-side to the SOL pair.
class RaydiumPoolSource : public PoolSource {
public:
    RaydiumPoolSource(const std::string& api_base, std::shared_ptr<HttpClient> http);

    std::string name() const override { return "raydium-api"; }
    std::optional<PoolRecord> lookup(const std::string& token_mint) override;

private:
    std::string api_base_;
    std::shared_ptr<HttpClient> http_;
};

// Tier 2: DexScreener multi-DEX pairs, quality-filtered.
class DexScreenerPoolSource : public PoolSource {
public:
    DexScreenerPoolSource(const std::string& api_base,
                          std::shared_ptr<HttpClient> http,
                          double min_liquidity_usd = 50.0);

    std::string name() const override { return "dexscreener"; }
    std::optional<PoolRecord> lookup(const std::string& token_mint) override;

    // Program id for a DexScreener dexId and labels, empty when unsupported
    static std::string program_for_dex(const std::string& dex_id, const nlohmann::json& labels);

    // Highest-liquidity pair passing every quality gate
    std::optional<PoolRecord> select_pair(const std::string& token_mint,
                                          const nlohmann::json& pairs) const;

private:
    std::string api_base_;
    std::shared_ptr<HttpClient> http_;
    double min_liquidity_usd_;
};

// Tier 3: scan Raydium AMM v4 pool-state accounts for the mint.
class OnChainPoolSource : public PoolSource {
public:
    static constexpr size_t AMM_V4_STATE_SIZE = 752;
    static constexpr size_t AMM_V4_BASE_MINT_OFFSET = 400;
    static constexpr size_t AMM_V4_QUOTE_MINT_OFFSET = 432;

    explicit OnChainPoolSource(std::shared_ptr<RpcClient> rpc);

    std::string name() const override { return "on-chain"; }
    std::optional<PoolRecord> lookup(const std::string& token_mint) override;

private:
    std::shared_ptr<RpcClient> rpc_;
};
