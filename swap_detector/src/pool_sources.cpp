#include "pool_sources.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace {

nlohmann::json get_json(HttpClient& http, const std::string& url) {
    auto response = http.get(url);
    if (response.status != 200) {
        throw std::runtime_error("HTTP " + std::to_string(response.status) + " from " + url);
    }
    return nlohmann::json::parse(response.body);
}

double nested_number(const nlohmann::json& obj, const char* outer, const char* inner) {
    if (!obj.contains(outer) || !obj[outer].is_object()) return 0.0;
    const auto& o = obj[outer];
    if (!o.contains(inner) || !o[inner].is_number()) return 0.0;
    return o[inner].get<double>();
}

std::string nested_string(const nlohmann::json& obj, const char* outer, const char* inner) {
    if (!obj.contains(outer) || !obj[outer].is_object()) return "";
    const auto& o = obj[outer];
    if (!o.contains(inner) || !o[inner].is_string()) return "";
    return o[inner].get<std::string>();
}

std::string string_or(const nlohmann::json& obj, const char* key, const std::string& fallback) {
    if (obj.contains(key) && obj[key].is_string() && !obj[key].get<std::string>().empty()) {
        return obj[key].get<std::string>();
    }
    return fallback;
}

int int_or(const nlohmann::json& obj, const char* key, int fallback) {
    if (obj.contains(key) && obj[key].is_number_integer() && obj[key].get<int>() > 0) {
        return obj[key].get<int>();
    }
    return fallback;
}

bool has_label(const nlohmann::json& labels, const std::string& label) {
    if (!labels.is_array()) return false;
    for (const auto& l : labels) {
        if (l.is_string() && util::iequals(l.get<std::string>(), label)) return true;
    }
    return false;
}

} // namespace

// ---------------------------------------------------------------------------
// Raydium
// ---------------------------------------------------------------------------

RaydiumPoolSource::RaydiumPoolSource(const std::string& api_base, std::shared_ptr<HttpClient> http)
    : api_base_(api_base), http_(http) {}

std::optional<PoolRecord> RaydiumPoolSource::lookup(const std::string& token_mint) {
    std::string url = api_base_ + "/ammV3/ammPools?mintA=" + token_mint +
                      "&mintB=" + mints::NATIVE_SOL;

    auto body = get_json(*http_, url);
    if (!body.contains("data") || !body["data"].is_array() || body["data"].empty()) {
        return std::nullopt;
    }

    const auto& pool = body["data"][0];
    std::string id = string_or(pool, "id", "");
    if (id.empty()) {
        throw std::runtime_error("Raydium pool entry has no id");
    }

    PoolRecord record;
    record.token_mint = token_mint;
    record.pool_address = id;
    record.base_mint = string_or(pool, "baseMint", string_or(pool, "mintA", token_mint));
    record.quote_mint = string_or(pool, "quoteMint", string_or(pool, "mintB", mints::NATIVE_SOL));
    record.base_decimals = int_or(pool, "baseDecimals", int_or(pool, "mintDecimalsA", 6));
    record.quote_decimals = int_or(pool, "quoteDecimals", int_or(pool, "mintDecimalsB", 9));
    record.program_id = string_or(pool, "programId", "");
    record.source = name();
    return record;
}

// ---------------------------------------------------------------------------
// DexScreener
// ---------------------------------------------------------------------------

DexScreenerPoolSource::DexScreenerPoolSource(const std::string& api_base,
                                             std::shared_ptr<HttpClient> http,
                                             double min_liquidity_usd)
    : api_base_(api_base), http_(http), min_liquidity_usd_(min_liquidity_usd) {}

std::string DexScreenerPoolSource::program_for_dex(const std::string& dex_id,
                                                   const nlohmann::json& labels) {
    auto dex = util::to_lower(dex_id);
    if (dex == "raydium") {
        if (has_label(labels, "CPMM")) return programs::RAYDIUM_CPMM;
        if (has_label(labels, "CLMM")) return "";
        return programs::RAYDIUM_AMM_V4;
    }
    if (dex == "meteora") {
        if (has_label(labels, "DYN") || has_label(labels, "DYN2")) return "";
        return programs::METEORA_DLMM;
    }
    if (dex == "orca") {
        return programs::ORCA_WHIRLPOOL;
    }
    return "";
}

std::optional<PoolRecord> DexScreenerPoolSource::select_pair(const std::string& token_mint,
                                                             const nlohmann::json& pairs) const {
    std::optional<PoolRecord> best;
    double best_liquidity = -1.0;

    if (!pairs.is_array()) return best;

    for (const auto& pair : pairs) {
        if (!pair.is_object()) continue;

        auto chain = string_or(pair, "chainId", "solana");
        if (chain != "solana") continue;

        auto program = program_for_dex(string_or(pair, "dexId", ""),
                                       pair.contains("labels") ? pair["labels"] : nlohmann::json());
        if (program.empty()) continue;

        auto base = nested_string(pair, "baseToken", "address");
        auto quote = nested_string(pair, "quoteToken", "address");
        bool token_is_base = base == token_mint && quote == mints::NATIVE_SOL;
        bool token_is_quote = quote == token_mint && base == mints::NATIVE_SOL;
        if (!token_is_base && !token_is_quote) continue;

        double liquidity = nested_number(pair, "liquidity", "usd");
        if (liquidity < min_liquidity_usd_) continue;

        if (nested_number(pair, "volume", "h24") <= 0.0) continue;

        double txns_24h = 0.0;
        if (pair.contains("txns") && pair["txns"].is_object()) {
            txns_24h = nested_number(pair["txns"], "h24", "buys") +
                       nested_number(pair["txns"], "h24", "sells");
        }
        if (txns_24h <= 0.0) continue;

        auto address = string_or(pair, "pairAddress", "");
        if (address.empty()) continue;

        if (liquidity > best_liquidity) {
            PoolRecord record;
            record.token_mint = token_mint;
            record.pool_address = address;
            record.base_mint = base;
            record.quote_mint = quote;
            record.base_decimals = token_is_base ? 6 : 9;
            record.quote_decimals = token_is_base ? 9 : 6;
            record.program_id = program;
            record.source = name();
            best = record;
            best_liquidity = liquidity;
        }
    }

    if (best) {
        spdlog::debug("DexScreener picked {} (liq ${:.0f})", util::short_addr(best->pool_address), best_liquidity);
    }
    return best;
}

std::optional<PoolRecord> DexScreenerPoolSource::lookup(const std::string& token_mint) {
    auto body = get_json(*http_, api_base_ + "/tokens/" + token_mint);
    if (!body.contains("pairs") || body["pairs"].is_null()) {
        return std::nullopt;
    }
    return select_pair(token_mint, body["pairs"]);
}

// ---------------------------------------------------------------------------
// On-chain
// ---------------------------------------------------------------------------

OnChainPoolSource::OnChainPoolSource(std::shared_ptr<RpcClient> rpc)
    : rpc_(rpc) {}

std::optional<PoolRecord> OnChainPoolSource::lookup(const std::string& token_mint) {
    PoolRecord record;
    record.token_mint = token_mint;
    record.program_id = programs::RAYDIUM_AMM_V4;
    record.source = name();

    // Token as base, SOL as quote
    auto accounts = rpc_->get_program_accounts(
        programs::RAYDIUM_AMM_V4, AMM_V4_STATE_SIZE,
        {{AMM_V4_BASE_MINT_OFFSET, token_mint}, {AMM_V4_QUOTE_MINT_OFFSET, mints::NATIVE_SOL}});
    if (!accounts.empty()) {
        record.pool_address = accounts.front();
        record.base_mint = token_mint;
        record.quote_mint = mints::NATIVE_SOL;
        record.base_decimals = 6;
        record.quote_decimals = 9;
        return record;
    }

    // SOL as base, token as quote
    accounts = rpc_->get_program_accounts(
        programs::RAYDIUM_AMM_V4, AMM_V4_STATE_SIZE,
        {{AMM_V4_BASE_MINT_OFFSET, mints::NATIVE_SOL}, {AMM_V4_QUOTE_MINT_OFFSET, token_mint}});
    if (!accounts.empty()) {
        record.pool_address = accounts.front();
        record.base_mint = mints::NATIVE_SOL;
        record.quote_mint = token_mint;
        record.base_decimals = 9;
        record.quote_decimals = 6;
        return record;
    }

    return std::nullopt;
}
