#include "solana_rpc_client.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>

SolanaRpcClient::SolanaRpcClient(const std::vector<std::string>& rpc_urls,
                                 std::shared_ptr<HttpClient> http)
    : rpc_urls_(rpc_urls)
    , http_(http)
    , current_index_(0)
    , next_request_id_(1)
{
    if (rpc_urls_.empty()) {
        throw std::invalid_argument("SolanaRpcClient needs at least one RPC URL");
    }
}

std::string SolanaRpcClient::current_endpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rpc_urls_[current_index_];
}

void SolanaRpcClient::rotate(size_t failed_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Another caller may already have moved on from this endpoint
    if (current_index_ != failed_index) return;
    current_index_ = (current_index_ + 1) % rpc_urls_.size();
    spdlog::warn("Rotated to RPC endpoint: {}", rpc_urls_[current_index_]);
}

nlohmann::json SolanaRpcClient::call(const std::string& method, const nlohmann::json& params) {
    std::string last_error;

    for (size_t attempt = 0; attempt < rpc_urls_.size(); ++attempt) {
        size_t index;
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            index = current_index_;
            id = next_request_id_++;
        }

        nlohmann::json payload = {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", method},
            {"params", params}
        };

        HttpResponse response;
        try {
            response = http_->post_json(rpc_urls_[index], payload.dump());
        } catch (const HttpError& e) {
            last_error = e.what();
            spdlog::warn("RPC {} failed on {}: {}", method, rpc_urls_[index], e.what());
            rotate(index);
            continue;
        }

        if (response.status != 200) {
            last_error = "HTTP " + std::to_string(response.status);
            spdlog::warn("RPC {} returned HTTP {} from {}", method, response.status, rpc_urls_[index]);
            rotate(index);
            continue;
        }

        nlohmann::json body;
        try {
            body = nlohmann::json::parse(response.body);
        } catch (const std::exception& e) {
            last_error = std::string("parse error: ") + e.what();
            spdlog::warn("Failed to parse RPC response from {}: {}", rpc_urls_[index], e.what());
            rotate(index);
            continue;
        }

        if (body.contains("error") && !body["error"].is_null()) {
            throw RpcError(method + ": " + body["error"].dump());
        }
        if (!body.contains("result")) {
            throw RpcError(method + ": response has no result");
        }
        return body["result"];
    }

    throw RpcError(method + " failed on all endpoints: " + last_error);
}

namespace {

double parse_ui_amount(const nlohmann::json& ui_token_amount) {
    if (ui_token_amount.contains("uiAmountString") && ui_token_amount["uiAmountString"].is_string()) {
        return std::stod(ui_token_amount["uiAmountString"].get<std::string>());
    }
    if (ui_token_amount.contains("amount") && ui_token_amount["amount"].is_string()) {
        double raw = std::stod(ui_token_amount["amount"].get<std::string>());
        int decimals = ui_token_amount.value("decimals", 0);
        return raw / std::pow(10.0, decimals);
    }
    if (ui_token_amount.contains("uiAmount") && ui_token_amount["uiAmount"].is_number()) {
        return ui_token_amount["uiAmount"].get<double>();
    }
    return 0.0;
}

std::vector<TokenBalance> parse_token_balances(const nlohmann::json& meta, const char* field) {
    std::vector<TokenBalance> balances;
    if (!meta.contains(field) || !meta[field].is_array()) return balances;

    for (const auto& entry : meta[field]) {
        TokenBalance b;
        b.account_index = entry.value("accountIndex", 0);
        b.mint = entry.value("mint", "");
        b.owner = entry.contains("owner") && entry["owner"].is_string()
            ? entry["owner"].get<std::string>() : "";
        b.ui_amount = entry.contains("uiTokenAmount") ? parse_ui_amount(entry["uiTokenAmount"]) : 0.0;
        balances.push_back(b);
    }
    return balances;
}

std::vector<uint64_t> parse_lamports(const nlohmann::json& meta, const char* field) {
    std::vector<uint64_t> out;
    if (!meta.contains(field) || !meta[field].is_array()) return out;
    for (const auto& v : meta[field]) {
        out.push_back(v.get<uint64_t>());
    }
    return out;
}

} // namespace

ParsedTransaction SolanaRpcClient::parse_transaction(const std::string& signature,
                                                     const nlohmann::json& result) {
    ParsedTransaction tx;
    tx.signature = signature;
    tx.slot = result.value("slot", uint64_t{0});
    if (result.contains("blockTime") && result["blockTime"].is_number_integer()) {
        tx.block_time = result["blockTime"].get<int64_t>();
    }

    const auto& message = result.at("transaction").at("message");
    for (const auto& key : message.at("accountKeys")) {
        AccountKey ak;
        if (key.is_string()) {
            // Non-parsed encoding: bare pubkeys, flags unknown
            ak.pubkey = key.get<std::string>();
        } else {
            ak.pubkey = key.value("pubkey", "");
            ak.signer = key.value("signer", false);
            ak.writable = key.value("writable", false);
        }
        tx.account_keys.push_back(ak);
    }

    if (result.contains("meta") && result["meta"].is_object()) {
        const auto& meta = result["meta"];
        if (meta.contains("err") && !meta["err"].is_null()) {
            tx.failed = true;
            tx.error = meta["err"].dump();
        }
        tx.pre_balances = parse_lamports(meta, "preBalances");
        tx.post_balances = parse_lamports(meta, "postBalances");
        tx.pre_token_balances = parse_token_balances(meta, "preTokenBalances");
        tx.post_token_balances = parse_token_balances(meta, "postTokenBalances");
        if (meta.contains("logMessages") && meta["logMessages"].is_array()) {
            tx.log_messages = meta["logMessages"].get<std::vector<std::string>>();
        }
    }

    return tx;
}

std::optional<ParsedTransaction> SolanaRpcClient::get_parsed_transaction(
    const std::string& signature, const std::string& commitment) {

    nlohmann::json params = nlohmann::json::array({
        signature,
        {
            {"encoding", "jsonParsed"},
            {"commitment", commitment},
            {"maxSupportedTransactionVersion", 0}
        }
    });

    auto result = call("getTransaction", params);
    if (result.is_null()) {
        return std::nullopt;
    }

    try {
        return parse_transaction(signature, result);
    } catch (const std::exception& e) {
        throw RpcError("Malformed transaction " + util::short_addr(signature) + ": " + e.what());
    }
}

std::vector<std::string> SolanaRpcClient::get_program_accounts(
    const std::string& program_id, size_t data_size,
    const std::vector<MemcmpFilter>& filters) {

    nlohmann::json filter_json = nlohmann::json::array();
    filter_json.push_back(nlohmann::json{{"dataSize", data_size}});
    for (const auto& f : filters) {
        filter_json.push_back(nlohmann::json{{"memcmp", {{"offset", f.offset}, {"bytes", f.bytes}}}});
    }

    nlohmann::json params = nlohmann::json::array({
        program_id,
        {
            {"encoding", "base64"},
            {"dataSlice", {{"offset", 0}, {"length", 0}}},
            {"filters", filter_json}
        }
    });

    auto result = call("getProgramAccounts", params);

    std::vector<std::string> pubkeys;
    if (!result.is_array()) return pubkeys;
    for (const auto& account : result) {
        if (account.contains("pubkey") && account["pubkey"].is_string()) {
            pubkeys.push_back(account["pubkey"].get<std::string>());
        }
    }
    return pubkeys;
}

bool SolanaRpcClient::is_healthy() {
    try {
        auto result = call("getHealth", nlohmann::json::array());
        return result.is_string() && result.get<std::string>() == "ok";
    } catch (const std::exception& e) {
        spdlog::debug("RPC health check failed: {}", e.what());
        return false;
    }
}
