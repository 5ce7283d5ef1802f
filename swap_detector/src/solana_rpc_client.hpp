#pragma once

#include "rpc_client.hpp"
#include "http_client.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <vector>
#include <string>

class SolanaRpcClient : public RpcClient {
public:
    SolanaRpcClient(const std::vector<std::string>& rpc_urls, std::shared_ptr<HttpClient> http);

    std::optional<ParsedTransaction> get_parsed_transaction(
        const std::string& signature, const std::string& commitment) override;

    std::vector<std::string> get_program_accounts(
        const std::string& program_id, size_t data_size,
        const std::vector<MemcmpFilter>& filters) override;

    bool is_healthy() override;

    std::string current_endpoint() const;

    // Maps a jsonParsed getTransaction result into ParsedTransaction.
    static ParsedTransaction parse_transaction(const std::string& signature,
                                               const nlohmann::json& result);

private:
    std::vector<std::string> rpc_urls_;
    std::shared_ptr<HttpClient> http_;
    mutable std::mutex mutex_;
    size_t current_index_;
    uint64_t next_request_id_;

    // Returns the "result" member. Rotates endpoints on transport failure.
    nlohmann::json call(const std::string& method, const nlohmann::json& params);
    void rotate(size_t failed_index);
};
