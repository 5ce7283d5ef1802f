#pragma once

#include "rpc_client.hpp"
#include "signature_set.hpp"
#include <memory>
#include <optional>
#include <string>

enum class FetchStatus {
    Fetched,
    Duplicate,     // seen before, no network call made
    NotFound,      // node returned null
    Failed,        // transaction errored on-chain
    Unavailable    // RPC transport or protocol failure
};

std::string to_string(FetchStatus status);

struct FetchResult {
    FetchStatus status = FetchStatus::Unavailable;
    std::optional<ParsedTransaction> tx;
};

// Dedup-then-fetch. Every outcome other than Fetched is final for that
// signature: nothing is retried.
class TransactionFetcher {
public:
    TransactionFetcher(std::shared_ptr<RpcClient> rpc,
                       size_t dedup_capacity = 1000,
                       std::string commitment = "confirmed");

    FetchResult fetch(const std::string& signature);

    // Forget seen signatures
    void reset();
    size_t processed_count() const;

private:
    std::shared_ptr<RpcClient> rpc_;
    ProcessedSignatureSet processed_;
    std::string commitment_;
};
