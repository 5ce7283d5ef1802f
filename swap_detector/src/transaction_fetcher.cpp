#include "transaction_fetcher.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

std::string to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::Fetched: return "fetched";
        case FetchStatus::Duplicate: return "duplicate";
        case FetchStatus::NotFound: return "not_found";
        case FetchStatus::Failed: return "failed";
        case FetchStatus::Unavailable: return "unavailable";
    }
    return "unknown";
}

TransactionFetcher::TransactionFetcher(std::shared_ptr<RpcClient> rpc,
                                       size_t dedup_capacity,
                                       std::string commitment)
    : rpc_(rpc)
    , processed_(dedup_capacity)
    , commitment_(std::move(commitment))
{}

FetchResult TransactionFetcher::fetch(const std::string& signature) {
    FetchResult result;

    if (!processed_.insert_if_absent(signature)) {
        result.status = FetchStatus::Duplicate;
        return result;
    }

    try {
        auto tx = rpc_->get_parsed_transaction(signature, commitment_);
        if (!tx) {
            spdlog::debug("Transaction {} not found at {}", util::short_addr(signature), commitment_);
            result.status = FetchStatus::NotFound;
            return result;
        }
        if (tx->failed) {
            spdlog::debug("Transaction {} failed on-chain: {}", util::short_addr(signature), tx->error);
            result.status = FetchStatus::Failed;
            return result;
        }

        result.status = FetchStatus::Fetched;
        result.tx = std::move(tx);

    } catch (const std::exception& e) {
        spdlog::debug("Transaction {} unavailable: {}", util::short_addr(signature), e.what());
        result.status = FetchStatus::Unavailable;
    }

    return result;
}

void TransactionFetcher::reset() {
    processed_.clear();
}

size_t TransactionFetcher::processed_count() const {
    return processed_.size();
}
