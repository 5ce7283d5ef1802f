#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Transport-level HTTP failure (connection refused, timeout, TLS).
class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what) : std::runtime_error(what) {}
};

// JSON-RPC call failed on every endpoint, or the node returned an error object.
class RpcError : public std::runtime_error {
public:
    explicit RpcError(const std::string& what) : std::runtime_error(what) {}
};

class SubscriptionError : public std::runtime_error {
public:
    explicit SubscriptionError(const std::string& what) : std::runtime_error(what) {}
};

class PoolNotFoundError : public std::runtime_error {
public:
    PoolNotFoundError(const std::string& token_mint, std::vector<std::string> tiers)
        : std::runtime_error(make_message(token_mint, tiers))
        , token_mint_(token_mint)
        , tiers_(std::move(tiers)) {}

    const std::string& token_mint() const { return token_mint_; }
    const std::vector<std::string>& tiers_attempted() const { return tiers_; }

private:
    std::string token_mint_;
    std::vector<std::string> tiers_;

    static std::string make_message(const std::string& token_mint,
                                    const std::vector<std::string>& tiers) {
        std::string msg = "No pool found for " + token_mint + " (tried: ";
        for (size_t i = 0; i < tiers.size(); ++i) {
            if (i > 0) msg += ", ";
            msg += tiers[i];
        }
        return msg + ")";
    }
};
