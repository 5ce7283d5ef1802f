#pragma once

#include "settings.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

enum class RejectReason {
    FailedTransaction,
    PoolNotReferenced,
    TokenNotInTransaction,
    TokenMismatch,          // tracked mint referenced, but only other mints moved
    NoTokenDelta,
    BelowThreshold
};

std::string to_string(RejectReason reason);

struct Classification {
    std::optional<TradeEvent> trade;
    RejectReason reason = RejectReason::NoTokenDelta;   // meaningful only without a trade

    bool is_trade() const { return trade.has_value(); }
};

// Decides from balance deltas alone whether a transaction is a swap of the
// tracked token through the tracked pool, and which way it went.
//
// Token side: user token accounts are preferred; the pool vault (an account
// holding `vault_multiplier` times more than the next-largest, or owned by the
// pool) is ignored unless nothing else moved, in which case its delta is used
// with the direction inverted.
//
// SOL side: the user's wallet delta if the token-account owner signed into the
// transaction, otherwise the delta whose direction matches the token side,
// otherwise the largest. When token and SOL directions disagree the token
// direction wins.
class SwapClassifier {
public:
    explicit SwapClassifier(ClassifierSettings settings = {});

    // observed_at (unix seconds) stamps the trade when the node gave no block time
    Classification classify(const ParsedTransaction& tx,
                            const PoolRecord& pool,
                            int64_t observed_at) const;

    const ClassifierSettings& settings() const { return settings_; }

private:
    struct TokenAccountDelta {
        int account_index = 0;
        std::string owner;
        double pre = 0.0;
        double post = 0.0;
        bool has_pre = false;
        bool has_post = false;

        double change() const;
        double max_balance() const;
        bool increased() const { return post > pre; }
    };

    struct SolDelta {
        size_t index = 0;
        uint64_t change_lamports = 0;
        bool decreased = false;
    };

    struct TokenSignal {
        double amount = 0.0;
        bool increased = false;
        std::string owner;
        bool from_vault = false;
    };

    std::vector<TokenAccountDelta> merge_token_balances(const ParsedTransaction& tx,
                                                        const std::string& mint) const;
    std::optional<TokenSignal> user_token_signal(const std::vector<TokenAccountDelta>& deltas,
                                                 const PoolRecord& pool,
                                                 std::vector<const TokenAccountDelta*>& vaults) const;
    std::optional<TokenSignal> vault_fallback_signal(
        const std::vector<const TokenAccountDelta*>& vaults) const;
    std::vector<SolDelta> material_sol_deltas(const ParsedTransaction& tx) const;

    ClassifierSettings settings_;
};
