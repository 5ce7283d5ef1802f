#include "swap_classifier.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <unordered_map>

std::string to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::FailedTransaction: return "failed_transaction";
        case RejectReason::PoolNotReferenced: return "pool_not_referenced";
        case RejectReason::TokenNotInTransaction: return "token_not_in_transaction";
        case RejectReason::TokenMismatch: return "token_mismatch";
        case RejectReason::NoTokenDelta: return "no_token_delta";
        case RejectReason::BelowThreshold: return "below_threshold";
    }
    return "unknown";
}

double SwapClassifier::TokenAccountDelta::change() const {
    return std::fabs(post - pre);
}

double SwapClassifier::TokenAccountDelta::max_balance() const {
    return std::max(pre, post);
}

SwapClassifier::SwapClassifier(ClassifierSettings settings)
    : settings_(settings) {}

namespace {

Classification reject(RejectReason reason) {
    Classification c;
    c.reason = reason;
    return c;
}

bool has_key(const ParsedTransaction& tx, const std::string& pubkey) {
    return std::any_of(tx.account_keys.begin(), tx.account_keys.end(),
                       [&](const AccountKey& k) { return k.pubkey == pubkey; });
}

bool has_balance_for(const std::vector<TokenBalance>& balances, const std::string& mint) {
    return std::any_of(balances.begin(), balances.end(),
                       [&](const TokenBalance& b) { return b.mint == mint; });
}

bool has_other_mint(const ParsedTransaction& tx, const std::string& mint) {
    auto other = [&](const TokenBalance& b) { return b.mint != mint; };
    return std::any_of(tx.pre_token_balances.begin(), tx.pre_token_balances.end(), other) ||
           std::any_of(tx.post_token_balances.begin(), tx.post_token_balances.end(), other);
}

} // namespace

std::vector<SwapClassifier::TokenAccountDelta> SwapClassifier::merge_token_balances(
    const ParsedTransaction& tx, const std::string& mint) const {

    std::vector<TokenAccountDelta> deltas;
    std::unordered_map<int, size_t> by_index;

    for (const auto& b : tx.pre_token_balances) {
        if (b.mint != mint) continue;
        TokenAccountDelta d;
        d.account_index = b.account_index;
        d.owner = b.owner;
        d.pre = b.ui_amount;
        d.has_pre = true;
        by_index[b.account_index] = deltas.size();
        deltas.push_back(d);
    }

    for (const auto& b : tx.post_token_balances) {
        if (b.mint != mint) continue;
        auto it = by_index.find(b.account_index);
        if (it != by_index.end()) {
            auto& d = deltas[it->second];
            d.post = b.ui_amount;
            d.has_post = true;
            if (d.owner.empty()) d.owner = b.owner;
        } else {
            // Created in this transaction
            TokenAccountDelta d;
            d.account_index = b.account_index;
            d.owner = b.owner;
            d.post = b.ui_amount;
            d.has_post = true;
            by_index[b.account_index] = deltas.size();
            deltas.push_back(d);
        }
    }

    return deltas;
}

std::optional<SwapClassifier::TokenSignal> SwapClassifier::user_token_signal(
    const std::vector<TokenAccountDelta>& deltas,
    const PoolRecord& pool,
    std::vector<const TokenAccountDelta*>& vaults) const {

    int vault_index = -1;
    if (deltas.size() >= 2) {
        std::vector<const TokenAccountDelta*> by_size;
        for (const auto& d : deltas) by_size.push_back(&d);
        std::stable_sort(by_size.begin(), by_size.end(),
            [](const TokenAccountDelta* a, const TokenAccountDelta* b) {
                return a->max_balance() > b->max_balance();
            });

        if (by_size[0]->max_balance() > by_size[1]->max_balance() * settings_.vault_multiplier) {
            vault_index = by_size[0]->account_index;
        }
    }

    std::optional<TokenSignal> best;
    for (const auto& d : deltas) {
        if (d.owner == pool.pool_address || d.account_index == vault_index) {
            vaults.push_back(&d);
            continue;
        }
        if (d.change() < settings_.token_dust_floor) continue;

        if (!best || d.change() > best->amount) {
            TokenSignal s;
            s.amount = d.change();
            s.increased = d.increased();
            s.owner = d.owner;
            best = s;
        }
    }
    return best;
}

std::optional<SwapClassifier::TokenSignal> SwapClassifier::vault_fallback_signal(
    const std::vector<const TokenAccountDelta*>& vaults) const {

    const TokenAccountDelta* smallest = nullptr;
    for (const auto* v : vaults) {
        if (!v->has_pre || !v->has_post || v->change() <= 0.0) continue;
        if (!smallest || v->pre < smallest->pre) {
            smallest = v;
        }
    }
    if (!smallest) return std::nullopt;

    // The pool moves opposite to the trader
    TokenSignal s;
    s.amount = smallest->change();
    s.increased = !smallest->increased();
    s.from_vault = true;
    return s;
}

std::vector<SwapClassifier::SolDelta> SwapClassifier::material_sol_deltas(
    const ParsedTransaction& tx) const {

    auto floor_lamports = static_cast<uint64_t>(std::llround(settings_.sol_materiality_floor * LAMPORTS_PER_SOL));
    size_t n = std::min(tx.pre_balances.size(), tx.post_balances.size());

    std::vector<SolDelta> deltas;
    for (size_t i = 0; i < n; ++i) {
        uint64_t pre = tx.pre_balances[i];
        uint64_t post = tx.post_balances[i];
        // Created or closed accounts carry rent, not trade value
        if (pre == 0 || post == 0) continue;

        uint64_t change = post > pre ? post - pre : pre - post;
        if (change < floor_lamports) continue;

        SolDelta d;
        d.index = i;
        d.change_lamports = change;
        d.decreased = post < pre;
        deltas.push_back(d);
    }

    std::stable_sort(deltas.begin(), deltas.end(),
        [](const SolDelta& a, const SolDelta& b) { return a.change_lamports > b.change_lamports; });
    return deltas;
}

Classification SwapClassifier::classify(const ParsedTransaction& tx,
                                        const PoolRecord& pool,
                                        int64_t observed_at) const {
    const auto& mint = pool.token_mint;

    if (tx.failed) {
        return reject(RejectReason::FailedTransaction);
    }

    // Step A: relevance
    if (!has_key(tx, pool.pool_address)) {
        return reject(RejectReason::PoolNotReferenced);
    }
    bool mint_referenced = has_key(tx, mint) ||
                           has_balance_for(tx.pre_token_balances, mint) ||
                           has_balance_for(tx.post_token_balances, mint);
    if (!mint_referenced) {
        return reject(RejectReason::TokenNotInTransaction);
    }

    // Step B: token delta
    auto deltas = merge_token_balances(tx, mint);
    std::vector<const TokenAccountDelta*> vaults;
    auto token = user_token_signal(deltas, pool, vaults);
    if (!token) {
        token = vault_fallback_signal(vaults);
        if (token) {
            spdlog::debug("{}: no user token account moved, using inverted vault delta",
                          util::short_addr(tx.signature));
        }
    }
    if (!token) {
        if (deltas.empty() && has_other_mint(tx, mint)) {
            return reject(RejectReason::TokenMismatch);
        }
        return reject(RejectReason::NoTokenDelta);
    }

    // Step C: SOL delta
    auto sol = material_sol_deltas(tx);
    std::optional<SolDelta> chosen;

    if (!token->from_vault && !token->owner.empty()) {
        for (const auto& d : sol) {
            if (d.index < tx.account_keys.size() && tx.account_keys[d.index].pubkey == token->owner) {
                chosen = d;
                break;
            }
        }
    }
    if (!chosen && !sol.empty()) {
        // Tokens in means SOL out
        for (const auto& d : sol) {
            if (d.decreased == token->increased) {
                chosen = d;
                break;
            }
        }
        if (!chosen) chosen = sol.front();
    }

    // Step D: cross-validation
    bool is_buy = token->increased;
    bool disagreed = false;
    if (chosen) {
        bool agree = chosen->decreased == token->increased;
        if (agree) {
            is_buy = chosen->decreased;
        } else {
            disagreed = true;
            spdlog::debug("{}: token and SOL directions disagree, trusting token side",
                          util::short_addr(tx.signature));
        }
    }

    // Step E: thresholds
    double sol_amount = chosen ? static_cast<double>(chosen->change_lamports) / LAMPORTS_PER_SOL : 0.0;
    double token_amount = token->amount;
    if (!(sol_amount > settings_.min_trade_sol) || !(token_amount > 0.0)) {
        return reject(RejectReason::BelowThreshold);
    }

    TradeEvent trade;
    trade.pool_address = pool.pool_address;
    trade.token_mint = mint;
    trade.sol_amount = sol_amount;
    trade.token_amount = token_amount;
    trade.side = is_buy ? TradeSide::Buy : TradeSide::Sell;
    trade.signature = tx.signature;
    trade.timestamp = tx.block_time ? *tx.block_time : observed_at;
    trade.price = sol_amount / token_amount;
    trade.used_vault_fallback = token->from_vault;
    trade.signals_disagreed = disagreed;

    if (!token->from_vault && !token->owner.empty()) {
        trade.user = token->owner;
    } else if (chosen && chosen->index < tx.account_keys.size()) {
        trade.user = tx.account_keys[chosen->index].pubkey;
    } else {
        auto signer = std::find_if(tx.account_keys.begin(), tx.account_keys.end(),
                                   [](const AccountKey& k) { return k.signer; });
        trade.user = signer != tx.account_keys.end() ? signer->pubkey : "unknown";
    }

    Classification result;
    result.trade = trade;
    return result;
}
