#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace mints {
    constexpr const char* NATIVE_SOL = "So11111111111111111111111111111111111111112";
}

namespace programs {
    constexpr const char* RAYDIUM_AMM_V4 = "675kPX9MHTjS2zt1qfr1NYHuzeLXfQM9H24wFSUt1Mp8";
    constexpr const char* RAYDIUM_CPMM = "CPMMoo8L3F4NbTegBCKVNunggL7H1ZpdTHKxQB5qKP1C";
    constexpr const char* METEORA_DLMM = "LBUZKhRxPF3XUpBCjp4YzTKgLccjZhTSDM9YuVaPwxo";
    constexpr const char* ORCA_WHIRLPOOL = "whirLbMiicVdio4qvUfM5KAg6Ct8VwpYzGff3uctyCc";
}

constexpr double LAMPORTS_PER_SOL = 1'000'000'000.0;

struct PoolRecord {
    std::string token_mint;
    std::string pool_address;
    std::string base_mint;
    std::string quote_mint;
    int base_decimals = 6;
    int quote_decimals = 9;
    std::string program_id;
    std::string source;
};

enum class TradeSide {
    Buy,
    Sell
};

std::string to_string(TradeSide side);

struct TradeEvent {
    std::string pool_address;
    std::string token_mint;
    double sol_amount = 0.0;
    double token_amount = 0.0;
    TradeSide side = TradeSide::Buy;
    std::string user;
    std::string signature;
    int64_t timestamp = 0;   // seconds
    double price = 0.0;

    // Classification diagnostics
    bool used_vault_fallback = false;
    bool signals_disagreed = false;
};

struct AccountKey {
    std::string pubkey;
    bool signer = false;
    bool writable = false;
};

struct TokenBalance {
    int account_index = 0;
    std::string mint;
    std::string owner;
    double ui_amount = 0.0;
};

struct ParsedTransaction {
    std::string signature;
    uint64_t slot = 0;
    std::optional<int64_t> block_time;
    std::vector<AccountKey> account_keys;
    std::vector<uint64_t> pre_balances;
    std::vector<uint64_t> post_balances;
    std::vector<TokenBalance> pre_token_balances;
    std::vector<TokenBalance> post_token_balances;
    bool failed = false;
    std::string error;
    std::vector<std::string> log_messages;
};

struct LogNotification {
    std::string signature;
    uint64_t slot = 0;
    bool failed = false;
    std::vector<std::string> logs;
};

enum class ConnectionState {
    Disconnected,
    Subscribing,
    Subscribed,
    Reconnecting,
    Failed
};

std::string to_string(ConnectionState state);
