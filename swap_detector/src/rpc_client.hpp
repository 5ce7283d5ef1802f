#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

struct MemcmpFilter {
    size_t offset = 0;
    std::string bytes;   // base58
};

class RpcClient {
public:
    virtual ~RpcClient() = default;

    // nullopt when the node does not know the signature (yet).
    // Throws RpcError when no endpoint could answer.
    virtual std::optional<ParsedTransaction> get_parsed_transaction(
        const std::string& signature, const std::string& commitment) = 0;

    // Pubkeys of accounts owned by program_id with the given data size that
    // match every memcmp filter.
    virtual std::vector<std::string> get_program_accounts(
        const std::string& program_id, size_t data_size,
        const std::vector<MemcmpFilter>& filters) = 0;

    virtual bool is_healthy() = 0;
};
