#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace util {
    std::string current_iso8601();
    std::vector<std::string> split(const std::string& str, char delim);
    int64_t current_timestamp_ms();

    // "AbCdEf...wXyZ" form for log lines
    std::string short_addr(const std::string& address);
    std::string to_lower(std::string s);
    bool iequals(const std::string& a, const std::string& b);
    bool contains(const std::string& haystack, const std::string& needle);

    // Base58 alphabet, 32-44 chars
    bool is_valid_solana_address(const std::string& address);

    struct Url {
        std::string scheme;
        std::string host;
        std::string port;
        std::string target;
    };

    // Throws std::invalid_argument on anything that is not scheme://host[:port][/path]
    Url parse_url(const std::string& url);
}
