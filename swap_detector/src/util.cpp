#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <regex>
#include <stdexcept>
#include <cctype>

namespace util {

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

std::vector<std::string> split(const std::string& str, char delim) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, delim)) {
        token.erase(0, token.find_first_not_of(" \t\n\r"));
        token.erase(token.find_last_not_of(" \t\n\r") + 1);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }
    return tokens;
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string short_addr(const std::string& address) {
    if (address.size() <= 12) return address;
    return address.substr(0, 6) + "..." + address.substr(address.size() - 4);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool is_valid_solana_address(const std::string& address) {
    if (address.length() < 32 || address.length() > 44) {
        return false;
    }

    static const std::regex base58_regex("^[1-9A-HJ-NP-Za-km-z]+$");
    return std::regex_match(address, base58_regex);
}

Url parse_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw std::invalid_argument("URL has no scheme: " + url);
    }

    Url out;
    out.scheme = to_lower(url.substr(0, scheme_end));

    auto rest = url.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    std::string authority = rest.substr(0, path_start);
    out.target = path_start == std::string::npos ? "/" : rest.substr(path_start);

    if (authority.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
        if (out.port.empty() ||
            !std::all_of(out.port.begin(), out.port.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            throw std::invalid_argument("Invalid port in URL: " + url);
        }
    } else {
        out.host = authority;
        if (out.scheme == "https" || out.scheme == "wss") {
            out.port = "443";
        } else {
            out.port = "80";
        }
    }

    return out;
}

} // namespace util
