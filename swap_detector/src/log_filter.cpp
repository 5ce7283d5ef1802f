#include "log_filter.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

LogFilter::LogFilter(std::vector<std::string> extra_patterns) {
    for (const char* program : {programs::RAYDIUM_AMM_V4, programs::RAYDIUM_CPMM,
                                programs::METEORA_DLMM, programs::ORCA_WHIRLPOOL}) {
        patterns_.push_back(std::string("Program ") + program + " invoke");
    }
    patterns_.push_back("Program log: ray_log:");
    patterns_.push_back("SwapBaseIn");
    patterns_.push_back("SwapBaseOut");
    patterns_.push_back("Instruction: Swap");

    for (auto& p : extra_patterns) {
        if (!p.empty()) patterns_.push_back(std::move(p));
    }
}

bool LogFilter::matches(const std::vector<std::string>& logs) const {
    for (const auto& line : logs) {
        for (const auto& pattern : patterns_) {
            if (util::contains(line, pattern)) return true;
        }
        if (util::contains(util::to_lower(line), "swap")) return true;
    }
    return false;
}

bool LogFilter::is_candidate(const LogNotification& notification) const {
    if (notification.signature.empty()) {
        return false;
    }
    if (notification.failed) {
        spdlog::debug("Skipping failed transaction {}", util::short_addr(notification.signature));
        return false;
    }
    return matches(notification.logs);
}
