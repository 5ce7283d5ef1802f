#include <catch2/catch_test_macros.hpp>
#include "../src/log_filter.hpp"

namespace {

LogNotification notification(const std::string& sig, std::vector<std::string> logs, bool failed = false) {
    LogNotification n;
    n.signature = sig;
    n.slot = 250000000;
    n.failed = failed;
    n.logs = std::move(logs);
    return n;
}

}

TEST_CASE("Log pre-filter", "[filter]") {
    LogFilter filter;

    SECTION("AMM program invocations pass") {
        REQUIRE(filter.matches({"Program 675kPX9MHTjS2zt1qfr1NYHuzeLXfQM9H24wFSUt1Mp8 invoke [1]"}));
        REQUIRE(filter.matches({"Program whirLbMiicVdio4qvUfM5KAg6Ct8VwpYzGff3uctyCc invoke [2]"}));
        REQUIRE(filter.matches({"Program log: ray_log: A4CWmAAAAAAA"}));
    }

    SECTION("Any line mentioning a swap passes regardless of case") {
        REQUIRE(filter.matches({"Program log: Instruction: SWAP_EXACT_IN"}));
        REQUIRE(filter.matches({"Program log: swap executed"}));
    }

    SECTION("Unrelated logs are screened out") {
        REQUIRE_FALSE(filter.matches({
            "Program 11111111111111111111111111111111 invoke [1]",
            "Program 11111111111111111111111111111111 success"
        }));
        REQUIRE_FALSE(filter.matches({}));
    }

    SECTION("Failed or unsigned notifications are never candidates") {
        REQUIRE(filter.is_candidate(notification("sig1", {"Program log: Instruction: Swap"})));
        REQUIRE_FALSE(filter.is_candidate(notification("sig2", {"Program log: Instruction: Swap"}, true)));
        REQUIRE_FALSE(filter.is_candidate(notification("", {"Program log: Instruction: Swap"})));
    }

    SECTION("Extra patterns extend the screen") {
        LogFilter extended({"Program log: Instruction: Route", ""});
        REQUIRE(extended.patterns().size() == filter.patterns().size() + 1);
        REQUIRE(extended.matches({"Program log: Instruction: Route"}));
        REQUIRE_FALSE(filter.matches({"Program log: Instruction: Route"}));
    }
}
