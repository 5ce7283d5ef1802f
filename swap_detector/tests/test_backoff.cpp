#include <catch2/catch_test_macros.hpp>
#include "../src/backoff.hpp"

using std::chrono::milliseconds;

TEST_CASE("Reconnect backoff schedule", "[backoff]") {
    ReconnectBackoff backoff(milliseconds(1000), milliseconds(30000), 10);

    SECTION("Doubles from the base delay and caps at the maximum") {
        REQUIRE(backoff.next_delay() == milliseconds(1000));
        REQUIRE(backoff.next_delay() == milliseconds(2000));
        REQUIRE(backoff.next_delay() == milliseconds(4000));
        REQUIRE(backoff.next_delay() == milliseconds(8000));
        REQUIRE(backoff.next_delay() == milliseconds(16000));
        REQUIRE(backoff.next_delay() == milliseconds(30000));
        REQUIRE(backoff.next_delay() == milliseconds(30000));
        REQUIRE(backoff.attempts() == 7);
    }

    SECTION("Stops after the attempt budget") {
        for (int i = 0; i < 10; ++i) {
            REQUIRE(backoff.next_delay().has_value());
        }
        REQUIRE(backoff.exhausted());
        REQUIRE_FALSE(backoff.next_delay().has_value());
        REQUIRE(backoff.attempts() == 10);
    }

    SECTION("Reset restarts from the base delay") {
        backoff.next_delay();
        backoff.next_delay();
        backoff.next_delay();
        backoff.reset();

        REQUIRE(backoff.attempts() == 0);
        REQUIRE_FALSE(backoff.exhausted());
        REQUIRE(backoff.next_delay() == milliseconds(1000));
    }
}
