#include <catch2/catch_test_macros.hpp>
#include "../src/connection_manager.hpp"
#include "fakes.hpp"
#include <algorithm>

using std::chrono::seconds;
using std::chrono::milliseconds;

namespace {

struct ConnectionFixture {
    std::shared_ptr<FakeLogStream> stream = std::make_shared<FakeLogStream>();
    std::shared_ptr<ManualScheduler> scheduler = std::make_shared<ManualScheduler>();
    std::shared_ptr<TradeEventEmitter> events = std::make_shared<TradeEventEmitter>();
    std::vector<std::string> seen;
    std::vector<ConnectionStaleEvent> stale;
    std::vector<int> gave_up;
    std::unique_ptr<ConnectionManager> manager;

    explicit ConnectionFixture(ConnectionSettings settings = {}) {
        events->subscribe([this](const EngineEvent& e) { seen.push_back(event_name(e)); });
        events->on<ConnectionStaleEvent>([this](const ConnectionStaleEvent& e) { stale.push_back(e); });
        events->on<MaxReconnectAttemptsEvent>([this](const MaxReconnectAttemptsEvent& e) {
            gave_up.push_back(e.attempts);
        });
        manager = std::make_unique<ConnectionManager>(stream, scheduler, events, settings);
    }

    long count(const std::string& name) const {
        return std::count(seen.begin(), seen.end(), name);
    }
};

PoolRecord other_pool() {
    PoolRecord p = fixtures::pool();
    p.token_mint = fixtures::OTHER_MINT;
    p.pool_address = "8sLbNZoA1cfnvMJLPfp98ZLAnFSYCFApfJKMbiXNLwxj";
    return p;
}

LogNotification log_line(const std::string& sig) {
    LogNotification n;
    n.signature = sig;
    n.logs = {"Program log: Instruction: Swap"};
    return n;
}

}

TEST_CASE("Subscription lifecycle", "[connection]") {
    ConnectionFixture f;
    auto pool = fixtures::pool();

    SECTION("Start subscribes to the pool address at processed commitment") {
        f.manager->start(pool);

        REQUIRE(f.stream->subscribe_calls == 1);
        REQUIRE(f.stream->last_address == fixtures::POOL);
        REQUIRE(f.stream->last_commitment == "processed");
        REQUIRE(f.manager->state() == ConnectionState::Subscribed);
        REQUIRE(f.manager->is_subscribed());
        REQUIRE(f.count("connected") == 1);
    }

    SECTION("Starting the same pool twice is a no-op") {
        f.manager->start(pool);
        f.manager->start(pool);

        REQUIRE(f.stream->subscribe_calls == 1);
        REQUIRE(f.count("connected") == 1);
    }

    SECTION("Starting another pool replaces the subscription") {
        f.manager->start(pool);
        f.manager->start(other_pool());

        REQUIRE(f.stream->subscribe_calls == 2);
        REQUIRE(f.stream->unsubscribe_calls == 1);
        REQUIRE(f.stream->active_count() == 1);
        REQUIRE(f.manager->monitored_pool()->token_mint == fixtures::OTHER_MINT);
        REQUIRE(f.seen == std::vector<std::string>({"connected", "disconnected", "connected"}));
    }

    SECTION("Stop tears everything down") {
        f.manager->start(pool);
        f.manager->stop();

        REQUIRE(f.manager->state() == ConnectionState::Disconnected);
        REQUIRE_FALSE(f.manager->monitored_pool().has_value());
        REQUIRE(f.stream->active_count() == 0);
        REQUIRE(f.scheduler->pending() == 0);
        REQUIRE(f.count("disconnected") == 1);

        // Stopping again emits nothing
        f.manager->stop();
        REQUIRE(f.count("disconnected") == 1);
    }

    SECTION("Logs reach the handler and count as activity") {
        int delivered = 0;
        f.manager->set_log_handler([&](const LogNotification&) { ++delivered; });
        f.manager->start(pool);

        f.scheduler->advance(seconds(45));
        REQUIRE(f.manager->time_since_activity() == milliseconds(45000));

        f.stream->deliver(log_line("sig1"));
        REQUIRE(delivered == 1);
        REQUIRE(f.manager->time_since_activity() == milliseconds(0));
    }

    SECTION("A dropped stream reconnects after the first backoff delay") {
        f.manager->start(pool);
        f.stream->drop("connection reset by peer");

        REQUIRE(f.manager->state() == ConnectionState::Reconnecting);
        REQUIRE(f.count("error") == 1);
        REQUIRE(f.count("disconnected") == 1);

        f.scheduler->advance(milliseconds(999));
        REQUIRE(f.stream->subscribe_calls == 1);
        f.scheduler->advance(milliseconds(1));
        REQUIRE(f.stream->subscribe_calls == 2);
        REQUIRE(f.manager->state() == ConnectionState::Subscribed);
        REQUIRE(f.manager->reconnect_attempts() == 0);
    }
}

TEST_CASE("Stale connection detection", "[connection]") {
    auto pool = fixtures::pool();

    SECTION("121s of silence with default settings forces one reconnect") {
        ConnectionFixture f;
        f.manager->start(pool);

        f.scheduler->advance(seconds(119));
        REQUIRE(f.stale.empty());

        // The 120s check sees exactly the limit, which counts as stale
        f.scheduler->advance(seconds(1));
        REQUIRE(f.stale.size() == 1);
        REQUIRE(f.stale[0].seconds_since_activity == 120);
        REQUIRE(f.stale[0].monitored_tokens == std::vector<std::string>{fixtures::TOKEN_MINT});
        REQUIRE(f.count("disconnected") == 1);
        REQUIRE(f.stream->active_count() == 0);
        REQUIRE(f.manager->state() == ConnectionState::Reconnecting);

        f.scheduler->advance(seconds(1));
        REQUIRE(f.stream->subscribe_calls == 2);
        REQUIRE(f.manager->state() == ConnectionState::Subscribed);
        REQUIRE(f.stale.size() == 1);
    }

    SECTION("One advance of 121s gives one stale event and one resubscribe") {
        ConnectionFixture f;
        f.manager->start(pool);

        f.scheduler->advance(seconds(121));
        REQUIRE(f.stale.size() == 1);
        REQUIRE(f.stream->subscribe_calls == 2);
        REQUIRE(f.manager->state() == ConnectionState::Subscribed);
    }

    SECTION("Frequent checks fire at the window") {
        ConnectionSettings settings;
        settings.health_check_interval = seconds(1);
        ConnectionFixture f(settings);
        f.manager->start(pool);

        f.scheduler->advance(seconds(119));
        REQUIRE(f.stale.empty());
        f.scheduler->advance(seconds(1));
        REQUIRE(f.stale.size() == 1);
        REQUIRE(f.stale[0].seconds_since_activity == 120);
    }

    SECTION("Activity pushes the deadline out") {
        ConnectionFixture f;
        f.manager->start(pool);

        f.scheduler->advance(seconds(100));
        f.stream->deliver(log_line("sig1"));

        f.scheduler->advance(seconds(110));
        REQUIRE(f.stale.empty());
        f.scheduler->advance(seconds(30));
        REQUIRE(f.stale.size() == 1);
    }
}

TEST_CASE("Reconnect budget", "[connection]") {
    ConnectionFixture f;
    auto pool = fixtures::pool();
    f.stream->failures_remaining = 1000;

    f.manager->start(pool);
    REQUIRE(f.manager->state() == ConnectionState::Reconnecting);
    REQUIRE(f.count("error") == 1);

    SECTION("Gives up after ten retries") {
        // 1+2+4+8+16+30*5 seconds of backoff
        f.scheduler->advance(seconds(181));

        REQUIRE(f.stream->subscribe_calls == 11);
        REQUIRE(f.manager->state() == ConnectionState::Failed);
        REQUIRE(f.gave_up == std::vector<int>{10});
        REQUIRE(f.scheduler->pending() == 0);

        f.scheduler->advance(seconds(600));
        REQUIRE(f.stream->subscribe_calls == 11);
    }

    SECTION("Start after giving up tries again with a fresh budget") {
        f.scheduler->advance(seconds(181));
        REQUIRE(f.manager->state() == ConnectionState::Failed);

        f.stream->failures_remaining = 0;
        f.manager->start(pool);
        REQUIRE(f.manager->state() == ConnectionState::Subscribed);
        REQUIRE(f.manager->reconnect_attempts() == 0);
    }

    SECTION("Stop cancels a pending retry") {
        f.manager->stop();
        f.scheduler->advance(seconds(60));
        REQUIRE(f.stream->subscribe_calls == 1);
    }
}
