#include "config.hpp"
#include "curl_http_client.hpp"
#include "errors.hpp"
#include "health.hpp"
#include "pool_locator.hpp"
#include "pool_sources.hpp"
#include "redis_bus.hpp"
#include "solana_rpc_client.hpp"
#include "swap_detector.hpp"
#include "thread_scheduler.hpp"
#include "util.hpp"
#include "ws_log_stream.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& service_name, const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(service_name, console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main(int argc, char* argv[]) {
    try {
        auto config = std::make_shared<Config>(Config::from_env());
        setup_logging(config->service_name, config->log_level);

        spdlog::info("==============================================");
        spdlog::info("SoulScout SwapWatch v1.0");
        spdlog::info("==============================================");

        config->validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        curl_global_init(CURL_GLOBAL_DEFAULT);

        // Initialize components
        auto http = std::make_shared<CurlHttpClient>(config->request_timeout_ms);
        auto rpc = std::make_shared<SolanaRpcClient>(config->rpc_urls, http);
        auto stream = std::make_shared<WsLogStream>(config->ws_url);
        auto scheduler = std::make_shared<ThreadScheduler>();
        auto redis = std::make_shared<RedisBus>(config->redis_url, config->stream_trades,
                                                config->stream_diagnostics);

        std::vector<std::shared_ptr<PoolSource>> sources = {
            std::make_shared<RaydiumPoolSource>(config->raydium_api_base, http),
            std::make_shared<DexScreenerPoolSource>(config->dexscreener_api_base, http,
                                                    config->min_liquidity_usd),
            std::make_shared<OnChainPoolSource>(rpc)
        };
        auto locator = std::make_shared<PoolLocator>(sources, scheduler, config->locator_settings());

        boost::asio::thread_pool workers(static_cast<size_t>(config->pipeline_workers));
        auto executor = [&workers](SwapDetector::Task task) {
            boost::asio::post(workers, std::move(task));
        };

        // One engine per tracked token
        std::vector<std::shared_ptr<SwapDetector>> detectors;
        for (const auto& mint : config->track_tokens) {
            auto detector = std::make_shared<SwapDetector>(
                locator, rpc, stream, scheduler, executor,
                config->classifier_settings(),
                config->connection_settings(),
                config->pipeline_settings());

            detector->events().subscribe([redis](const EngineEvent& event) {
                redis->publish_event(event);
            });

            try {
                detector->start(mint);
            } catch (const PoolNotFoundError& e) {
                spdlog::error("Skipping {}: {}", util::short_addr(mint), e.what());
                continue;
            }
            detectors.push_back(detector);
        }

        if (detectors.empty()) {
            spdlog::warn("No tokens are being monitored (set TRACK_TOKENS)");
        }

        auto purge_timer = scheduler->schedule_every(std::chrono::minutes(1), [locator]() {
            locator->clear_expired();
        });

        auto health = std::make_shared<HealthCheck>(detectors, redis, rpc);

        // Start HTTP health server
        httplib::Server server;

        server.Get("/health", [health](const httplib::Request&, httplib::Response& res) {
            auto status = health->get_status();
            res.set_content(status.dump(), "application/json");
            res.status = status["ok"].get<bool>() ? 200 : 503;
        });

        server.Get("/tokens", [health](const httplib::Request&, httplib::Response& res) {
            nlohmann::json body = {{"tokens", health->monitored_tokens()}};
            res.set_content(body.dump(), "application/json");
        });

        std::thread http_thread([&server, config]() {
            spdlog::info("Starting HTTP server on {}:{}", config->listen_addr, config->listen_port);
            server.listen(config->listen_addr.c_str(), config->listen_port);
        });

        spdlog::info("SwapWatch started, monitoring {} token(s)", detectors.size());

        // Main loop
        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        // Shutdown: engines first, then the threads their callbacks run on
        spdlog::info("Stopping services...");
        server.stop();

        for (auto& detector : detectors) {
            detector->stop();
        }
        scheduler->cancel(purge_timer);
        scheduler->stop();
        workers.join();

        if (http_thread.joinable()) http_thread.join();

        detectors.clear();
        curl_global_cleanup();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
