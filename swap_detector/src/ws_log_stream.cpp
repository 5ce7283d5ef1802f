#include "ws_log_stream.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/ssl.h>
#include <atomic>
#include <thread>

namespace asio      = boost::asio;
namespace ssl       = asio::ssl;
namespace beast     = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

static constexpr int SUBSCRIBE_REQUEST_ID = 1;
static constexpr int UNSUBSCRIBE_REQUEST_ID = 2;
static constexpr int MAX_CONFIRMATION_FRAMES = 16;

struct WsLogStream::Session : std::enable_shared_from_this<WsLogStream::Session> {
    Session() : ssl_ctx(ssl::context::tls_client), ws(ioc, ssl_ctx) {}

    asio::io_context ioc;
    ssl::context ssl_ctx;
    websocket::stream<ssl::stream<tcp::socket>> ws;
    beast::flat_buffer buffer;
    std::thread thread;
    std::atomic<bool> closing{false};

    uint64_t subscription_id = 0;
    std::string address;
    LogCallback on_log;
    ErrorCallback on_error;

    void read_next();
    void dispatch(const std::string& msg);
    void close();
};

void WsLogStream::Session::read_next() {
    auto self = shared_from_this();
    ws.async_read(buffer, [self](beast::error_code ec, std::size_t) {
        if (ec) {
            if (!self->closing.exchange(true)) {
                spdlog::warn("Log stream for {} dropped: {}",
                             util::short_addr(self->address), ec.message());
                if (self->on_error) {
                    self->on_error(ec.message());
                }
            }
            return;
        }

        std::string msg = beast::buffers_to_string(self->buffer.data());
        self->buffer.consume(self->buffer.size());
        self->dispatch(msg);

        if (!self->closing) {
            self->read_next();
        }
    });
}

void WsLogStream::Session::dispatch(const std::string& msg) {
    std::optional<LogNotification> notification;
    try {
        notification = parse_notification(nlohmann::json::parse(msg));
    } catch (const std::exception& e) {
        spdlog::debug("Ignoring malformed log stream frame: {}", e.what());
        return;
    }

    if (!notification || closing) return;

    try {
        on_log(*notification);
    } catch (const std::exception& e) {
        spdlog::error("Log handler failed for {}: {}",
                      util::short_addr(notification->signature), e.what());
    }
}

// Runs on the session's I/O thread
void WsLogStream::Session::close() {
    beast::error_code ec;
    if (subscription_id != 0) {
        nlohmann::json request = {
            {"jsonrpc", "2.0"},
            {"id", UNSUBSCRIBE_REQUEST_ID},
            {"method", "logsUnsubscribe"},
            {"params", nlohmann::json::array({subscription_id})}
        };
        ws.write(asio::buffer(request.dump()), ec);
        if (ec) {
            spdlog::debug("logsUnsubscribe for {} not sent: {}", util::short_addr(address), ec.message());
        }
    }
    ws.async_close(websocket::close_code::normal, [](beast::error_code) {});
}

WsLogStream::WsLogStream(const std::string& ws_url)
    : ws_url_(ws_url) {
    // Validate eagerly so a bad URL fails at startup
    util::parse_url(ws_url_);
}

WsLogStream::~WsLogStream() {
    std::vector<Handle> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [handle, session] : sessions_) {
            handles.push_back(handle);
        }
    }
    for (auto handle : handles) {
        unsubscribe(handle);
    }
}

LogStream::Handle WsLogStream::subscribe_logs(const std::string& address,
                                              const std::string& commitment,
                                              LogCallback on_log,
                                              ErrorCallback on_error) {
    auto session = std::make_shared<Session>();
    session->address = address;
    session->on_log = std::move(on_log);
    session->on_error = std::move(on_error);

    try {
        auto url = util::parse_url(ws_url_);

        session->ssl_ctx.set_default_verify_paths();

        tcp::resolver resolver(session->ioc);
        auto const results = resolver.resolve(url.host, url.port);
        asio::connect(session->ws.next_layer().next_layer(), results.begin(), results.end());

        // SNI must be set before the TLS handshake
        session->ws.next_layer().set_verify_mode(ssl::verify_peer);
        session->ws.next_layer().set_verify_callback(ssl::host_name_verification(url.host));
        if (!SSL_set_tlsext_host_name(session->ws.next_layer().native_handle(), url.host.c_str())) {
            throw SubscriptionError("Failed to set SNI host name " + url.host);
        }
        session->ws.next_layer().handshake(ssl::stream_base::client);

        websocket::stream_base::timeout opt{
            std::chrono::seconds(10),   // handshake and close
            std::chrono::seconds(60),   // idle
            true                        // keep-alive pings
        };
        session->ws.set_option(opt);
        session->ws.handshake(url.host, url.target);
        session->ws.text(true);

        nlohmann::json request = {
            {"jsonrpc", "2.0"},
            {"id", SUBSCRIBE_REQUEST_ID},
            {"method", "logsSubscribe"},
            {"params", nlohmann::json::array({
                {{"mentions", nlohmann::json::array({address})}},
                {{"commitment", commitment}}
            })}
        };
        session->ws.write(asio::buffer(request.dump()));

        for (int i = 0; i < MAX_CONFIRMATION_FRAMES && session->subscription_id == 0; ++i) {
            beast::flat_buffer buffer;
            session->ws.read(buffer);
            auto reply = nlohmann::json::parse(beast::buffers_to_string(buffer.data()));

            if (!reply.contains("id") || reply["id"] != SUBSCRIBE_REQUEST_ID) continue;

            if (reply.contains("error")) {
                throw SubscriptionError("logsSubscribe rejected: " + reply["error"].dump());
            }
            session->subscription_id = reply.at("result").get<uint64_t>();
        }

        if (session->subscription_id == 0) {
            throw SubscriptionError("No logsSubscribe confirmation received");
        }
    } catch (const SubscriptionError&) {
        throw;
    } catch (const std::exception& e) {
        throw SubscriptionError("Log subscription for " + util::short_addr(address) +
                                " failed: " + e.what());
    }

    session->read_next();
    session->thread = std::thread([session]() {
        try {
            session->ioc.run();
        } catch (const std::exception& e) {
            spdlog::error("Log stream I/O thread for {} stopped: {}",
                          util::short_addr(session->address), e.what());
        }
    });

    std::lock_guard<std::mutex> lock(mutex_);
    auto handle = next_handle_++;
    sessions_.emplace(handle, session);

    spdlog::info("Subscribed to logs mentioning {} (subscription {})",
                 util::short_addr(address), session->subscription_id);
    return handle;
}

void WsLogStream::unsubscribe(Handle handle) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(handle);
        if (it == sessions_.end()) return;
        session = it->second;
        sessions_.erase(it);
    }

    session->closing = true;

    // Raw pointer: if the I/O thread already exited this never runs, and a
    // shared_ptr here would keep the session alive through its own io_context.
    Session* raw = session.get();
    asio::post(session->ioc, [raw]() { raw->close(); });

    if (session->thread.joinable()) {
        if (session->thread.get_id() == std::this_thread::get_id()) {
            // Called from one of our own callbacks
            session->thread.detach();
        } else {
            session->thread.join();
        }
    }

    spdlog::debug("Unsubscribed from logs mentioning {}", util::short_addr(session->address));
}

std::optional<LogNotification> WsLogStream::parse_notification(const nlohmann::json& frame) {
    if (!frame.contains("method") || frame["method"] != "logsNotification") {
        return std::nullopt;
    }

    const auto& result = frame.at("params").at("result");
    const auto& value = result.at("value");

    LogNotification n;
    n.signature = value.value("signature", "");
    if (result.contains("context")) {
        n.slot = result["context"].value("slot", uint64_t{0});
    }
    n.failed = value.contains("err") && !value["err"].is_null();
    if (value.contains("logs") && value["logs"].is_array()) {
        n.logs = value["logs"].get<std::vector<std::string>>();
    }
    return n;
}
