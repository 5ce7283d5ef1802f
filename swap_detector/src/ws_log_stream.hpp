#pragma once

#include "log_stream.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// logsSubscribe over a TLS WebSocket. Each subscription owns its own
// connection and I/O thread so a dropped socket only affects that handle.
class WsLogStream : public LogStream {
public:
    explicit WsLogStream(const std::string& ws_url);
    ~WsLogStream() override;

    WsLogStream(const WsLogStream&) = delete;
    WsLogStream& operator=(const WsLogStream&) = delete;

    Handle subscribe_logs(const std::string& address,
                          const std::string& commitment,
                          LogCallback on_log,
                          ErrorCallback on_error) override;

    void unsubscribe(Handle handle) override;

    // Extracts the payload of a logsNotification frame; nullopt for any other frame.
    static std::optional<LogNotification> parse_notification(const nlohmann::json& frame);

private:
    struct Session;

    std::string ws_url_;
    std::mutex mutex_;
    std::map<Handle, std::shared_ptr<Session>> sessions_;
    Handle next_handle_ = 1;
};
