#pragma once

/**
 * @file clawchat_headless_client.hpp
 * @brief Handshake-less backend with a single implicit session
 */

#include "clawchat_chat_model.hpp"
#include "clawchat_connection.hpp"
#include "clawchat_errors.hpp"
#include "clawchat_transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace clawchat {

struct HeadlessClientOptions {
    std::string url;
    std::string token;
    std::chrono::milliseconds connect_timeout{30000};
    EventHandler  event_handler;
    StatusHandler status_handler;
};

/**
 * @brief Streams tokens from a headless agent and republishes them as
 *        cumulative "chat" events
 *
 * There is no request correlation: send_message() writes the frame and
 * every result arrives through the event handler.
 */
class HeadlessClient {
public:
    static constexpr const char* kRunId = "headless-local";
    static constexpr const char* kSessionKey = "default";
    static constexpr const char* kSessionLabel = "Headless";

    explicit HeadlessClient(HeadlessClientOptions options,
                            std::unique_ptr<Transport> transport = nullptr);
    ~HeadlessClient();

    HeadlessClient(const HeadlessClient&) = delete;
    HeadlessClient& operator=(const HeadlessClient&) = delete;

    /// @throws GatewayError Transport or Closed
    void connect();
    void close();
    ConnectionStatus status() const;
    std::string last_error() const;

    /// The single synthetic session
    std::vector<Session> list_sessions();

    /// Always empty; the headless protocol keeps no history
    std::vector<Message> get_history(const std::string& session_key, int limit);

    /**
     * @brief Reset the stream buffer and send one user message
     * @return kRunId
     * @throws GatewayError NotConnected or Transport
     */
    std::string send_message(const std::string& session_key,
                             const std::string& text,
                             const std::string& idempotency_key);

private:
    void read_loop();
    void handle_frame(const std::string& text);
    void emit(ChatState state, const std::string& content, const std::string& error_message);
    void set_status(ConnectionStatus next);
    bool transition(ConnectionStatus from, ConnectionStatus to);
    void notify_status(ConnectionStatus status);
    void fail_connection(const std::string& reason);

    HeadlessClientOptions options_;
    std::unique_ptr<Transport> transport_;

    mutable std::mutex state_mutex_;
    ConnectionStatus status_ = ConnectionStatus::Disconnected;
    std::string error_;

    // buffer_ is shared by the read loop and send_message(); sequence_ is read-loop only
    std::mutex stream_mutex_;
    std::string buffer_;
    int64_t sequence_ = 0;

    std::atomic<bool> connect_started_{false};
    std::atomic<bool> closing_{false};
    std::thread read_thread_;
};

} // namespace clawchat
