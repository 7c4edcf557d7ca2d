#pragma once

/**
 * @file clawchat_gateway_client.hpp
 * @brief Gateway Protocol v3 client: signed handshake, correlated calls, events
 */

#include "clawchat_chat_model.hpp"
#include "clawchat_connection.hpp"
#include "clawchat_device_identity.hpp"
#include "clawchat_errors.hpp"
#include "clawchat_pending_calls.hpp"
#include "clawchat_transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace clawchat {

struct GatewayClientOptions {
    std::string url;
    std::string token;
    /// Signs the connect challenge; without one the device block is omitted
    std::shared_ptr<DeviceIdentity> identity;
    std::chrono::milliseconds request_timeout{30000};
    int max_retries = 10;
    EventHandler  event_handler;
    StatusHandler status_handler;
};

/**
 * @brief Handshake-based gateway backend
 *
 * connect() opens the socket, starts the read loop and blocks until the
 * challenge/response handshake completes. Requests are correlated by id;
 * everything else arriving on the socket is forwarded to the event handler.
 *
 * One connect() per instance. After an error the instance stays in
 * ConnectionStatus::Error; build a new client to reconnect.
 */
class GatewayClient {
public:
    static constexpr const char* kRole = "operator";
    static constexpr const char* kClientId = "clawchat-cli";
    static constexpr const char* kClientPlatform = "cli";
    static constexpr const char* kClientMode = "cli";
    static constexpr int kProtocolVersion = 3;
    static constexpr int kDefaultHistoryLimit = 50;
    static constexpr std::chrono::milliseconds kConnectPollInterval{50};

    static const std::vector<std::string>& scopes();

    explicit GatewayClient(GatewayClientOptions options,
                           std::unique_ptr<Transport> transport = nullptr);
    ~GatewayClient();

    GatewayClient(const GatewayClient&) = delete;
    GatewayClient& operator=(const GatewayClient&) = delete;

    /**
     * @brief Dial and complete the handshake
     * @throws GatewayError Transport, Handshake, Timeout or Closed
     */
    void connect();

    /// Close the socket and fail every outstanding call; idempotent
    void close();

    ConnectionStatus status() const;

    /// Reason for the transition into ConnectionStatus::Error
    std::string last_error() const;

    /**
     * @brief Issue one request and wait for its response
     * @param timeout zero selects the configured request timeout
     * @throws GatewayError NotConnected, Call, Timeout, Transport or Closed
     */
    nlohmann::json call(const std::string& method,
                        const nlohmann::json& params,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    std::vector<Session> list_sessions();

    /// @param limit values <= 0 select kDefaultHistoryLimit
    std::vector<Message> get_history(const std::string& session_key, int limit);

    /// @return run id reported by the gateway, empty when it sent none
    std::string send_message(const std::string& session_key,
                             const std::string& text,
                             const std::string& idempotency_key);

    /// Wire form of a request id: "cc-<n>"
    static std::string format_request_id(uint64_t id);
    static bool parse_request_id(const std::string& text, uint64_t& id);

private:
    CallResult invoke(const std::string& method,
                      const nlohmann::json& params,
                      std::chrono::milliseconds timeout);

    void read_loop();
    void handle_frame(const std::string& text);
    void handle_response(const nlohmann::json& frame);
    void handle_challenge(const nlohmann::json& payload);
    void perform_handshake(std::string nonce);

    void set_status(ConnectionStatus next);
    bool transition(ConnectionStatus from, ConnectionStatus to);
    void fail_connection(ErrorKind kind, const std::string& reason);
    void notify_status(ConnectionStatus status);
    void close_transport();
    void join_threads(bool detach_self);

    GatewayClientOptions options_;
    std::unique_ptr<Transport> transport_;
    std::mutex transport_close_mutex_;
    PendingCalls pending_;

    mutable std::mutex state_mutex_;
    ConnectionStatus status_ = ConnectionStatus::Disconnected;
    ErrorKind error_kind_ = ErrorKind::Transport;
    std::string error_;

    std::atomic<bool> connect_started_{false};
    std::atomic<bool> closing_{false};
    std::atomic<bool> challenge_seen_{false};

    std::thread read_thread_;
    std::thread handshake_thread_;
};

} // namespace clawchat
