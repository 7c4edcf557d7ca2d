#pragma once

/**
 * @file clawchat_gateway.hpp
 * @brief Backend-agnostic gateway capability set
 */

#include "clawchat_device_identity.hpp"
#include "clawchat_gateway_client.hpp"
#include "clawchat_headless_client.hpp"
#include "clawchat_settings.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace clawchat {

/**
 * @brief One connected backend, chosen at construction
 *
 * Callers use the same operations whichever backend is active; events
 * from both arrive as ("chat", payload) with cumulative content.
 */
class Gateway {
public:
    using Backend = std::variant<std::unique_ptr<GatewayClient>, std::unique_ptr<HeadlessClient>>;

    explicit Gateway(std::unique_ptr<GatewayClient> client);
    explicit Gateway(std::unique_ptr<HeadlessClient> client);

    /**
     * @brief Build the backend named by @p settings, dialling @p url
     *
     * @p url is the resolved endpoint (direct or tunnelled), which may
     * differ from settings.url.
     */
    static Gateway create(const GatewaySettings& settings,
                          const std::string& url,
                          std::shared_ptr<DeviceIdentity> identity,
                          EventHandler on_event,
                          StatusHandler on_status = nullptr,
                          std::unique_ptr<Transport> transport = nullptr);

    void connect();
    void close();
    ConnectionStatus status() const;
    std::vector<Session> list_sessions();
    std::vector<Message> get_history(const std::string& session_key, int limit);
    std::string send_message(const std::string& session_key,
                             const std::string& text,
                             const std::string& idempotency_key);

    BackendKind kind() const;

private:
    Backend backend_;
};

} // namespace clawchat
