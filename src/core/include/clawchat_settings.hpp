#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace clawchat {

enum class BackendKind {
    Gateway,   // challenge/response handshake, multi-session
    Headless   // no handshake, single implicit session
};

const char* backend_kind_name(BackendKind kind) noexcept;
bool backend_kind_from_string(const std::string& s, BackendKind& out);

/**
 * @brief Parameters of an SSH local port forward to a remote gateway
 */
struct SshTunnelConfig {
    std::string host;
    int         port = 22;
    std::string user;
    std::string key_path;               ///< optional; "~/" is expanded
    int         remote_port = 18789;    ///< gateway port on the remote loopback
    std::string ssh_binary = "ssh";
    std::chrono::milliseconds ready_timeout{15000};
    std::chrono::milliseconds poll_interval{200};
};

/**
 * @brief Everything a gateway connection needs, merged from defaults,
 *        config file, environment and flags
 */
struct GatewaySettings {
    BackendKind  backend = BackendKind::Gateway;
    std::string  url;
    std::string  token;
    std::string  session;               ///< preferred session key, may be empty
    std::chrono::milliseconds request_timeout{30000};
    int          max_retries = 10;      ///< accepted, no reconnect loop uses it
    std::optional<SshTunnelConfig> ssh;
};

} // namespace clawchat
