#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace clawchat {

/// Version reported in the handshake client metadata and by `clawchat version`
constexpr const char* kClientVersion = "1.0.0";

/**
 * @brief Connection lifecycle shared by both backends
 *
 * Error is terminal for a client instance; a new instance is needed to
 * connect again.
 */
enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Handshaking,
    Connected,
    Error
};

inline const char* connection_status_name(ConnectionStatus status) noexcept {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Handshaking:  return "handshaking";
        case ConnectionStatus::Connected:    return "connected";
        case ConnectionStatus::Error:        return "error";
        default:                             return "unknown";
    }
}

/// Receives (eventName, payload) from the read loop, in arrival order
using EventHandler = std::function<void(const std::string& event, const nlohmann::json& payload)>;

/// Receives every status change; invoked without internal locks held
using StatusHandler = std::function<void(ConnectionStatus status)>;

} // namespace clawchat
