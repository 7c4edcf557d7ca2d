#ifndef CLAWCHAT_ERRORS_HPP
#define CLAWCHAT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace clawchat {

enum class ErrorKind {
    Transport,     // dial failure, unexpected socket closure
    Handshake,     // challenge rejected, malformed hello
    Timeout,       // handshake or per-call deadline elapsed
    Call,          // gateway answered ok:false
    NotConnected,  // call issued outside the connected state
    Closed         // client shut down while the caller was waiting
};

const char* error_kind_name(ErrorKind kind) noexcept;

/**
 * @brief Error raised by the gateway clients
 *
 * Transport, Handshake and handshake Timeout errors reach the caller of
 * connect(); the remaining kinds reach only the caller of the failing call.
 */
class GatewayError : public std::runtime_error {
public:
    GatewayError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief SSH tunnel could not be started or never became ready
 */
class TunnelError : public std::runtime_error {
public:
    explicit TunnelError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace clawchat

#endif // CLAWCHAT_ERRORS_HPP
