#include "clawchat_errors.hpp"

namespace clawchat {

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transport:    return "transport";
        case ErrorKind::Handshake:    return "handshake";
        case ErrorKind::Timeout:      return "timeout";
        case ErrorKind::Call:         return "call";
        case ErrorKind::NotConnected: return "not-connected";
        case ErrorKind::Closed:       return "closed";
    }
    return "unknown";
}

} // namespace clawchat
