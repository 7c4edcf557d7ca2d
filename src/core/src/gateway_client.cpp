/**
 * @file gateway_client.cpp
 * @brief Handshake backend: connection state machine and request correlation
 */

#include "clawchat_gateway_client.hpp"
#include "clawchat_logger.hpp"

#include <cerrno>
#include <cstdlib>

namespace clawchat {

using json = nlohmann::json;

namespace {

constexpr const char* kChallengeEvent = "connect.challenge";
constexpr const char* kRequestIdPrefix = "cc-";

std::string dump_frame(const json& frame) {
    // Invalid UTF-8 in user text must not abort the send
    return frame.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

const std::vector<std::string>& GatewayClient::scopes() {
    static const std::vector<std::string> kScopes = {
        "operator.admin",
        "operator.approvals",
        "operator.pairing",
    };
    return kScopes;
}

GatewayClient::GatewayClient(GatewayClientOptions options,
                             std::unique_ptr<Transport> transport)
    : options_(std::move(options))
    , transport_(transport ? std::move(transport) : make_websocket_transport())
{
    if (options_.request_timeout <= std::chrono::milliseconds::zero()) {
        options_.request_timeout = std::chrono::milliseconds(30000);
    }
}

GatewayClient::~GatewayClient() {
    close();
    join_threads(/*detach_self=*/true);
}

// ==================== Request ids ====================

std::string GatewayClient::format_request_id(uint64_t id) {
    return kRequestIdPrefix + std::to_string(id);
}

bool GatewayClient::parse_request_id(const std::string& text, uint64_t& id) {
    const std::string prefix = kRequestIdPrefix;
    if (text.size() <= prefix.size() || text.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    const char* digits = text.c_str() + prefix.size();
    if (*digits < '0' || *digits > '9') return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long value = std::strtoull(digits, &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;
    id = static_cast<uint64_t>(value);
    return true;
}

// ==================== Status ====================

ConnectionStatus GatewayClient::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

std::string GatewayClient::last_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return error_;
}

void GatewayClient::notify_status(ConnectionStatus status) {
    CLAWCHAT_LOG_INFO(std::string("Gateway status: ") + connection_status_name(status));
    if (options_.status_handler) {
        options_.status_handler(status);
    }
}

void GatewayClient::set_status(ConnectionStatus next) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ == next) return;
        status_ = next;
    }
    notify_status(next);
}

bool GatewayClient::transition(ConnectionStatus from, ConnectionStatus to) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ != from) return false;
        status_ = to;
    }
    notify_status(to);
    return true;
}

void GatewayClient::fail_connection(ErrorKind kind, const std::string& reason) {
    if (closing_.load()) return;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ == ConnectionStatus::Error) return;
        status_ = ConnectionStatus::Error;
        error_kind_ = kind;
        error_ = reason;
    }
    CLAWCHAT_LOG_ERROR(std::string("Gateway connection failed (") + error_kind_name(kind) + "): " + reason);
    notify_status(ConnectionStatus::Error);
    pending_.fail_all(kind, reason);
    close_transport();
}

// ==================== Lifecycle ====================

void GatewayClient::connect() {
    if (connect_started_.exchange(true)) {
        throw GatewayError(ErrorKind::Transport, "connect() already called on this client");
    }
    if (closing_.load()) {
        throw GatewayError(ErrorKind::Closed, "client closed");
    }

    set_status(ConnectionStatus::Connecting);

    const std::string dial_url = options_.token.empty()
        ? options_.url
        : append_token_query(options_.url, options_.token);

    std::string dial_error;
    if (!transport_->open(dial_url, {}, options_.request_timeout, dial_error)) {
        if (closing_.load()) {
            throw GatewayError(ErrorKind::Closed, "client closed during connect");
        }
        const std::string reason = "dial " + options_.url + ": " + dial_error;
        fail_connection(ErrorKind::Transport, reason);
        throw GatewayError(ErrorKind::Transport, reason);
    }

    if (!transition(ConnectionStatus::Connecting, ConnectionStatus::Handshaking)) {
        close_transport();
        throw GatewayError(ErrorKind::Closed, "client closed during connect");
    }

    read_thread_ = std::thread(&GatewayClient::read_loop, this);

    const auto deadline = std::chrono::steady_clock::now() + options_.request_timeout;
    for (;;) {
        if (closing_.load()) {
            throw GatewayError(ErrorKind::Closed, "client closed during connect");
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (status_ == ConnectionStatus::Connected) return;
            if (status_ == ConnectionStatus::Error) {
                throw GatewayError(error_kind_, error_);
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            close();
            throw GatewayError(ErrorKind::Timeout,
                "handshake timed out after " +
                std::to_string(options_.request_timeout.count()) + " ms");
        }
        std::this_thread::sleep_for(kConnectPollInterval);
    }
}

void GatewayClient::close() {
    if (closing_.exchange(true)) return;

    set_status(ConnectionStatus::Disconnected);
    pending_.fail_all(ErrorKind::Closed, "client closed");
    close_transport();
    join_threads(/*detach_self=*/false);
}

void GatewayClient::close_transport() {
    // The read loop, the handshake thread and the caller can all get here
    std::lock_guard<std::mutex> lock(transport_close_mutex_);
    transport_->close();
}

void GatewayClient::join_threads(bool detach_self) {
    const auto self = std::this_thread::get_id();
    for (std::thread* t : {&read_thread_, &handshake_thread_}) {
        if (!t->joinable()) continue;
        if (t->get_id() != self) {
            t->join();
        } else if (detach_self) {
            t->detach();
        }
        // A handler closing the client from its own thread leaves that
        // thread joinable; the destructor joins it.
    }
}

// ==================== Calls ====================

CallResult GatewayClient::invoke(const std::string& method,
                                 const json& params,
                                 std::chrono::milliseconds timeout) {
    if (timeout <= std::chrono::milliseconds::zero()) {
        timeout = options_.request_timeout;
    }

    const uint64_t id = pending_.next_id();
    std::future<CallResult> result = pending_.add(id);

    // close() may have drained the table just before add()
    if (closing_.load()) {
        pending_.remove(id);
        return CallResult::failure(ErrorKind::Closed, "client closed");
    }

    json frame = {
        {"type", "req"},
        {"id", format_request_id(id)},
        {"method", method},
        {"params", params},
    };
    if (!transport_->send_text(dump_frame(frame))) {
        pending_.remove(id);
        return CallResult::failure(ErrorKind::Transport, method + ": send failed, connection not open");
    }
    CLAWCHAT_LOG_DEBUG("Sent " + method + " as " + format_request_id(id));

    if (result.wait_for(timeout) == std::future_status::ready) {
        return result.get();
    }
    if (pending_.remove(id)) {
        return CallResult::failure(ErrorKind::Timeout,
            method + " timed out after " + std::to_string(timeout.count()) + " ms");
    }
    // The response won the race against the timeout
    return result.get();
}

json GatewayClient::call(const std::string& method,
                         const json& params,
                         std::chrono::milliseconds timeout) {
    if (status() != ConnectionStatus::Connected) {
        throw GatewayError(ErrorKind::NotConnected, method + ": not connected");
    }
    CallResult r = invoke(method, params, timeout);
    if (!r.ok) {
        throw GatewayError(r.kind, r.error);
    }
    return std::move(r.payload);
}

std::vector<Session> GatewayClient::list_sessions() {
    return parse_sessions(call("sessions.list", json::object()));
}

std::vector<Message> GatewayClient::get_history(const std::string& session_key, int limit) {
    if (limit <= 0) limit = kDefaultHistoryLimit;
    return parse_history(call("chat.history", {
        {"sessionKey", session_key},
        {"limit", limit},
    }));
}

std::string GatewayClient::send_message(const std::string& session_key,
                                        const std::string& text,
                                        const std::string& idempotency_key) {
    json payload = call("chat.send", {
        {"sessionKey", session_key},
        {"message", text},
        {"idempotencyKey", idempotency_key},
    });
    return string_field(payload, "runId");
}

// ==================== Read loop ====================

void GatewayClient::read_loop() {
    std::string text;
    while (transport_->receive(text)) {
        handle_frame(text);
    }

    if (!closing_.load()) {
        std::string reason = transport_->last_error();
        if (reason.empty()) reason = "connection closed";
        fail_connection(ErrorKind::Transport, "connection lost: " + reason);
    }
    CLAWCHAT_LOG_DEBUG("Gateway read loop exited");
}

void GatewayClient::handle_frame(const std::string& text) {
    json frame = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (frame.is_discarded() || !frame.is_object()) {
        CLAWCHAT_LOG_DEBUG("Dropping malformed frame");
        return;
    }

    const std::string type = string_field(frame, "type");
    if (type == "res") {
        handle_response(frame);
        return;
    }
    if (type != "event") {
        CLAWCHAT_LOG_DEBUG("Dropping frame of type '" + type + "'");
        return;
    }

    const std::string name = string_field(frame, "event");
    json payload = json::object();
    auto it = frame.find("payload");
    if (it != frame.end() && !it->is_null()) payload = *it;

    if (name == kChallengeEvent) {
        handle_challenge(payload);
        return;
    }
    if (!options_.event_handler) return;
    try {
        options_.event_handler(name, payload);
    } catch (const std::exception& e) {
        CLAWCHAT_LOG_WARN("Event handler for '" + name + "' threw: " + e.what());
    }
}

void GatewayClient::handle_response(const json& frame) {
    uint64_t id = 0;
    const std::string wire_id = string_field(frame, "id");
    if (!parse_request_id(wire_id, id)) {
        CLAWCHAT_LOG_DEBUG("Dropping response with foreign id '" + wire_id + "'");
        return;
    }

    auto ok_it = frame.find("ok");
    const bool ok = ok_it != frame.end() && ok_it->is_boolean() && ok_it->get<bool>();

    CallResult result;
    if (ok) {
        auto payload = frame.find("payload");
        result = CallResult::success(payload != frame.end() ? *payload : json::object());
    } else {
        std::string message;
        auto error = frame.find("error");
        if (error != frame.end()) message = string_field(*error, "message");
        if (message.empty()) message = "request failed";
        result = CallResult::failure(ErrorKind::Call, message);
    }

    if (!pending_.resolve(id, std::move(result))) {
        CLAWCHAT_LOG_DEBUG("Dropping late response " + wire_id);
    }
}

// ==================== Handshake ====================

void GatewayClient::handle_challenge(const json& payload) {
    if (challenge_seen_.exchange(true)) {
        CLAWCHAT_LOG_DEBUG("Ignoring repeated connect challenge");
        return;
    }
    std::string nonce = string_field(payload, "nonce");
    if (nonce.empty()) {
        fail_connection(ErrorKind::Handshake, "connect challenge carried no nonce");
        return;
    }
    // The connect call waits for a response that only the read loop can deliver
    handshake_thread_ = std::thread(&GatewayClient::perform_handshake, this, std::move(nonce));
}

void GatewayClient::perform_handshake(std::string nonce) {
    json params = {
        {"role", kRole},
        {"scopes", scopes()},
        {"auth", {{"token", options_.token}}},
        {"client", {
            {"id", kClientId},
            {"version", kClientVersion},
            {"platform", kClientPlatform},
            {"mode", kClientMode},
        }},
        {"minProtocol", kProtocolVersion},
        {"maxProtocol", kProtocolVersion},
    };

    if (options_.identity) {
        SignedChallenge proof;
        try {
            proof = options_.identity->sign(nonce, options_.token, kRole, scopes());
        } catch (const std::exception& e) {
            fail_connection(ErrorKind::Handshake, std::string("signing challenge: ") + e.what());
            return;
        }
        params["device"] = {
            {"id", options_.identity->device_id()},
            {"publicKey", options_.identity->public_key_base64url()},
            {"signature", proof.signature},
            {"signedAt", proof.signed_at_ms},
            {"nonce", nonce},
        };
    }

    CallResult r = invoke("connect", params, options_.request_timeout);
    if (!r.ok) {
        if (r.kind == ErrorKind::Closed) return;
        const ErrorKind kind = r.kind == ErrorKind::Timeout ? ErrorKind::Timeout : ErrorKind::Handshake;
        fail_connection(kind, "connect rejected: " + r.error);
        return;
    }

    const std::string type = string_field(r.payload, "type");
    if (type != "hello-ok") {
        fail_connection(ErrorKind::Handshake, "unexpected handshake response type '" + type + "'");
        return;
    }
    transition(ConnectionStatus::Handshaking, ConnectionStatus::Connected);
}

} // namespace clawchat
