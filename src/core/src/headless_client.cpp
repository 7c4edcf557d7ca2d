/**
 * @file headless_client.cpp
 * @brief Headless backend: token stream to cumulative chat events
 */

#include "clawchat_headless_client.hpp"
#include "clawchat_logger.hpp"

#include <nlohmann/json.hpp>

namespace clawchat {

using json = nlohmann::json;

HeadlessClient::HeadlessClient(HeadlessClientOptions options,
                               std::unique_ptr<Transport> transport)
    : options_(std::move(options))
    , transport_(transport ? std::move(transport) : make_websocket_transport())
{
    if (options_.connect_timeout <= std::chrono::milliseconds::zero()) {
        options_.connect_timeout = std::chrono::milliseconds(30000);
    }
}

HeadlessClient::~HeadlessClient() {
    close();
    if (read_thread_.joinable()) {
        if (read_thread_.get_id() == std::this_thread::get_id()) {
            read_thread_.detach();
        } else {
            read_thread_.join();
        }
    }
}

ConnectionStatus HeadlessClient::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return status_;
}

std::string HeadlessClient::last_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return error_;
}

void HeadlessClient::notify_status(ConnectionStatus status) {
    CLAWCHAT_LOG_INFO(std::string("Headless status: ") + connection_status_name(status));
    if (options_.status_handler) {
        options_.status_handler(status);
    }
}

void HeadlessClient::set_status(ConnectionStatus next) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ == next) return;
        status_ = next;
    }
    notify_status(next);
}

bool HeadlessClient::transition(ConnectionStatus from, ConnectionStatus to) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ != from) return false;
        status_ = to;
    }
    notify_status(to);
    return true;
}

void HeadlessClient::fail_connection(const std::string& reason) {
    if (closing_.load()) return;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (status_ == ConnectionStatus::Error) return;
        error_ = reason;
    }
    CLAWCHAT_LOG_ERROR("Headless connection failed: " + reason);
    set_status(ConnectionStatus::Error);
}

void HeadlessClient::connect() {
    if (connect_started_.exchange(true)) {
        throw GatewayError(ErrorKind::Transport, "connect() already called on this client");
    }
    if (closing_.load()) {
        throw GatewayError(ErrorKind::Closed, "client closed");
    }

    set_status(ConnectionStatus::Connecting);

    // Servers read the token from either place
    HttpHeaders headers;
    std::string dial_url = options_.url;
    if (!options_.token.empty()) {
        dial_url = append_token_query(options_.url, options_.token);
        headers.emplace_back("Authorization", "Bearer " + options_.token);
    }

    std::string dial_error;
    if (!transport_->open(dial_url, headers, options_.connect_timeout, dial_error)) {
        if (closing_.load()) {
            throw GatewayError(ErrorKind::Closed, "client closed during connect");
        }
        const std::string reason = "dial " + options_.url + ": " + dial_error;
        fail_connection(reason);
        throw GatewayError(ErrorKind::Transport, reason);
    }

    if (!transition(ConnectionStatus::Connecting, ConnectionStatus::Connected)) {
        transport_->close();
        throw GatewayError(ErrorKind::Closed, "client closed during connect");
    }
    read_thread_ = std::thread(&HeadlessClient::read_loop, this);
}

void HeadlessClient::close() {
    if (closing_.exchange(true)) return;

    set_status(ConnectionStatus::Disconnected);
    transport_->close();
    if (read_thread_.joinable() && read_thread_.get_id() != std::this_thread::get_id()) {
        read_thread_.join();
    }
}

std::vector<Session> HeadlessClient::list_sessions() {
    Session s;
    s.key = kSessionKey;
    s.label = kSessionLabel;
    return {s};
}

std::vector<Message> HeadlessClient::get_history(const std::string& /*session_key*/, int /*limit*/) {
    return {};
}

std::string HeadlessClient::send_message(const std::string& /*session_key*/,
                                         const std::string& text,
                                         const std::string& /*idempotency_key*/) {
    if (status() != ConnectionStatus::Connected) {
        throw GatewayError(ErrorKind::NotConnected, "send: not connected");
    }
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        buffer_.clear();
    }
    json frame = {{"type", "message"}, {"content", text}};
    if (!transport_->send_text(frame.dump(-1, ' ', false, json::error_handler_t::replace))) {
        throw GatewayError(ErrorKind::Transport, "send: connection not open");
    }
    return kRunId;
}

void HeadlessClient::read_loop() {
    std::string text;
    while (transport_->receive(text)) {
        handle_frame(text);
    }
    if (!closing_.load()) {
        std::string reason = transport_->last_error();
        if (reason.empty()) reason = "connection closed";
        fail_connection("connection lost: " + reason);
    }
}

void HeadlessClient::handle_frame(const std::string& text) {
    json frame = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (frame.is_discarded() || !frame.is_object()) {
        CLAWCHAT_LOG_DEBUG("Dropping malformed headless frame");
        return;
    }

    const std::string type = string_field(frame, "type");
    std::string content;
    ChatState state = ChatState::Unknown;

    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        if (type == "chunk") {
            buffer_ += string_field(frame, "content");
            content = buffer_;
            state = ChatState::Delta;
        } else if (type == "done") {
            content = string_field(frame, "full_response");
            if (content.empty()) content = buffer_;
            buffer_.clear();
            state = ChatState::Final;
        } else if (type == "error") {
            buffer_.clear();
            state = ChatState::Error;
        } else if (type == "tool_call") {
            buffer_ = "[calling " + string_field(frame, "name") + "…]";
            content = buffer_;
            state = ChatState::Delta;
        } else if (type == "tool_result") {
            buffer_.clear();
            return;
        } else {
            CLAWCHAT_LOG_DEBUG("Dropping headless frame of type '" + type + "'");
            return;
        }
    }

    std::string error_message;
    if (state == ChatState::Error) {
        error_message = string_field(frame, "message");
        if (error_message.empty()) error_message = "unknown error";
    }
    emit(state, content, error_message);
}

void HeadlessClient::emit(ChatState state, const std::string& content,
                          const std::string& error_message) {
    if (!options_.event_handler) return;

    json payload = {
        {"runId", kRunId},
        {"sessionKey", kSessionKey},
        {"seq", ++sequence_},
        {"state", chat_state_name(state)},
        {"message", {{"content", content}}},
    };
    if (!error_message.empty()) payload["errorMessage"] = error_message;

    try {
        options_.event_handler("chat", payload);
    } catch (const std::exception& e) {
        CLAWCHAT_LOG_WARN(std::string("Event handler for 'chat' threw: ") + e.what());
    }
}

} // namespace clawchat
