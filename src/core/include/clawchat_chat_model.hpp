#ifndef CLAWCHAT_CHAT_MODEL_HPP
#define CLAWCHAT_CHAT_MODEL_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace clawchat {

/**
 * @brief Session snapshot as listed by the gateway
 */
struct Session {
    std::string key;
    std::string label;
    std::string channel;
    std::string model;
};

/**
 * @brief History entry; role is "user" or "assistant"
 *
 * timestamp is the epoch (time_since_epoch() == 0) when the gateway sent
 * none or sent something unparseable.
 */
struct Message {
    std::string role;
    std::string content;
    std::chrono::system_clock::time_point timestamp{};
};

enum class ChatState {
    Delta,
    Final,
    Error,
    Unknown
};

const char* chat_state_name(ChatState state) noexcept;
ChatState chat_state_from_string(const std::string& s) noexcept;

/**
 * @brief One streaming update of a chat run
 *
 * content is the full text produced so far, not the increment.
 */
struct ChatEvent {
    std::string run_id;
    std::string session_key;
    int64_t     sequence = 0;
    ChatState   state = ChatState::Unknown;
    std::string content;
    std::string error_message;
};

// ==================== Payload translation ====================

/// String → itself; array of blocks → concatenated "text" fields; else ""
std::string flatten_content(const nlohmann::json& content);

/// Epoch milliseconds or RFC 3339 text; anything else → epoch
std::chrono::system_clock::time_point parse_timestamp(const nlohmann::json& value);

/// RFC 3339 with 'Z' or ±HH:MM offset, optional fractional seconds
bool parse_rfc3339(const std::string& text, std::chrono::system_clock::time_point& out);

/// sessions.list payload → sessions
std::vector<Session> parse_sessions(const nlohmann::json& payload);

/// chat.history payload → user/assistant messages with non-empty content
std::vector<Message> parse_history(const nlohmann::json& payload);

/// "chat" event payload → ChatEvent
ChatEvent parse_chat_event(const nlohmann::json& payload);

/// String member or "" when absent / not a string
std::string string_field(const nlohmann::json& object, const char* key);

} // namespace clawchat

#endif // CLAWCHAT_CHAT_MODEL_HPP
