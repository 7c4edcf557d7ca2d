#include "clawchat_chat_model.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <limits>

namespace clawchat {

using Clock = std::chrono::system_clock;

namespace {

// Largest |milliseconds| a Clock::time_point can hold
constexpr int64_t kMaxMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max()).count();

// Doubles at or beyond this magnitude do not fit in int64_t
constexpr double kInt64Bound = 9.2e18;

bool number_to_int64(const nlohmann::json& value, int64_t& out) {
    if (value.is_number_unsigned()) {
        const uint64_t u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) return false;
        out = static_cast<int64_t>(u);
        return true;
    }
    if (value.is_number_integer()) {
        out = value.get<int64_t>();
        return true;
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        if (!std::isfinite(d) || d >= kInt64Bound || d <= -kInt64Bound) return false;
        out = static_cast<int64_t>(d);
        return true;
    }
    return false;
}

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && ((year % 4 == 0 && year % 100 != 0) || year % 400 == 0)) return 29;
    return kDays[month - 1];
}

} // namespace

const char* chat_state_name(ChatState state) noexcept {
    switch (state) {
        case ChatState::Delta: return "delta";
        case ChatState::Final: return "final";
        case ChatState::Error: return "error";
        default:               return "unknown";
    }
}

ChatState chat_state_from_string(const std::string& s) noexcept {
    if (s == "delta") return ChatState::Delta;
    if (s == "final") return ChatState::Final;
    if (s == "error") return ChatState::Error;
    return ChatState::Unknown;
}

std::string string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) return {};
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

std::string flatten_content(const nlohmann::json& content) {
    if (content.is_string()) {
        return content.get<std::string>();
    }
    std::string out;
    if (content.is_array()) {
        for (const auto& block : content) {
            // tool_use, image and other non-text blocks carry no "text"
            out += string_field(block, "text");
        }
    }
    return out;
}

bool parse_rfc3339(const std::string& text, Clock::time_point& out) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return false;
    }
    if (consumed != 19 || month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) ||
        hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    size_t pos = static_cast<size_t>(consumed);

    // Fractional seconds, truncated to nanoseconds
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return false;
        for (; digits < 9; ++digits) nanos *= 10;
    }

    if (pos >= text.size()) return false;

    int offset_seconds = 0;
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        ++pos;
    } else if (zone == '+' || zone == '-') {
        int off_h = 0, off_m = 0, off_consumed = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d%n", &off_h, &off_m, &off_consumed) != 2 ||
            off_consumed != 5 || off_h > 23 || off_m > 59) {
            return false;
        }
        offset_seconds = (off_h * 3600 + off_m * 60) * (zone == '-' ? -1 : 1);
        pos += 1 + static_cast<size_t>(off_consumed);
    } else {
        return false;
    }
    if (pos != text.size()) return false;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const int64_t seconds = static_cast<int64_t>(timegm(&tm)) - offset_seconds;
    if (seconds >= kMaxMillis / 1000 || seconds <= -(kMaxMillis / 1000)) return false;

    out = Clock::time_point(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(seconds) + std::chrono::nanoseconds(nanos)));
    return true;
}

Clock::time_point parse_timestamp(const nlohmann::json& value) {
    if (value.is_number()) {
        int64_t ms = 0;
        if (!number_to_int64(value, ms) || ms > kMaxMillis || ms < -kMaxMillis) {
            return Clock::time_point{};
        }
        return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
            std::chrono::milliseconds(ms)));
    }
    Clock::time_point parsed{};
    if (value.is_string() && parse_rfc3339(value.get<std::string>(), parsed)) {
        return parsed;
    }
    return Clock::time_point{};
}

std::vector<Session> parse_sessions(const nlohmann::json& payload) {
    std::vector<Session> sessions;
    if (!payload.is_object()) return sessions;
    auto list = payload.find("sessions");
    if (list == payload.end() || !list->is_array()) return sessions;

    sessions.reserve(list->size());
    for (const auto& entry : *list) {
        if (!entry.is_object()) continue;
        Session s;
        s.key = string_field(entry, "key");
        s.label = string_field(entry, "label");
        s.channel = string_field(entry, "channel");
        s.model = string_field(entry, "model");
        sessions.push_back(std::move(s));
    }
    return sessions;
}

std::vector<Message> parse_history(const nlohmann::json& payload) {
    std::vector<Message> messages;
    if (!payload.is_object()) return messages;
    auto list = payload.find("messages");
    if (list == payload.end() || !list->is_array()) return messages;

    for (const auto& entry : *list) {
        if (!entry.is_object()) continue;

        // Tool calls, tool results and system prompts are not shown
        std::string role = string_field(entry, "role");
        if (role != "user" && role != "assistant") continue;

        Message msg;
        auto content = entry.find("content");
        if (content != entry.end()) msg.content = flatten_content(*content);
        if (msg.content.empty()) continue;

        msg.role = std::move(role);
        auto ts = entry.find("timestamp");
        if (ts != entry.end()) msg.timestamp = parse_timestamp(*ts);
        messages.push_back(std::move(msg));
    }
    return messages;
}

ChatEvent parse_chat_event(const nlohmann::json& payload) {
    ChatEvent ev;
    ev.run_id = string_field(payload, "runId");
    ev.session_key = string_field(payload, "sessionKey");
    ev.state = chat_state_from_string(string_field(payload, "state"));
    ev.error_message = string_field(payload, "errorMessage");

    if (!payload.is_object()) return ev;

    auto seq = payload.find("seq");
    if (seq != payload.end()) {
        int64_t value = 0;
        if (number_to_int64(*seq, value)) ev.sequence = value;
    }

    auto message = payload.find("message");
    if (message != payload.end() && message->is_object()) {
        auto content = message->find("content");
        if (content != message->end()) ev.content = flatten_content(*content);
    }
    return ev;
}

} // namespace clawchat
