#pragma once

#include "clawchat_errors.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace clawchat {

/**
 * @brief Outcome of one correlated request
 */
struct CallResult {
    bool           ok = false;
    nlohmann::json payload;
    ErrorKind      kind = ErrorKind::Call;
    std::string    error;

    static CallResult success(nlohmann::json payload);
    static CallResult failure(ErrorKind kind, std::string error);
};

/**
 * @brief Table of requests awaiting exactly one response
 *
 * Every slot is single-use: it is consumed by resolve(), remove() or
 * fail_all() and never by two of them.
 */
class PendingCalls {
public:
    PendingCalls() = default;
    PendingCalls(const PendingCalls&) = delete;
    PendingCalls& operator=(const PendingCalls&) = delete;

    /// Next identifier, strictly increasing from 1
    uint64_t next_id() noexcept { return next_id_.fetch_add(1) + 1; }

    /// Register a slot for @p id; the returned future receives the outcome
    std::future<CallResult> add(uint64_t id);

    /// Deliver a result; false when no slot is waiting for @p id
    bool resolve(uint64_t id, CallResult result);

    /// Drop a slot without resolving it; false when it was already consumed
    bool remove(uint64_t id);

    /// Resolve every waiting slot with the same error
    void fail_all(ErrorKind kind, const std::string& reason);

    size_t size() const;

private:
    std::atomic<uint64_t> next_id_{0};
    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, std::promise<CallResult>> slots_;
};

} // namespace clawchat
