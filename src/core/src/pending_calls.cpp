#include "clawchat_pending_calls.hpp"

#include <vector>

namespace clawchat {

CallResult CallResult::success(nlohmann::json payload) {
    CallResult r;
    r.ok = true;
    r.payload = std::move(payload);
    return r;
}

CallResult CallResult::failure(ErrorKind kind, std::string error) {
    CallResult r;
    r.ok = false;
    r.kind = kind;
    r.error = std::move(error);
    return r;
}

std::future<CallResult> PendingCalls::add(uint64_t id) {
    std::promise<CallResult> promise;
    std::future<CallResult> future = promise.get_future();
    std::lock_guard<std::mutex> lock(mutex_);
    slots_[id] = std::move(promise);
    return future;
}

bool PendingCalls::resolve(uint64_t id, CallResult result) {
    std::promise<CallResult> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(id);
        if (it == slots_.end()) return false;
        promise = std::move(it->second);
        slots_.erase(it);
    }
    promise.set_value(std::move(result));
    return true;
}

bool PendingCalls::remove(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.erase(id) > 0;
}

void PendingCalls::fail_all(ErrorKind kind, const std::string& reason) {
    std::vector<std::promise<CallResult>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.reserve(slots_.size());
        for (auto& entry : slots_) drained.push_back(std::move(entry.second));
        slots_.clear();
    }
    for (auto& promise : drained) {
        promise.set_value(CallResult::failure(kind, reason));
    }
}

size_t PendingCalls::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

} // namespace clawchat
