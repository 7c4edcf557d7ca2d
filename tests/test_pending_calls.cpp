#include <gtest/gtest.h>
#include "clawchat_pending_calls.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

using namespace clawchat;

class PendingCallsTest : public ::testing::Test {
protected:
    PendingCalls calls;
};

TEST_F(PendingCallsTest, IdsIncreaseFromOne) {
    EXPECT_EQ(calls.next_id(), 1u);
    EXPECT_EQ(calls.next_id(), 2u);
    EXPECT_EQ(calls.next_id(), 3u);
}

TEST_F(PendingCallsTest, IdsUniqueAcrossThreads) {
    std::vector<std::vector<uint64_t>> per_thread(4);
    std::vector<std::thread> threads;
    for (auto& out : per_thread) {
        threads.emplace_back([this, &out] {
            for (int i = 0; i < 1000; ++i) out.push_back(calls.next_id());
        });
    }
    for (auto& t : threads) t.join();

    std::vector<uint64_t> all;
    for (const auto& v : per_thread) all.insert(all.end(), v.begin(), v.end());
    std::sort(all.begin(), all.end());
    EXPECT_EQ(std::adjacent_find(all.begin(), all.end()), all.end());
    EXPECT_EQ(all.front(), 1u);
    EXPECT_EQ(all.back(), 4000u);
}

TEST_F(PendingCallsTest, ResolveDeliversOnce) {
    auto future = calls.add(7);
    EXPECT_EQ(calls.size(), 1u);

    EXPECT_TRUE(calls.resolve(7, CallResult::success({{"x", 1}})));
    EXPECT_FALSE(calls.resolve(7, CallResult::success({{"x", 2}})));
    EXPECT_EQ(calls.size(), 0u);

    CallResult r = future.get();
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.payload["x"], 1);
}

TEST_F(PendingCallsTest, UnknownIdIgnored) {
    EXPECT_FALSE(calls.resolve(99, CallResult::success(nullptr)));
    EXPECT_FALSE(calls.remove(99));
}

TEST_F(PendingCallsTest, RemovedSlotCannotBeResolved) {
    auto future = calls.add(1);
    EXPECT_TRUE(calls.remove(1));
    EXPECT_FALSE(calls.resolve(1, CallResult::success(nullptr)));
    EXPECT_FALSE(calls.remove(1));
}

TEST_F(PendingCallsTest, FailAllResolvesEverySlot) {
    auto a = calls.add(1);
    auto b = calls.add(2);

    calls.fail_all(ErrorKind::Closed, "client closed");
    EXPECT_EQ(calls.size(), 0u);

    for (auto* f : {&a, &b}) {
        ASSERT_EQ(f->wait_for(std::chrono::seconds(1)), std::future_status::ready);
        CallResult r = f->get();
        EXPECT_FALSE(r.ok);
        EXPECT_EQ(r.kind, ErrorKind::Closed);
        EXPECT_EQ(r.error, "client closed");
    }
}
