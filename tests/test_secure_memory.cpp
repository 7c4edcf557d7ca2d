/**
 * @file test_secure_memory.cpp
 * @brief SecureMemory as holder of the device private key
 */

#include <gtest/gtest.h>
#include "clawchat_secure_memory.hpp"

#include <algorithm>
#include <cstring>
#include <utility>
#include <vector>

using namespace clawchat;

namespace {

bool all_zero(const SecureMemory& mem) {
    return std::all_of(mem.begin(), mem.end(), [](uint8_t b) { return b == 0; });
}

} // namespace

class SecureMemoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        key.resize(64);
        for (size_t i = 0; i < key.size(); ++i) key[i] = static_cast<uint8_t>(i + 1);
    }

    std::vector<uint8_t> key;
};

// ---- Construction ----

TEST_F(SecureMemoryTest, CopiesKeyBytesFromDecodedBuffer) {
    SecureMemory mem(key.data(), key.size());

    // The decoded buffer is wiped after the copy, as when loading from disk
    std::fill(key.begin(), key.end(), 0);

    ASSERT_EQ(mem.size(), 64u);
    EXPECT_EQ(mem.data()[0], 1);
    EXPECT_EQ(mem.data()[63], 64);
}

TEST_F(SecureMemoryTest, SizedBufferStartsZeroed) {
    SecureMemory mem(32);
    EXPECT_EQ(mem.size(), 32u);
    EXPECT_TRUE(all_zero(mem));

    SecureMemory from_null(nullptr, 16);
    EXPECT_EQ(from_null.size(), 16u);
    EXPECT_TRUE(all_zero(from_null));
}

TEST_F(SecureMemoryTest, EmptyBuffer) {
    SecureMemory mem;
    EXPECT_TRUE(mem.empty());
    EXPECT_EQ(mem.data(), nullptr);
    EXPECT_EQ(mem.begin(), mem.end());
    EXPECT_FALSE(mem.lock());

    SecureMemory zero_sized(key.data(), 0);
    EXPECT_TRUE(zero_sized.empty());
}

// ---- Ownership ----

TEST_F(SecureMemoryTest, MoveHandsOverTheSameBuffer) {
    SecureMemory original(key.data(), key.size());
    const uint8_t* bytes = original.data();

    SecureMemory moved(std::move(original));
    EXPECT_EQ(moved.data(), bytes);
    EXPECT_EQ(moved.size(), 64u);
    EXPECT_TRUE(original.empty());
    EXPECT_EQ(original.data(), nullptr);
}

TEST_F(SecureMemoryTest, MoveAssignReplacesPreviousKey) {
    SecureMemory target(16);
    std::memset(target.data(), 0xEF, 16);

    target = SecureMemory(key.data(), key.size());
    ASSERT_EQ(target.size(), 64u);
    EXPECT_EQ(target.data()[0], 1);

    SecureMemory& alias = target;
    target = std::move(alias);
    EXPECT_EQ(target.size(), 64u);
    EXPECT_EQ(target.data()[1], 2);
}

// ---- Wiping and locking ----

TEST_F(SecureMemoryTest, ZeroWipesKeyBytes) {
    SecureMemory mem(key.data(), key.size());
    ASSERT_FALSE(all_zero(mem));

    mem.zero();
    EXPECT_EQ(mem.size(), 64u);
    EXPECT_TRUE(all_zero(mem));
}

TEST_F(SecureMemoryTest, LockIsBestEffort) {
    SecureMemory mem(key.data(), key.size());

    // mlock may be refused under RLIMIT_MEMLOCK
    if (mem.lock()) {
        EXPECT_FALSE(mem.lock());
        EXPECT_TRUE(mem.unlock());
    }
    EXPECT_FALSE(mem.unlock());
}

TEST_F(SecureMemoryTest, LockedBufferMovesWithItsLock) {
    SecureMemory mem(key.data(), key.size());
    const bool locked = mem.lock();

    SecureMemory moved(std::move(mem));
    EXPECT_FALSE(mem.unlock());
    EXPECT_EQ(moved.unlock(), locked);
}
