#ifndef CLAWCHAT_SECURE_MEMORY_HPP
#define CLAWCHAT_SECURE_MEMORY_HPP

#include <cstdint>
#include <cstddef>

namespace clawchat {

/**
 * @brief Owned byte buffer for key material
 *
 * Zeroed with sodium_memzero on destruction and reassignment.
 * mlock is best-effort: it fails silently under RLIMIT_MEMLOCK.
 */
class SecureMemory {
public:
    SecureMemory();
    explicit SecureMemory(size_t size);
    SecureMemory(const uint8_t* data, size_t size);
    ~SecureMemory();

    // Key material is never copied implicitly
    SecureMemory(const SecureMemory&) = delete;
    SecureMemory& operator=(const SecureMemory&) = delete;

    SecureMemory(SecureMemory&& other) noexcept;
    SecureMemory& operator=(SecureMemory&& other) noexcept;

    uint8_t* data();
    const uint8_t* data() const;
    size_t size() const;
    bool empty() const;

    uint8_t* begin();
    uint8_t* end();
    const uint8_t* begin() const;
    const uint8_t* end() const;

    void zero();

    bool lock();
    bool unlock();

private:
    void release() noexcept;

    uint8_t* data_ = nullptr;
    size_t size_ = 0;
    bool locked_ = false;
};

} // namespace clawchat

#endif // CLAWCHAT_SECURE_MEMORY_HPP
