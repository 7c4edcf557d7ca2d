#include "clawchat_secure_memory.hpp"
#include <sodium.h>
#include <cstring>
#include <sys/mman.h>

namespace clawchat {

SecureMemory::SecureMemory() = default;

SecureMemory::SecureMemory(size_t size)
    : size_(size)
{
    if (size > 0) {
        data_ = new uint8_t[size];
        std::memset(data_, 0, size_);
    }
}

SecureMemory::SecureMemory(const uint8_t* data, size_t size)
    : SecureMemory(size)
{
    if (data && size > 0) {
        std::memcpy(data_, data, size);
    }
}

SecureMemory::~SecureMemory() {
    release();
}

SecureMemory::SecureMemory(SecureMemory&& other) noexcept
    : data_(other.data_), size_(other.size_), locked_(other.locked_)
{
    other.data_ = nullptr;
    other.size_ = 0;
    other.locked_ = false;
}

SecureMemory& SecureMemory::operator=(SecureMemory&& other) noexcept {
    if (this != &other) {
        release();
        data_ = other.data_;
        size_ = other.size_;
        locked_ = other.locked_;
        other.data_ = nullptr;
        other.size_ = 0;
        other.locked_ = false;
    }
    return *this;
}

void SecureMemory::release() noexcept {
    if (data_) {
        zero();
        if (locked_) unlock();
        delete[] data_;
        data_ = nullptr;
    }
    size_ = 0;
    locked_ = false;
}

uint8_t* SecureMemory::data() { return data_; }
const uint8_t* SecureMemory::data() const { return data_; }
size_t SecureMemory::size() const { return size_; }
bool SecureMemory::empty() const { return size_ == 0; }

uint8_t* SecureMemory::begin() { return data_; }
uint8_t* SecureMemory::end() { return data_ + size_; }
const uint8_t* SecureMemory::begin() const { return data_; }
const uint8_t* SecureMemory::end() const { return data_ + size_; }

void SecureMemory::zero() {
    if (data_ && size_ > 0) {
        sodium_memzero(data_, size_);
    }
}

bool SecureMemory::lock() {
    if (data_ && size_ > 0 && !locked_) {
        if (mlock(data_, size_) == 0) {
            locked_ = true;
            return true;
        }
    }
    return false;
}

bool SecureMemory::unlock() {
    if (data_ && size_ > 0 && locked_) {
        if (munlock(data_, size_) == 0) {
            locked_ = false;
            return true;
        }
    }
    return false;
}

} // namespace clawchat
