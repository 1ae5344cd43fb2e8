// File: secure_memory.hpp
// Brief: Locked, self-wiping buffer for private keys and derived cipher keys
//
// Pages are mlock()ed so the key never reaches swap, and the bytes are
// cleansed with OPENSSL_cleanse before the buffer is freed or reassigned.

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <utility>
#include <openssl/crypto.h>
#include <sys/mman.h>

namespace securewallet {

class SecureMemory {
public:
    // Zero-filled buffer, written through mutable_data()
    explicit SecureMemory(size_t length) : bytes_(new uint8_t[length]()), size_(length) {
        pin();
    }

    SecureMemory(const uint8_t* input, size_t length) : bytes_(new uint8_t[length]), size_(length) {
        std::memcpy(bytes_.get(), input, size_);
        pin();
    }

    ~SecureMemory() { wipe(); }

    SecureMemory(const SecureMemory&) = delete;
    SecureMemory& operator=(const SecureMemory&) = delete;

    SecureMemory(SecureMemory&& other) noexcept
        : bytes_(std::move(other.bytes_)), size_(std::exchange(other.size_, 0)) {}

    SecureMemory& operator=(SecureMemory&& other) noexcept {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
            size_ = std::exchange(other.size_, 0);
        }
        return *this;
    }

    const uint8_t* data() const { return bytes_.get(); }
    uint8_t* mutable_data() { return bytes_.get(); }
    size_t size() const { return size_; }
    bool empty() const { return !bytes_ || size_ == 0; }

    std::span<const uint8_t> view() const { return {bytes_.get(), size_}; }

private:
    void pin() {
        // Fails without CAP_IPC_LOCK or past RLIMIT_MEMLOCK; the wipe still happens
        (void)mlock(bytes_.get(), size_);
    }

    void wipe() {
        if (!bytes_) {
            return;
        }
        OPENSSL_cleanse(bytes_.get(), size_);
        munlock(bytes_.get(), size_);
        bytes_.reset();
        size_ = 0;
    }

    std::unique_ptr<uint8_t[]> bytes_;
    size_t size_ = 0;
};

} // namespace securewallet
