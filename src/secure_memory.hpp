// File: secure_memory.hpp
// Brief: Locked, self-wiping storage for private key bytes
// 
// The buffer is pinned with mlock so it is not swapped to disk and is
// zeroed before release. Copies are not allowed; ownership moves.

#pragma once

#include <span>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <sys/mman.h>

namespace bitcli {

class SecureMemory {
private:
    uint8_t* data_;
    size_t size_;

    void wipe() {
        if (data_) {
            // volatile write so the compiler keeps the zeroing
            volatile uint8_t* p = data_;
            for (size_t i = 0; i < size_; ++i) {
                p[i] = 0;
            }
            munlock(data_, size_);
            delete[] data_;
            data_ = nullptr;
            size_ = 0;
        }
    }
    
public:
    SecureMemory() : data_(nullptr), size_(0) {}

    explicit SecureMemory(std::span<const uint8_t> input)
        : data_(new uint8_t[input.size()]), size_(input.size()) {
        std::memcpy(data_, input.data(), size_);
        // mlock can fail without CAP_IPC_LOCK or over RLIMIT_MEMLOCK; the
        // buffer is still wiped on release
        (void)mlock(data_, size_);
    }
    
    ~SecureMemory() { wipe(); }
    
    SecureMemory(const SecureMemory&) = delete;
    SecureMemory& operator=(const SecureMemory&) = delete;
    
    SecureMemory(SecureMemory&& other) noexcept : data_(other.data_), size_(other.size_) {
        other.data_ = nullptr;
        other.size_ = 0;
    }
    
    SecureMemory& operator=(SecureMemory&& other) noexcept {
        if (this != &other) {
            wipe();
            data_ = other.data_;
            size_ = other.size_;
            other.data_ = nullptr;
            other.size_ = 0;
        }
        return *this;
    }
    
    std::span<const uint8_t> span() const { return {data_, size_}; }
    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0 || data_ == nullptr; }
};

} // namespace bitcli
