#include "aries/crypto/sodium_secure_memory_handle.hpp"
#include "aries/crypto/sodium_interop.hpp"
#include "aries/core/constants.hpp"

#include <sodium.h>
#include <cstring>

namespace aries::protocol::crypto {

Result<SecureMemoryHandle, SodiumFailure> SecureMemoryHandle::Seal(std::span<const uint8_t> secret) {
    using SealResult = Result<SecureMemoryHandle, SodiumFailure>;
    if (!SodiumInterop::IsInitialized()) {
        return SealResult::Err(SodiumFailure::InitializationFailed(std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (secret.empty()) {
        return SealResult::Err(SodiumFailure::AllocationFailed("Refusing to seal an empty secret"));
    }

    void* ptr = SodiumInterop::AllocateSecure(secret.size());
    if (ptr == nullptr) {
        return SealResult::Err(SodiumFailure::AllocationFailed(
            std::string(ErrorMessages::FAILED_TO_ALLOCATE_SECURE_MEMORY) + std::to_string(secret.size()) + " bytes"));
    }
    SecureMemoryHandle handle(ptr, secret.size());
    std::memcpy(ptr, secret.data(), secret.size());
    if (sodium_mprotect_readonly(ptr) != 0) {
        return SealResult::Err(SodiumFailure::WriteOperationFailed("Failed to make sealed key memory read-only"));
    }
    return SealResult::Ok(std::move(handle));
}

SecureMemoryHandle::~SecureMemoryHandle() {
    Reset();
}

SecureMemoryHandle::SecureMemoryHandle(SecureMemoryHandle&& other) noexcept
    : ptr_(std::exchange(other.ptr_, nullptr))
    , size_(std::exchange(other.size_, 0)) {
}

SecureMemoryHandle& SecureMemoryHandle::operator=(SecureMemoryHandle&& other) noexcept {
    if (this != &other) {
        Reset();
        ptr_ = std::exchange(other.ptr_, nullptr);
        size_ = std::exchange(other.size_, 0);
    }
    return *this;
}

SodiumFailure SecureMemoryHandle::DisposedFailure() {
    return SodiumFailure::InvalidOperation(std::string(ErrorMessages::HANDLE_DISPOSED));
}

void SecureMemoryHandle::Reset() noexcept {
    // sodium_free lifts the read-only protection before zeroing.
    if (ptr_ != nullptr) {
        SodiumInterop::FreeSecure(ptr_);
        ptr_ = nullptr;
        size_ = 0;
    }
}

}
