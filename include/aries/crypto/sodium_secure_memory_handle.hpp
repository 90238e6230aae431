#pragma once

#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>

namespace aries::protocol::crypto {

/**
 * @brief Sealed libsodium allocation holding one wallet secret key
 *
 * Seal copies the secret into sodium_malloc memory (guard pages, locked) and
 * flips the pages read-only; the bytes are only ever lent out through
 * WithReadAccess and are zeroed by sodium_free. Move-only.
 */
class SecureMemoryHandle {
public:
    [[nodiscard]] static Result<SecureMemoryHandle, SodiumFailure> Seal(std::span<const uint8_t> secret);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept = default;

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    template<typename F>
    auto WithReadAccess(F&& func) const -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(DisposedFailure());
        }
        return Result<T, SodiumFailure>::Ok(
            std::forward<F>(func)(std::span<const uint8_t>(static_cast<const uint8_t*>(ptr_), size_)));
    }

    [[nodiscard]] bool IsInvalid() const noexcept { return ptr_ == nullptr; }
    [[nodiscard]] size_t Size() const noexcept { return size_; }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    [[nodiscard]] static SodiumFailure DisposedFailure();
    void Reset() noexcept;

    void* ptr_ = nullptr;
    size_t size_ = 0;
};

}
