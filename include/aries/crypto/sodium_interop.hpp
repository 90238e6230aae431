#pragma once

#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include "aries/core/constants.hpp"
#include "aries/crypto/sodium_secure_memory_handle.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace aries::protocol::crypto {

/**
 * @brief Interop layer for the libsodium primitives the pack service and
 * key store are built from.
 *
 * Every key-handling method keeps secret material either in a
 * SecureMemoryHandle or in a caller-owned buffer that the caller wipes.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different (including size mismatch)
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Ed25519 keys and signatures
    // ========================================================================

    /**
     * @brief Generate an Ed25519 signing key pair
     *
     * @param seed Optional 32-byte seed; identical seeds yield identical keys
     * @return Ok((secret_key_handle, public_key_bytes)) or Err
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
    GenerateEd25519KeyPair(std::optional<std::span<const uint8_t>> seed = std::nullopt);

    static Result<std::vector<uint8_t>, ProtocolFailure> SignDetached(
        std::span<const uint8_t> ed25519_secret_key,
        std::span<const uint8_t> message);

    /**
     * @brief Verify a detached Ed25519 signature
     *
     * @return Ok(false) for a well-formed but invalid signature, Err for bad sizes
     */
    static Result<bool, ProtocolFailure> VerifyDetached(
        std::span<const uint8_t> ed25519_public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);

    // ========================================================================
    // Ed25519 -> X25519 conversion (crypto_box keys)
    // ========================================================================

    static Result<std::vector<uint8_t>, ProtocolFailure> ConvertPublicKeyToX25519(
        std::span<const uint8_t> ed25519_public_key);

    /// The returned buffer holds secret material; the caller must wipe it.
    static Result<std::vector<uint8_t>, ProtocolFailure> ConvertSecretKeyToX25519(
        std::span<const uint8_t> ed25519_secret_key);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static uint32_t GenerateRandomUInt32(bool ensure_non_zero = false);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
