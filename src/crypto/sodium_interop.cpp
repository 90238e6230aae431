#include "aries/crypto/sodium_interop.hpp"
#include "aries/crypto/sodium_secure_memory_handle.hpp"

#include <cstring>

namespace aries::protocol::crypto {

namespace {

    Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer) {
        volatile uint8_t* vbuf = buffer.data();
        for (size_t i = 0; i < buffer.size(); ++i) {
            vbuf[i] = 0;
        }
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer) {
        sodium_memzero(buffer.data(), buffer.size());
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>;

}

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }

    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                "Buffer size " + std::to_string(buffer.size()) +
                " exceeds maximum " + std::to_string(MAX_BUFFER_SIZE)));
    }

    if (buffer.size() <= Constants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    return Result<bool, SodiumFailure>::Ok(sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

// ============================================================================
// Ed25519 keys and signatures
// ============================================================================

Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, ProtocolFailure>
SodiumInterop::GenerateEd25519KeyPair(std::optional<std::span<const uint8_t>> seed) {
    if (seed.has_value() && seed->size() != Constants::ED_25519_SEED_SIZE) {
        return KeyPairResult::Err(
            ProtocolFailure::InvalidInput(
                "Ed25519 seed must be " + std::to_string(Constants::ED_25519_SEED_SIZE) +
                " bytes, got " + std::to_string(seed->size())));
    }

    std::vector<uint8_t> pk_bytes(Constants::ED_25519_PUBLIC_KEY_SIZE);
    std::vector<uint8_t> sk_bytes(Constants::ED_25519_SECRET_KEY_SIZE);

    const int rc = seed.has_value()
                       ? crypto_sign_seed_keypair(pk_bytes.data(), sk_bytes.data(), seed->data())
                       : crypto_sign_keypair(pk_bytes.data(), sk_bytes.data());
    if (rc != 0) {
        (void)SecureWipe(std::span<uint8_t>(sk_bytes));
        return KeyPairResult::Err(
            ProtocolFailure::Crypto("Failed to generate Ed25519 key pair"));
    }

    auto sealed = SecureMemoryHandle::Seal(std::span<const uint8_t>(sk_bytes));
    (void)SecureWipe(std::span<uint8_t>(sk_bytes));
    if (sealed.IsErr()) {
        return KeyPairResult::Err(
            ProtocolFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sealed).Unwrap();

    return KeyPairResult::Ok(std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::SignDetached(
    std::span<const uint8_t> ed25519_secret_key,
    std::span<const uint8_t> message) {

    if (ed25519_secret_key.size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Invalid Ed25519 secret key size"));
    }

    std::vector<uint8_t> signature(Constants::ED_25519_SIGNATURE_SIZE);
    if (crypto_sign_detached(signature.data(), nullptr,
                             message.data(), message.size(),
                             ed25519_secret_key.data()) != 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Crypto("Failed to create Ed25519 signature"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(signature));
}

Result<bool, ProtocolFailure> SodiumInterop::VerifyDetached(
    std::span<const uint8_t> ed25519_public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) {

    if (ed25519_public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return Result<bool, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Invalid Ed25519 public key size"));
    }
    if (signature.size() != Constants::ED_25519_SIGNATURE_SIZE) {
        return Result<bool, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Invalid Ed25519 signature size"));
    }

    const int rc = crypto_sign_verify_detached(signature.data(),
                                               message.data(), message.size(),
                                               ed25519_public_key.data());
    return Result<bool, ProtocolFailure>::Ok(rc == 0);
}

// ============================================================================
// Ed25519 -> X25519 conversion
// ============================================================================

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ConvertPublicKeyToX25519(
    std::span<const uint8_t> ed25519_public_key) {

    if (ed25519_public_key.size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Crypto("Invalid Ed25519 public key size"));
    }

    std::vector<uint8_t> x25519_pk(Constants::X_25519_PUBLIC_KEY_SIZE);
    if (crypto_sign_ed25519_pk_to_curve25519(x25519_pk.data(), ed25519_public_key.data()) != 0) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Crypto("Ed25519 public key is not convertible to X25519"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(x25519_pk));
}

Result<std::vector<uint8_t>, ProtocolFailure> SodiumInterop::ConvertSecretKeyToX25519(
    std::span<const uint8_t> ed25519_secret_key) {

    if (ed25519_secret_key.size() != Constants::ED_25519_SECRET_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Crypto("Invalid Ed25519 secret key size"));
    }

    std::vector<uint8_t> x25519_sk(Constants::X_25519_PRIVATE_KEY_SIZE);
    if (crypto_sign_ed25519_sk_to_curve25519(x25519_sk.data(), ed25519_secret_key.data()) != 0) {
        (void)SecureWipe(std::span<uint8_t>(x25519_sk));
        return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
            ProtocolFailure::Crypto("Failed to convert Ed25519 secret key to X25519"));
    }
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(x25519_sk));
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint32_t SodiumInterop::GenerateRandomUInt32(bool ensure_non_zero) {
    uint32_t value;
    do {
        value = randombytes_random();
    } while (ensure_non_zero && value == 0);

    return value;
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}
