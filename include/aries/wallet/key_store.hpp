#pragma once
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include "aries/crypto/sodium_secure_memory_handle.hpp"
#include "aries/interfaces/i_key_provider.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
namespace aries::protocol::wallet {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
using crypto::SecureMemoryHandle;
struct DidInfo {
    std::string did;
    std::string verkey;
};
/// In-process wallet for Ed25519 signing keys.
///
/// Secret keys live in guarded memory and are only lent out through
/// ExecuteWithKey. Keys are addressed by their base58 verkey; a DID is the
/// base58 encoding of the first 16 bytes of its verkey.
class KeyStore final : public interfaces::IKeyProvider {
public:
    [[nodiscard]] static Result<std::unique_ptr<KeyStore>, ProtocolFailure> Create();
    /// Deterministic when a 32-byte seed is given. Returns the base58 verkey.
    [[nodiscard]] Result<std::string, ProtocolFailure> CreateKey(
        std::optional<std::span<const uint8_t>> seed = std::nullopt);
    [[nodiscard]] Result<DidInfo, ProtocolFailure> CreateAndStoreMyDid(
        std::optional<std::span<const uint8_t>> seed = std::nullopt);
    [[nodiscard]] Result<std::string, ProtocolFailure> GetVerkeyForDid(std::string_view did) const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Sign(
        std::string_view verkey,
        std::span<const uint8_t> message) const;
    [[nodiscard]] static Result<bool, ProtocolFailure> Verify(
        std::string_view verkey,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature);
    [[nodiscard]] bool HasKey(std::string_view verkey) const override;
    [[nodiscard]] Result<Unit, ProtocolFailure> ExecuteWithKey(
        std::string_view verkey,
        std::function<Result<Unit, ProtocolFailure>(std::span<const uint8_t>)> operation) const override;
    [[nodiscard]] size_t KeyCount() const;
    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;
    ~KeyStore() override = default;
private:
    KeyStore() = default;
    mutable std::shared_mutex lock_;
    std::unordered_map<std::string, SecureMemoryHandle> keys_;
    std::unordered_map<std::string, std::string> dids_;
};
}
