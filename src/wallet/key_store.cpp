#include "aries/wallet/key_store.hpp"
#include "aries/core/constants.hpp"
#include "aries/crypto/encoding.hpp"
#include "aries/crypto/sodium_interop.hpp"

namespace aries::protocol::wallet {
    using crypto::Encoding;
    using crypto::SodiumInterop;

    Result<std::unique_ptr<KeyStore>, ProtocolFailure> KeyStore::Create() {
        auto init_result = SodiumInterop::Initialize();
        if (init_result.IsErr()) {
            return Result<std::unique_ptr<KeyStore>, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(init_result.UnwrapErr()));
        }
        return Result<std::unique_ptr<KeyStore>, ProtocolFailure>::Ok(
            std::unique_ptr<KeyStore>(new KeyStore()));
    }

    Result<std::string, ProtocolFailure> KeyStore::CreateKey(
        std::optional<std::span<const uint8_t>> seed) {
        auto pair_result = SodiumInterop::GenerateEd25519KeyPair(seed);
        if (pair_result.IsErr()) {
            return Result<std::string, ProtocolFailure>::Err(pair_result.UnwrapErr());
        }
        auto [secret_handle, public_key] = std::move(pair_result).Unwrap();
        std::string verkey = Encoding::Base58Encode(public_key);

        std::unique_lock lock(lock_);
        keys_.insert_or_assign(verkey, std::move(secret_handle));
        return Result<std::string, ProtocolFailure>::Ok(std::move(verkey));
    }

    Result<DidInfo, ProtocolFailure> KeyStore::CreateAndStoreMyDid(
        std::optional<std::span<const uint8_t>> seed) {
        auto verkey_result = CreateKey(seed);
        if (verkey_result.IsErr()) {
            return Result<DidInfo, ProtocolFailure>::Err(verkey_result.UnwrapErr());
        }
        std::string verkey = std::move(verkey_result).Unwrap();

        auto raw_result = Encoding::Base58Decode(verkey);
        if (raw_result.IsErr()) {
            return Result<DidInfo, ProtocolFailure>::Err(raw_result.UnwrapErr());
        }
        const auto& raw = raw_result.Unwrap();
        std::string did = Encoding::Base58Encode(
            std::span<const uint8_t>(raw.data(), Constants::DID_SIZE));

        std::unique_lock lock(lock_);
        dids_.insert_or_assign(did, verkey);
        return Result<DidInfo, ProtocolFailure>::Ok(DidInfo{std::move(did), std::move(verkey)});
    }

    Result<std::string, ProtocolFailure> KeyStore::GetVerkeyForDid(std::string_view did) const {
        std::shared_lock lock(lock_);
        const auto it = dids_.find(std::string(did));
        if (it == dids_.end()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Unknown DID: " + std::string(did)));
        }
        return Result<std::string, ProtocolFailure>::Ok(it->second);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> KeyStore::Sign(
        std::string_view verkey,
        std::span<const uint8_t> message) const {
        return ExecuteWithKeyTyped<std::vector<uint8_t>>(
            verkey,
            [message](std::span<const uint8_t> secret_key) {
                return SodiumInterop::SignDetached(secret_key, message);
            });
    }

    Result<bool, ProtocolFailure> KeyStore::Verify(
        std::string_view verkey,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) {
        auto key_result = Encoding::Base58Decode(verkey);
        if (key_result.IsErr()) {
            return Result<bool, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("Verkey is not valid base58"));
        }
        return SodiumInterop::VerifyDetached(key_result.Unwrap(), message, signature);
    }

    bool KeyStore::HasKey(std::string_view verkey) const {
        std::shared_lock lock(lock_);
        return keys_.contains(std::string(verkey));
    }

    Result<Unit, ProtocolFailure> KeyStore::ExecuteWithKey(
        std::string_view verkey,
        std::function<Result<Unit, ProtocolFailure>(std::span<const uint8_t>)> operation) const {
        std::shared_lock lock(lock_);
        const auto it = keys_.find(std::string(verkey));
        if (it == keys_.end()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("No secret key stored for verkey " + std::string(verkey)));
        }
        auto access_result = it->second.WithReadAccess(
            [&operation](std::span<const uint8_t> secret_key) {
                return operation(secret_key);
            });
        if (access_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::FromSodiumFailure(access_result.UnwrapErr()));
        }
        return std::move(access_result).Unwrap();
    }

    size_t KeyStore::KeyCount() const {
        std::shared_lock lock(lock_);
        return keys_.size();
    }
}
