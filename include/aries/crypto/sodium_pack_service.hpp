#pragma once
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include "aries/interfaces/i_crypto_service.hpp"
#include "aries/interfaces/i_key_provider.hpp"
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>
namespace aries::protocol::crypto {
using interfaces::ICryptoService;
using interfaces::IKeyProvider;
using interfaces::UnpackedMessage;
/// DIDComm v1 JWE envelopes (Aries RFC 0019) on libsodium.
///
/// The content is sealed once with XChaCha20-Poly1305-IETF under a random
/// content key; the base64url protected header is the AAD. Each recipient
/// gets the content key through crypto_box from the sender (Authcrypt, the
/// sender verkey travels sealed to the recipient) or through crypto_box_seal
/// (Anoncrypt). Ed25519 verkeys are converted to X25519 for the box.
class SodiumPackService final : public ICryptoService {
public:
    explicit SodiumPackService(std::shared_ptr<const IKeyProvider> key_provider);
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Pack(
        const std::optional<std::string>& sender_verkey,
        const std::vector<std::string>& recipient_verkeys,
        std::span<const uint8_t> plaintext) const override;
    [[nodiscard]] Result<UnpackedMessage, ProtocolFailure> Unpack(
        std::span<const uint8_t> envelope) const override;
    [[nodiscard]] Result<std::vector<std::string>, ProtocolFailure> RecipientKeys(
        std::span<const uint8_t> envelope) const override;
private:
    std::shared_ptr<const IKeyProvider> key_provider_;
};
}
