#pragma once
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
namespace aries::protocol::interfaces {
using protocol::Result;
using protocol::ProtocolFailure;
struct UnpackedMessage {
    std::string message;
    /// Present only when the envelope was authcrypted.
    std::optional<std::string> sender_verkey;
    std::string recipient_verkey;
};
/// Pack/unpack collaborator for DIDComm envelopes. Keys are base58 verkeys.
///
/// Pack with a sender key produces an authenticated envelope, without one an
/// anonymous envelope. Malformed keys or ciphertexts yield Crypto failures.
class ICryptoService {
public:
    virtual ~ICryptoService() = default;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ProtocolFailure> Pack(
        const std::optional<std::string>& sender_verkey,
        const std::vector<std::string>& recipient_verkeys,
        std::span<const uint8_t> plaintext) const = 0;
    [[nodiscard]] virtual Result<UnpackedMessage, ProtocolFailure> Unpack(
        std::span<const uint8_t> envelope) const = 0;
    /// Verkeys an envelope is addressed to, read without decrypting it.
    [[nodiscard]] virtual Result<std::vector<std::string>, ProtocolFailure> RecipientKeys(
        std::span<const uint8_t> envelope) const = 0;
};
}
