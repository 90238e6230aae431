#pragma once
#include "aries/interfaces/i_crypto_service.hpp"
#include <optional>
#include <span>
#include <string>
#include <vector>
namespace aries::protocol::crypto {
using interfaces::ICryptoService;
using interfaces::UnpackedMessage;
/// Pack strategy that performs no encryption.
///
/// Keeps the addressing of the sodium service (recipient kids, the reported
/// sender) so envelope, relay and state machine logic run unchanged, while the
/// message itself stays readable. Chosen per agent at construction time; meant
/// for tests and local debugging only.
class PlaintextPackService final : public ICryptoService {
public:
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Pack(
        const std::optional<std::string>& sender_verkey,
        const std::vector<std::string>& recipient_verkeys,
        std::span<const uint8_t> plaintext) const override;
    [[nodiscard]] Result<UnpackedMessage, ProtocolFailure> Unpack(
        std::span<const uint8_t> envelope) const override;
    [[nodiscard]] Result<std::vector<std::string>, ProtocolFailure> RecipientKeys(
        std::span<const uint8_t> envelope) const override;
};
}
