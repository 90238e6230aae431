#pragma once
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include "aries/did/did_doc.hpp"
#include "aries/interfaces/i_crypto_service.hpp"
#include "aries/messages/a2a_message.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace aries::protocol::envelope {
using protocol::Result;
using protocol::ProtocolFailure;
using interfaces::ICryptoService;
using messages::A2AMessage;
/// Packed transport bytes plus the number of Forward layers wrapped around
/// the message.
class EncryptionEnvelope {
public:
    /// Packs the message for every recipient key of the document (authcrypt
    /// when sender_verkey is set, anoncrypt otherwise) and wraps one Forward
    /// per routing key, innermost first. Addressing failure when the document
    /// resolves to no recipient key; nothing is packed in that case.
    [[nodiscard]] static Result<EncryptionEnvelope, ProtocolFailure> Create(
        const ICryptoService& crypto,
        const A2AMessage& message,
        const std::optional<std::string>& sender_verkey,
        const did::DidDoc& did_doc,
        messages::MessageTypePrefix prefix = messages::MessageTypePrefix::Legacy);
    /// Unpacks one layer. Parse failures are MalformedMessage.
    [[nodiscard]] static Result<A2AMessage, ProtocolFailure> AnonUnpack(
        const ICryptoService& crypto,
        std::span<const uint8_t> payload);
    /// As AnonUnpack, but the envelope must report expected_sender_verkey as
    /// its sender; anything else is an Authentication failure.
    [[nodiscard]] static Result<A2AMessage, ProtocolFailure> AuthUnpack(
        const ICryptoService& crypto,
        std::span<const uint8_t> payload,
        std::string_view expected_sender_verkey);
    [[nodiscard]] const std::vector<uint8_t>& GetPayload() const noexcept { return payload_; }
    [[nodiscard]] std::vector<uint8_t> TakePayload() && { return std::move(payload_); }
    [[nodiscard]] size_t GetForwardLayers() const noexcept { return forward_layers_; }
private:
    EncryptionEnvelope(std::vector<uint8_t> payload, size_t forward_layers)
        : payload_(std::move(payload)), forward_layers_(forward_layers) {}
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> WrapForward(
        const ICryptoService& crypto,
        std::vector<uint8_t> payload,
        const std::string& recipient_verkey,
        const std::vector<std::string>& routing_keys,
        messages::MessageTypePrefix prefix);
    std::vector<uint8_t> payload_;
    size_t forward_layers_;
};
}
