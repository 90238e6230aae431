#include "aries/envelope/encryption_envelope.hpp"
#include "aries/core/constants.hpp"
#include "aries/crypto/encoding.hpp"
#include "aries/debug/protocol_trace.hpp"

#include <nlohmann/json.hpp>

namespace aries::protocol::envelope {
    using crypto::Encoding;
    using json = nlohmann::json;

    Result<EncryptionEnvelope, ProtocolFailure> EncryptionEnvelope::Create(
        const ICryptoService& crypto,
        const A2AMessage& message,
        const std::optional<std::string>& sender_verkey,
        const did::DidDoc& did_doc,
        const messages::MessageTypePrefix prefix) {
        const did::ResolvedKeys keys = did_doc.ResolveKeys();
        if (keys.recipient_keys.empty()) {
            return Result<EncryptionEnvelope, ProtocolFailure>::Err(
                ProtocolFailure::Addressing(std::string(ErrorMessages::NO_RECIPIENT_KEYS)));
        }

        const std::string plaintext = messages::Serialize(message, prefix);
        auto packed = crypto.Pack(sender_verkey, keys.recipient_keys, Encoding::AsBytes(plaintext));
        if (packed.IsErr()) {
            return Result<EncryptionEnvelope, ProtocolFailure>::Err(packed.UnwrapErr());
        }

        auto wrapped = WrapForward(crypto, std::move(packed).Unwrap(),
                                   keys.recipient_keys.front(), keys.routing_keys, prefix);
        if (wrapped.IsErr()) {
            return Result<EncryptionEnvelope, ProtocolFailure>::Err(wrapped.UnwrapErr());
        }

        debug::TraceEnvelopeCreated(keys.recipient_keys.size(), keys.routing_keys.size(),
                                    sender_verkey.has_value(), wrapped.Unwrap().size());
        return Result<EncryptionEnvelope, ProtocolFailure>::Ok(
            EncryptionEnvelope(std::move(wrapped).Unwrap(), keys.routing_keys.size()));
    }

    Result<std::vector<uint8_t>, ProtocolFailure> EncryptionEnvelope::WrapForward(
        const ICryptoService& crypto,
        std::vector<uint8_t> payload,
        const std::string& recipient_verkey,
        const std::vector<std::string>& routing_keys,
        const messages::MessageTypePrefix prefix) {
        std::string to = recipient_verkey;
        for (const auto& routing_key : routing_keys) {
            json inner = json::parse(payload.begin(), payload.end(), nullptr, false);
            if (inner.is_discarded()) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::Crypto("Packed payload is not JSON and cannot be forwarded"));
            }
            const A2AMessage forward = messages::Forward{to, std::move(inner)};
            const std::string forward_text = messages::Serialize(forward, prefix);

            auto packed = crypto.Pack(std::nullopt, {routing_key}, Encoding::AsBytes(forward_text));
            if (packed.IsErr()) {
                return packed;
            }
            payload = std::move(packed).Unwrap();
            to = routing_key;
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(payload));
    }

    Result<A2AMessage, ProtocolFailure> EncryptionEnvelope::AnonUnpack(
        const ICryptoService& crypto,
        std::span<const uint8_t> payload) {
        auto unpacked = crypto.Unpack(payload);
        if (unpacked.IsErr()) {
            return Result<A2AMessage, ProtocolFailure>::Err(unpacked.UnwrapErr());
        }
        auto message = messages::Parse(unpacked.Unwrap().message);
        if (message.IsErr()) {
            return message;
        }
        debug::TraceEnvelopeUnpacked(messages::MessageKindName(messages::KindOf(message.Unwrap())),
                                     unpacked.Unwrap().sender_verkey.has_value());
        return message;
    }

    Result<A2AMessage, ProtocolFailure> EncryptionEnvelope::AuthUnpack(
        const ICryptoService& crypto,
        std::span<const uint8_t> payload,
        std::string_view expected_sender_verkey) {
        auto unpacked = crypto.Unpack(payload);
        if (unpacked.IsErr()) {
            return Result<A2AMessage, ProtocolFailure>::Err(unpacked.UnwrapErr());
        }
        const auto& sender = unpacked.Unwrap().sender_verkey;
        if (!sender.has_value()) {
            return Result<A2AMessage, ProtocolFailure>::Err(
                ProtocolFailure::Authentication("Envelope was anonymously encrypted; sender verkey required"));
        }
        if (*sender != expected_sender_verkey) {
            return Result<A2AMessage, ProtocolFailure>::Err(
                ProtocolFailure::Authentication(
                    "Sender verkey " + *sender + " does not match expected " +
                    std::string(expected_sender_verkey)));
        }
        auto message = messages::Parse(unpacked.Unwrap().message);
        if (message.IsErr()) {
            return message;
        }
        debug::TraceEnvelopeUnpacked(messages::MessageKindName(messages::KindOf(message.Unwrap())), true);
        return message;
    }
}
