#include "aries/crypto/plaintext_pack_service.hpp"
#include "aries/crypto/encoding.hpp"

#include <nlohmann/json.hpp>

namespace aries::protocol::crypto {
    using json = nlohmann::json;

    namespace {
        constexpr std::string_view kPlaintextTyp = "plaintext";

        Result<json, ProtocolFailure> ParsePlaintextEnvelope(std::span<const uint8_t> envelope) {
            json value = json::parse(envelope.begin(), envelope.end(), nullptr, false);
            if (value.is_discarded() || !value.is_object() ||
                !value.contains("typ") || !value["typ"].is_string() ||
                value["typ"].get<std::string>() != kPlaintextTyp ||
                !value.contains("recipients") || !value["recipients"].is_array() ||
                !value.contains("msg") || !value["msg"].is_string()) {
                return Result<json, ProtocolFailure>::Err(
                    ProtocolFailure::Crypto("Not a plaintext envelope"));
            }
            return Result<json, ProtocolFailure>::Ok(std::move(value));
        }
    }

    Result<std::vector<uint8_t>, ProtocolFailure> PlaintextPackService::Pack(
        const std::optional<std::string>& sender_verkey,
        const std::vector<std::string>& recipient_verkeys,
        std::span<const uint8_t> plaintext) const {
        if (recipient_verkeys.empty()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("Cannot pack for zero recipients"));
        }
        json envelope = {
            {"typ", kPlaintextTyp},
            {"recipients", recipient_verkeys},
            {"msg", Encoding::AsString(plaintext)}
        };
        envelope["sender"] = sender_verkey.has_value() ? json(*sender_verkey) : json(nullptr);
        const std::string text = envelope.dump();
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
            std::vector<uint8_t>(text.begin(), text.end()));
    }

    Result<UnpackedMessage, ProtocolFailure> PlaintextPackService::Unpack(
        std::span<const uint8_t> envelope) const {
        auto parsed = ParsePlaintextEnvelope(envelope);
        if (parsed.IsErr()) {
            return Result<UnpackedMessage, ProtocolFailure>::Err(parsed.UnwrapErr());
        }
        const json& value = parsed.Unwrap();
        const json& recipients = value["recipients"];

        UnpackedMessage unpacked;
        unpacked.message = value["msg"].get<std::string>();
        if (value.contains("sender") && value["sender"].is_string()) {
            unpacked.sender_verkey = value["sender"].get<std::string>();
        }
        if (!recipients.empty() && recipients.front().is_string()) {
            unpacked.recipient_verkey = recipients.front().get<std::string>();
        }
        return Result<UnpackedMessage, ProtocolFailure>::Ok(std::move(unpacked));
    }

    Result<std::vector<std::string>, ProtocolFailure> PlaintextPackService::RecipientKeys(
        std::span<const uint8_t> envelope) const {
        auto parsed = ParsePlaintextEnvelope(envelope);
        if (parsed.IsErr()) {
            return Result<std::vector<std::string>, ProtocolFailure>::Err(parsed.UnwrapErr());
        }
        std::vector<std::string> keys;
        for (const auto& entry : parsed.Unwrap()["recipients"]) {
            if (entry.is_string()) {
                keys.push_back(entry.get<std::string>());
            }
        }
        return Result<std::vector<std::string>, ProtocolFailure>::Ok(std::move(keys));
    }
}
