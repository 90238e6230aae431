#include "aries/protocol/connection/connection_signature.hpp"
#include "aries/core/constants.hpp"
#include "aries/crypto/encoding.hpp"
#include "aries/crypto/sodium_interop.hpp"

#include <nlohmann/json.hpp>

namespace aries::protocol::connection {
    using json = nlohmann::json;
    using crypto::Encoding;
    using crypto::SodiumInterop;

    namespace {
        std::vector<uint8_t> BuildSigData(const ConnectionData& data, const uint64_t timestamp) {
            const std::string body = json{
                {"DID", data.did},
                {"DIDDoc", data.did_doc.ToJson()}
            }.dump();
            std::vector<uint8_t> sig_data;
            sig_data.reserve(Constants::SIG_DATA_TIMESTAMP_SIZE + body.size());
            for (size_t i = 0; i < Constants::SIG_DATA_TIMESTAMP_SIZE; ++i) {
                const size_t shift = 8 * (Constants::SIG_DATA_TIMESTAMP_SIZE - 1 - i);
                sig_data.push_back(static_cast<uint8_t>((timestamp >> shift) & 0xFF));
            }
            const auto body_bytes = Encoding::AsBytes(body);
            sig_data.insert(sig_data.end(), body_bytes.begin(), body_bytes.end());
            return sig_data;
        }

        Result<ConnectionData, ProtocolFailure> ParseSigData(std::span<const uint8_t> sig_data) {
            if (sig_data.size() <= Constants::SIG_DATA_TIMESTAMP_SIZE) {
                return Result<ConnectionData, ProtocolFailure>::Err(
                    ProtocolFailure::MalformedMessage("connection~sig data is too short"));
            }
            const std::string body = Encoding::AsString(sig_data.subspan(Constants::SIG_DATA_TIMESTAMP_SIZE));
            auto parsed = Result<json, ProtocolFailure>::Try(
                [&body]() { return json::parse(body); },
                [](const std::exception& ex) {
                    return ProtocolFailure::MalformedMessage(
                        std::string("connection~sig data is not JSON: ") + ex.what());
                });
            if (parsed.IsErr()) {
                return Result<ConnectionData, ProtocolFailure>::Err(parsed.UnwrapErr());
            }
            const json& value = parsed.Unwrap();
            if (!value.is_object() || !value.contains("DID") || !value.contains("DIDDoc") ||
                !value.at("DID").is_string()) {
                return Result<ConnectionData, ProtocolFailure>::Err(
                    ProtocolFailure::MalformedMessage("connection~sig data lacks DID or DIDDoc"));
            }
            auto doc = did::DidDoc::FromJson(value.at("DIDDoc"));
            if (doc.IsErr()) {
                return Result<ConnectionData, ProtocolFailure>::Err(doc.UnwrapErr());
            }
            ConnectionData data;
            data.did = value.at("DID").get<std::string>();
            data.did_doc = std::move(doc).Unwrap();
            return Result<ConnectionData, ProtocolFailure>::Ok(std::move(data));
        }
    }

    Result<SignatureDecorator, ProtocolFailure> ConnectionSignature::Sign(
        const interfaces::IKeyProvider& keys,
        std::string_view signer_verkey,
        const ConnectionData& data,
        const uint64_t timestamp) {
        const std::vector<uint8_t> sig_data = BuildSigData(data, timestamp);
        auto signature = keys.ExecuteWithKeyTyped<std::vector<uint8_t>>(
            signer_verkey,
            [&sig_data](std::span<const uint8_t> secret_key) {
                return SodiumInterop::SignDetached(secret_key, sig_data);
            });
        if (signature.IsErr()) {
            return Result<SignatureDecorator, ProtocolFailure>::Err(signature.UnwrapErr());
        }

        SignatureDecorator decorator;
        decorator.type = std::string(SIGNATURE_TYPE);
        decorator.signature = Encoding::Base64UrlEncode(signature.Unwrap());
        decorator.sig_data = Encoding::Base64UrlEncode(sig_data);
        decorator.signer = std::string(signer_verkey);
        return Result<SignatureDecorator, ProtocolFailure>::Ok(std::move(decorator));
    }

    Result<ConnectionData, ProtocolFailure> ConnectionSignature::Verify(const SignatureDecorator& signature) {
        auto sig_data = Encoding::Base64UrlDecode(signature.sig_data);
        auto sig_bytes = Encoding::Base64UrlDecode(signature.signature);
        auto signer = Encoding::Base58Decode(signature.signer);
        if (sig_data.IsErr() || sig_bytes.IsErr() || signer.IsErr()) {
            return Result<ConnectionData, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage("connection~sig fields are not valid base64url/base58"));
        }
        if (signer.Unwrap().size() != Constants::ED_25519_PUBLIC_KEY_SIZE ||
            sig_bytes.Unwrap().size() != Constants::ED_25519_SIGNATURE_SIZE) {
            return Result<ConnectionData, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage("connection~sig signer or signature has the wrong size"));
        }

        auto valid = SodiumInterop::VerifyDetached(signer.Unwrap(), sig_data.Unwrap(), sig_bytes.Unwrap());
        if (valid.IsErr()) {
            return Result<ConnectionData, ProtocolFailure>::Err(valid.UnwrapErr());
        }
        if (!valid.Unwrap()) {
            return Result<ConnectionData, ProtocolFailure>::Err(
                ProtocolFailure::Authentication("connection~sig does not verify against its signer"));
        }
        return ParseSigData(sig_data.Unwrap());
    }
}
