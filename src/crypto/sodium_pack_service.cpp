#include "aries/crypto/sodium_pack_service.hpp"
#include "aries/core/constants.hpp"
#include "aries/crypto/encoding.hpp"
#include "aries/crypto/sodium_interop.hpp"

#include <sodium.h>
#include <nlohmann/json.hpp>

namespace aries::protocol::crypto {
    using json = nlohmann::json;

    namespace {
        struct ParsedEnvelope {
            std::string protected_b64;
            json header;
            std::vector<uint8_t> iv;
            std::vector<uint8_t> ciphertext;
            std::vector<uint8_t> tag;
        };

        struct RecoveredKey {
            std::vector<uint8_t> content_key;
            std::optional<std::string> sender_verkey;
        };

        Result<json, ProtocolFailure> ParseJson(std::span<const uint8_t> bytes, std::string_view what) {
            json value = json::parse(bytes.begin(), bytes.end(), nullptr, false);
            if (value.is_discarded() || !value.is_object()) {
                return Result<json, ProtocolFailure>::Err(
                    ProtocolFailure::Crypto(std::string(what) + " is not a JSON object"));
            }
            return Result<json, ProtocolFailure>::Ok(std::move(value));
        }

        Result<std::string, ProtocolFailure> StringField(const json& object, const char* key) {
            const auto it = object.find(key);
            if (it == object.end() || !it->is_string()) {
                return Result<std::string, ProtocolFailure>::Err(
                    ProtocolFailure::Crypto(std::string("Envelope field '") + key + "' is missing"));
            }
            return Result<std::string, ProtocolFailure>::Ok(it->get<std::string>());
        }

        Result<std::vector<uint8_t>, ProtocolFailure> BinaryField(const json& object, const char* key) {
            auto text = StringField(object, key);
            if (text.IsErr()) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(text.UnwrapErr());
            }
            auto decoded = Encoding::Base64UrlDecode(text.Unwrap());
            if (decoded.IsErr()) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::Crypto(std::string("Envelope field '") + key + "' is not base64url"));
            }
            return decoded;
        }

        std::optional<std::string> RecipientKid(const json& entry) {
            if (!entry.is_object()) {
                return std::nullopt;
            }
            const auto header = entry.find("header");
            if (header == entry.end() || !header->is_object()) {
                return std::nullopt;
            }
            const auto kid = header->find("kid");
            if (kid == header->end() || !kid->is_string()) {
                return std::nullopt;
            }
            return kid->get<std::string>();
        }

        Result<std::vector<uint8_t>, ProtocolFailure> VerkeyToX25519(std::string_view verkey) {
            auto raw = Encoding::Base58Decode(verkey);
            if (raw.IsErr() || raw.Unwrap().size() != Constants::ED_25519_PUBLIC_KEY_SIZE) {
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                    ProtocolFailure::Crypto("Invalid verkey: " + std::string(verkey)));
            }
            return SodiumInterop::ConvertPublicKeyToX25519(raw.Unwrap());
        }

        Result<ParsedEnvelope, ProtocolFailure> ParseEnvelope(std::span<const uint8_t> envelope) {
            auto outer = ParseJson(envelope, "Envelope");
            if (outer.IsErr()) {
                return Result<ParsedEnvelope, ProtocolFailure>::Err(outer.UnwrapErr());
            }
            const json& value = outer.Unwrap();

            ParsedEnvelope parsed;
            auto protected_b64 = StringField(value, "protected");
            if (protected_b64.IsErr()) {
                return Result<ParsedEnvelope, ProtocolFailure>::Err(protected_b64.UnwrapErr());
            }
            parsed.protected_b64 = std::move(protected_b64).Unwrap();

            auto protected_bytes = Encoding::Base64UrlDecode(parsed.protected_b64);
            if (protected_bytes.IsErr()) {
                return Result<ParsedEnvelope, ProtocolFailure>::Err(
                    ProtocolFailure::Crypto("Protected header is not base64url"));
            }
            auto header = ParseJson(protected_bytes.Unwrap(), "Protected header");
            if (header.IsErr()) {
                return Result<ParsedEnvelope, ProtocolFailure>::Err(header.UnwrapErr());
            }
            parsed.header = std::move(header).Unwrap();
            if (!parsed.header.contains("recipients") || !parsed.header["recipients"].is_array()) {
                return Result<ParsedEnvelope, ProtocolFailure>::Err(
                    ProtocolFailure::Crypto("Protected header has no recipients"));
            }

            auto iv = BinaryField(value, "iv");
            auto ciphertext = BinaryField(value, "ciphertext");
            auto tag = BinaryField(value, "tag");
            if (iv.IsErr()) {
                return Result<ParsedEnvelope, ProtocolFailure>::Err(iv.UnwrapErr());
            }
            if (ciphertext.IsErr()) {
                return Result<ParsedEnvelope, ProtocolFailure>::Err(ciphertext.UnwrapErr());
            }
            if (tag.IsErr()) {
                return Result<ParsedEnvelope, ProtocolFailure>::Err(tag.UnwrapErr());
            }
            parsed.iv = std::move(iv).Unwrap();
            parsed.ciphertext = std::move(ciphertext).Unwrap();
            parsed.tag = std::move(tag).Unwrap();
            if (parsed.iv.size() != Constants::XCHACHA_NONCE_SIZE ||
                parsed.tag.size() != Constants::AEAD_TAG_SIZE) {
                return Result<ParsedEnvelope, ProtocolFailure>::Err(
                    ProtocolFailure::Crypto("Invalid iv or tag size"));
            }
            return Result<ParsedEnvelope, ProtocolFailure>::Ok(std::move(parsed));
        }
    }

    SodiumPackService::SodiumPackService(std::shared_ptr<const IKeyProvider> key_provider)
        : key_provider_(std::move(key_provider)) {
    }

    Result<std::vector<uint8_t>, ProtocolFailure> SodiumPackService::Pack(
        const std::optional<std::string>& sender_verkey,
        const std::vector<std::string>& recipient_verkeys,
        std::span<const uint8_t> plaintext) const {
        if (recipient_verkeys.empty()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("Cannot pack for zero recipients"));
        }

        std::vector<uint8_t> content_key = SodiumInterop::GetRandomBytes(Constants::CONTENT_KEY_SIZE);
        json recipients = json::array();

        for (const auto& verkey : recipient_verkeys) {
            auto recipient_x25519 = VerkeyToX25519(verkey);
            if (recipient_x25519.IsErr()) {
                (void)SodiumInterop::SecureWipe(content_key);
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(recipient_x25519.UnwrapErr());
            }
            const auto& recipient_pk = recipient_x25519.Unwrap();

            if (!sender_verkey.has_value()) {
                std::vector<uint8_t> encrypted_key(content_key.size() + crypto_box_SEALBYTES);
                if (crypto_box_seal(encrypted_key.data(), content_key.data(), content_key.size(),
                                    recipient_pk.data()) != 0) {
                    (void)SodiumInterop::SecureWipe(content_key);
                    return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                        ProtocolFailure::Crypto("Failed to seal content key"));
                }
                recipients.push_back({
                    {"encrypted_key", Encoding::Base64UrlEncode(encrypted_key)},
                    {"header", {{"kid", verkey}}}
                });
                continue;
            }

            auto entry = key_provider_->ExecuteWithKeyTyped<json>(
                *sender_verkey,
                [&](std::span<const uint8_t> sender_secret) -> Result<json, ProtocolFailure> {
                    auto sender_x25519_sk = SodiumInterop::ConvertSecretKeyToX25519(sender_secret);
                    if (sender_x25519_sk.IsErr()) {
                        return Result<json, ProtocolFailure>::Err(sender_x25519_sk.UnwrapErr());
                    }
                    auto& sender_sk = sender_x25519_sk.Unwrap();

                    const std::vector<uint8_t> nonce = SodiumInterop::GetRandomBytes(Constants::BOX_NONCE_SIZE);
                    std::vector<uint8_t> encrypted_key(content_key.size() + crypto_box_MACBYTES);
                    const int box_rc = crypto_box_easy(encrypted_key.data(), content_key.data(), content_key.size(),
                                                       nonce.data(), recipient_pk.data(), sender_sk.data());
                    (void)SodiumInterop::SecureWipe(sender_sk);
                    if (box_rc != 0) {
                        return Result<json, ProtocolFailure>::Err(
                            ProtocolFailure::Crypto("Failed to box content key"));
                    }

                    const auto sender_bytes = Encoding::AsBytes(*sender_verkey);
                    std::vector<uint8_t> sealed_sender(sender_bytes.size() + crypto_box_SEALBYTES);
                    if (crypto_box_seal(sealed_sender.data(), sender_bytes.data(), sender_bytes.size(),
                                        recipient_pk.data()) != 0) {
                        return Result<json, ProtocolFailure>::Err(
                            ProtocolFailure::Crypto("Failed to seal sender verkey"));
                    }
                    return Result<json, ProtocolFailure>::Ok(json{
                        {"encrypted_key", Encoding::Base64UrlEncode(encrypted_key)},
                        {"header", {
                            {"kid", verkey},
                            {"sender", Encoding::Base64UrlEncode(sealed_sender)},
                            {"iv", Encoding::Base64UrlEncode(nonce)}
                        }}
                    });
                });
            if (entry.IsErr()) {
                (void)SodiumInterop::SecureWipe(content_key);
                return Result<std::vector<uint8_t>, ProtocolFailure>::Err(entry.UnwrapErr());
            }
            recipients.push_back(std::move(entry).Unwrap());
        }

        const json protected_header = {
            {"enc", PackConstants::ENC_XCHACHA},
            {"typ", PackConstants::TYP_JWM},
            {"alg", sender_verkey.has_value() ? PackConstants::ALG_AUTHCRYPT : PackConstants::ALG_ANONCRYPT},
            {"recipients", std::move(recipients)}
        };
        const std::string protected_b64 = Encoding::Base64UrlEncode(Encoding::AsBytes(protected_header.dump()));
        const auto aad = Encoding::AsBytes(protected_b64);

        const std::vector<uint8_t> iv = SodiumInterop::GetRandomBytes(Constants::XCHACHA_NONCE_SIZE);
        std::vector<uint8_t> ciphertext(plaintext.size());
        std::vector<uint8_t> tag(Constants::AEAD_TAG_SIZE);
        unsigned long long tag_len = 0;
        const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt_detached(
            ciphertext.data(), tag.data(), &tag_len,
            plaintext.data(), plaintext.size(),
            aad.data(), aad.size(),
            nullptr, iv.data(), content_key.data());
        (void)SodiumInterop::SecureWipe(content_key);
        if (rc != 0) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("Failed to encrypt message content"));
        }

        const json envelope = {
            {"protected", protected_b64},
            {"iv", Encoding::Base64UrlEncode(iv)},
            {"ciphertext", Encoding::Base64UrlEncode(ciphertext)},
            {"tag", Encoding::Base64UrlEncode(tag)}
        };
        const std::string text = envelope.dump();
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(
            std::vector<uint8_t>(text.begin(), text.end()));
    }

    Result<UnpackedMessage, ProtocolFailure> SodiumPackService::Unpack(
        std::span<const uint8_t> envelope) const {
        auto parsed_result = ParseEnvelope(envelope);
        if (parsed_result.IsErr()) {
            return Result<UnpackedMessage, ProtocolFailure>::Err(parsed_result.UnwrapErr());
        }
        const ParsedEnvelope& parsed = parsed_result.Unwrap();

        auto alg_field = StringField(parsed.header, "alg");
        if (alg_field.IsErr()) {
            return Result<UnpackedMessage, ProtocolFailure>::Err(alg_field.UnwrapErr());
        }
        const std::string& alg = alg_field.Unwrap();
        const bool authcrypt = alg == PackConstants::ALG_AUTHCRYPT;
        if (!authcrypt && alg != PackConstants::ALG_ANONCRYPT) {
            return Result<UnpackedMessage, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("Unsupported pack algorithm: " + alg));
        }

        const json* recipient = nullptr;
        std::string recipient_verkey;
        for (const auto& entry : parsed.header["recipients"]) {
            const auto kid = RecipientKid(entry);
            if (kid.has_value() && !kid->empty() && key_provider_->HasKey(*kid)) {
                recipient = &entry;
                recipient_verkey = *kid;
                break;
            }
        }
        if (recipient == nullptr) {
            return Result<UnpackedMessage, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("No recipient key of this wallet can open the envelope"));
        }

        auto encrypted_key = BinaryField(*recipient, "encrypted_key");
        if (encrypted_key.IsErr()) {
            return Result<UnpackedMessage, ProtocolFailure>::Err(encrypted_key.UnwrapErr());
        }
        auto my_x25519_pk = VerkeyToX25519(recipient_verkey);
        if (my_x25519_pk.IsErr()) {
            return Result<UnpackedMessage, ProtocolFailure>::Err(my_x25519_pk.UnwrapErr());
        }
        const json& recipient_header = recipient->at("header");

        auto recovered = key_provider_->ExecuteWithKeyTyped<RecoveredKey>(
            recipient_verkey,
            [&](std::span<const uint8_t> my_secret) -> Result<RecoveredKey, ProtocolFailure> {
                auto my_x25519_sk = SodiumInterop::ConvertSecretKeyToX25519(my_secret);
                if (my_x25519_sk.IsErr()) {
                    return Result<RecoveredKey, ProtocolFailure>::Err(my_x25519_sk.UnwrapErr());
                }
                auto& my_sk = my_x25519_sk.Unwrap();
                const auto& my_pk = my_x25519_pk.Unwrap();
                const auto& sealed_key = encrypted_key.Unwrap();

                RecoveredKey key;
                if (!authcrypt) {
                    if (sealed_key.size() != Constants::CONTENT_KEY_SIZE + crypto_box_SEALBYTES) {
                        (void)SodiumInterop::SecureWipe(my_sk);
                        return Result<RecoveredKey, ProtocolFailure>::Err(
                            ProtocolFailure::Crypto("Invalid encrypted key size"));
                    }
                    key.content_key.resize(Constants::CONTENT_KEY_SIZE);
                    const int rc = crypto_box_seal_open(key.content_key.data(), sealed_key.data(), sealed_key.size(),
                                                        my_pk.data(), my_sk.data());
                    (void)SodiumInterop::SecureWipe(my_sk);
                    if (rc != 0) {
                        return Result<RecoveredKey, ProtocolFailure>::Err(
                            ProtocolFailure::Crypto("Failed to open sealed content key"));
                    }
                    return Result<RecoveredKey, ProtocolFailure>::Ok(std::move(key));
                }

                auto sealed_sender = BinaryField(recipient_header, "sender");
                auto nonce = BinaryField(recipient_header, "iv");
                if (sealed_sender.IsErr() || nonce.IsErr() ||
                    sealed_sender.Unwrap().size() <= crypto_box_SEALBYTES ||
                    nonce.Unwrap().size() != Constants::BOX_NONCE_SIZE ||
                    sealed_key.size() != Constants::CONTENT_KEY_SIZE + crypto_box_MACBYTES) {
                    (void)SodiumInterop::SecureWipe(my_sk);
                    return Result<RecoveredKey, ProtocolFailure>::Err(
                        ProtocolFailure::Crypto("Malformed authcrypt recipient header"));
                }

                const auto& sender_cipher = sealed_sender.Unwrap();
                std::vector<uint8_t> sender_bytes(sender_cipher.size() - crypto_box_SEALBYTES);
                if (crypto_box_seal_open(sender_bytes.data(), sender_cipher.data(), sender_cipher.size(),
                                         my_pk.data(), my_sk.data()) != 0) {
                    (void)SodiumInterop::SecureWipe(my_sk);
                    return Result<RecoveredKey, ProtocolFailure>::Err(
                        ProtocolFailure::Crypto("Failed to open sealed sender verkey"));
                }
                std::string sender_verkey = Encoding::AsString(sender_bytes);

                auto sender_x25519 = VerkeyToX25519(sender_verkey);
                if (sender_x25519.IsErr()) {
                    (void)SodiumInterop::SecureWipe(my_sk);
                    return Result<RecoveredKey, ProtocolFailure>::Err(sender_x25519.UnwrapErr());
                }

                key.content_key.resize(Constants::CONTENT_KEY_SIZE);
                const int rc = crypto_box_open_easy(key.content_key.data(), sealed_key.data(), sealed_key.size(),
                                                    nonce.Unwrap().data(), sender_x25519.Unwrap().data(),
                                                    my_sk.data());
                (void)SodiumInterop::SecureWipe(my_sk);
                if (rc != 0) {
                    return Result<RecoveredKey, ProtocolFailure>::Err(
                        ProtocolFailure::Crypto("Failed to open content key from sender"));
                }
                key.sender_verkey = std::move(sender_verkey);
                return Result<RecoveredKey, ProtocolFailure>::Ok(std::move(key));
            });
        if (recovered.IsErr()) {
            return Result<UnpackedMessage, ProtocolFailure>::Err(recovered.UnwrapErr());
        }
        RecoveredKey key = std::move(recovered).Unwrap();

        const auto aad = Encoding::AsBytes(parsed.protected_b64);
        std::vector<uint8_t> plaintext(parsed.ciphertext.size());
        const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt_detached(
            plaintext.data(), nullptr,
            parsed.ciphertext.data(), parsed.ciphertext.size(),
            parsed.tag.data(),
            aad.data(), aad.size(),
            parsed.iv.data(), key.content_key.data());
        (void)SodiumInterop::SecureWipe(key.content_key);
        if (rc != 0) {
            return Result<UnpackedMessage, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("Message content failed authentication"));
        }

        return Result<UnpackedMessage, ProtocolFailure>::Ok(UnpackedMessage{
            Encoding::AsString(plaintext),
            std::move(key.sender_verkey),
            std::move(recipient_verkey)
        });
    }

    Result<std::vector<std::string>, ProtocolFailure> SodiumPackService::RecipientKeys(
        std::span<const uint8_t> envelope) const {
        auto parsed = ParseEnvelope(envelope);
        if (parsed.IsErr()) {
            return Result<std::vector<std::string>, ProtocolFailure>::Err(parsed.UnwrapErr());
        }
        std::vector<std::string> keys;
        for (const auto& entry : parsed.Unwrap().header["recipients"]) {
            if (auto kid = RecipientKid(entry); kid.has_value()) {
                keys.push_back(std::move(*kid));
            }
        }
        return Result<std::vector<std::string>, ProtocolFailure>::Ok(std::move(keys));
    }
}
