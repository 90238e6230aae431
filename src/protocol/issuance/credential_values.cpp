#include "aries/protocol/issuance/credential_values.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <charconv>
#include <cstdint>
#include <memory>

namespace aries::protocol::issuance {
    using json = nlohmann::json;

    namespace {
        struct BignumDeleter {
            void operator()(BIGNUM* bn) const noexcept { BN_free(bn); }
        };

        struct OpenSslStringDeleter {
            void operator()(char* text) const noexcept { OPENSSL_free(text); }
        };

        bool IsInt32(std::string_view text) {
            if (text.empty()) {
                return false;
            }
            int32_t value = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            return ec == std::errc() && end == text.data() + text.size();
        }

        Result<std::string, ProtocolFailure> ValueText(const std::string& name, const json& value) {
            const json* item = &value;
            if (value.is_array()) {
                if (value.size() != 1) {
                    return Result<std::string, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                        "Credential value " + name + " must be a single value"));
                }
                item = &value.front();
            }
            if (item->is_string()) {
                return Result<std::string, ProtocolFailure>::Ok(item->get<std::string>());
            }
            if (item->is_number() || item->is_boolean()) {
                return Result<std::string, ProtocolFailure>::Ok(item->dump());
            }
            return Result<std::string, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                "Credential value " + name + " must be a string or a number"));
        }
    }

    Result<CredentialValues, ProtocolFailure> CredentialValues::Parse(std::string_view values_json) {
        auto parsed = Result<json, ProtocolFailure>::Try(
            [values_json]() { return json::parse(values_json); },
            [](const std::exception& ex) {
                return ProtocolFailure::InvalidInput(std::string("Credential values are not JSON: ") + ex.what());
            });
        if (parsed.IsErr()) {
            return Result<CredentialValues, ProtocolFailure>::Err(parsed.UnwrapErr());
        }
        const json& values = parsed.Unwrap();
        if (!values.is_object() || values.empty()) {
            return Result<CredentialValues, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                "Credential values must be a non-empty JSON object"));
        }

        json normalized = json::object();
        for (const auto& [name, value] : values.items()) {
            auto text = ValueText(name, value);
            if (text.IsErr()) {
                return Result<CredentialValues, ProtocolFailure>::Err(text.UnwrapErr());
            }
            normalized[name] = std::move(text).Unwrap();
        }
        return Result<CredentialValues, ProtocolFailure>::Ok(CredentialValues(std::move(normalized)));
    }

    Result<std::string, ProtocolFailure> CredentialValues::EncodeAttribute(std::string_view raw) {
        if (IsInt32(raw)) {
            return Result<std::string, ProtocolFailure>::Ok(std::string(raw));
        }

        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digest_size = 0;
        if (EVP_Digest(raw.data(), raw.size(), digest, &digest_size, EVP_sha256(), nullptr) != 1) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("SHA-256 of attribute value failed"));
        }
        std::unique_ptr<BIGNUM, BignumDeleter> value(BN_bin2bn(digest, static_cast<int>(digest_size), nullptr));
        if (!value) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("Failed to convert attribute digest to bignum"));
        }
        std::unique_ptr<char, OpenSslStringDeleter> decimal(BN_bn2dec(value.get()));
        if (!decimal) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("Failed to render attribute digest as decimal"));
        }
        return Result<std::string, ProtocolFailure>::Ok(std::string(decimal.get()));
    }

    Result<nlohmann::json, ProtocolFailure> CredentialValues::Encode() const {
        json encoded = json::object();
        for (const auto& [name, value] : raw_.items()) {
            const auto raw = value.get<std::string>();
            auto encoding = EncodeAttribute(raw);
            if (encoding.IsErr()) {
                return Result<json, ProtocolFailure>::Err(encoding.UnwrapErr());
            }
            encoded[name] = json{{"raw", raw}, {"encoded", std::move(encoding).Unwrap()}};
        }
        return Result<json, ProtocolFailure>::Ok(std::move(encoded));
    }

    messages::CredentialPreview CredentialValues::ToPreview() const {
        messages::CredentialPreview preview;
        for (const auto& [name, value] : raw_.items()) {
            messages::PreviewAttribute attribute;
            attribute.name = name;
            attribute.mime_type = "text/plain";
            attribute.value = value.get<std::string>();
            preview.attributes.push_back(std::move(attribute));
        }
        return preview;
    }

    std::string CredentialValues::ToJson() const {
        return raw_.dump();
    }
}
