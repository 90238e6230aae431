#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/messages/a2a_message.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
namespace aries::protocol::issuance {
/// Attribute values of an offered credential.
///
/// Callers give `{"name": "value"}` or `{"name": ["value"]}`. Anoncreds needs
/// each value as `{"raw", "encoded"}`: a 32-bit integer encodes as itself,
/// anything else as the decimal value of its SHA-256 digest.
class CredentialValues {
public:
    [[nodiscard]] static Result<CredentialValues, ProtocolFailure> Parse(std::string_view values_json);
    [[nodiscard]] static Result<std::string, ProtocolFailure> EncodeAttribute(std::string_view raw);
    [[nodiscard]] Result<nlohmann::json, ProtocolFailure> Encode() const;
    [[nodiscard]] messages::CredentialPreview ToPreview() const;
    /// Normalized `{"name": "value"}` form.
    [[nodiscard]] std::string ToJson() const;
    [[nodiscard]] const nlohmann::json& GetRaw() const noexcept { return raw_; }
private:
    explicit CredentialValues(nlohmann::json raw) : raw_(std::move(raw)) {}
    nlohmann::json raw_;
};
}
