#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
namespace aries::protocol::presentation {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
struct NonRevokedInterval {
    std::optional<uint64_t> from;
    std::optional<uint64_t> to;
    bool operator==(const NonRevokedInterval&) const = default;
};
/// Anoncreds proof request carried in `request_presentations~attach`.
///
/// Requested attributes and predicates may be given as an array, in which
/// case they are keyed `attribute_<i>` and `predicate_<i>`, or as an object
/// already keyed by referent. Every attribute needs `name` or `names`; every
/// predicate needs `name`, `p_type` and `p_value`.
class PresentationRequestData {
public:
    /// Generates a fresh nonce. Empty JSON text counts as "none requested".
    [[nodiscard]] static Result<PresentationRequestData, ProtocolFailure> Create(
        std::string name,
        std::string_view requested_attributes_json,
        std::string_view requested_predicates_json,
        std::string_view revocation_details_json);
    [[nodiscard]] static Result<PresentationRequestData, ProtocolFailure> FromJson(const nlohmann::json& json);
    [[nodiscard]] static Result<PresentationRequestData, ProtocolFailure> Parse(std::string_view text);
    [[nodiscard]] nlohmann::json ToJson() const;
    [[nodiscard]] std::string Serialize() const { return ToJson().dump(); }
    /// Every requested referent must be answered in the proof's requested_proof.
    [[nodiscard]] Result<Unit, ProtocolFailure> CheckAnswered(const nlohmann::json& proof) const;
    [[nodiscard]] const std::string& GetNonce() const noexcept { return nonce_; }
    [[nodiscard]] const std::string& GetName() const noexcept { return name_; }
    [[nodiscard]] const std::string& GetVersion() const noexcept { return version_; }
    [[nodiscard]] const nlohmann::json& GetRequestedAttributes() const noexcept { return requested_attributes_; }
    [[nodiscard]] const nlohmann::json& GetRequestedPredicates() const noexcept { return requested_predicates_; }
    [[nodiscard]] const std::optional<NonRevokedInterval>& GetNonRevoked() const noexcept { return non_revoked_; }
    bool operator==(const PresentationRequestData&) const = default;
private:
    PresentationRequestData() = default;
    std::string nonce_;
    std::string name_;
    std::string version_;
    nlohmann::json requested_attributes_ = nlohmann::json::object();
    nlohmann::json requested_predicates_ = nlohmann::json::object();
    std::optional<NonRevokedInterval> non_revoked_;
};
}
