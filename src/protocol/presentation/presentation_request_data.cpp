#include "aries/protocol/presentation/presentation_request_data.hpp"
#include "aries/core/constants.hpp"
#include "aries/protocol/nonce.hpp"

namespace aries::protocol::presentation {
    using json = nlohmann::json;
    using RequestDataResult = Result<PresentationRequestData, ProtocolFailure>;

    namespace {
        Result<json, ProtocolFailure> ParseInput(std::string_view text, std::string_view what, json fallback) {
            if (text.empty()) {
                return Result<json, ProtocolFailure>::Ok(std::move(fallback));
            }
            json value = json::parse(text, nullptr, false);
            if (value.is_discarded()) {
                return Result<json, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                    std::string(what) + " is not valid JSON"));
            }
            return Result<json, ProtocolFailure>::Ok(std::move(value));
        }

        bool IsAttributeSpec(const json& spec) {
            if (!spec.is_object()) {
                return false;
            }
            if (spec.contains("name")) {
                return spec.at("name").is_string() && !spec.at("name").get<std::string>().empty();
            }
            return spec.contains("names") && spec.at("names").is_array() && !spec.at("names").empty();
        }

        bool IsPredicateSpec(const json& spec) {
            return spec.is_object() &&
                   spec.contains("name") && spec.at("name").is_string() &&
                   spec.contains("p_type") && spec.at("p_type").is_string() &&
                   spec.contains("p_value") && spec.at("p_value").is_number_integer();
        }

        /// Array input is keyed <prefix><i>; object input is kept as is.
        Result<json, ProtocolFailure> KeyByReferent(const json& input,
                                                    std::string_view prefix,
                                                    std::string_view what,
                                                    bool (*valid)(const json&)) {
            json keyed = json::object();
            if (input.is_array()) {
                for (size_t i = 0; i < input.size(); ++i) {
                    if (!valid(input[i])) {
                        return Result<json, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                            std::string(what) + " entry " + std::to_string(i) + " is incomplete"));
                    }
                    keyed[std::string(prefix) + std::to_string(i)] = input[i];
                }
            } else if (input.is_object()) {
                for (const auto& [referent, spec] : input.items()) {
                    if (!valid(spec)) {
                        return Result<json, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                            std::string(what) + " " + referent + " is incomplete"));
                    }
                    keyed[referent] = spec;
                }
            } else {
                return Result<json, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                    std::string(what) + " must be a JSON array or object"));
            }
            return Result<json, ProtocolFailure>::Ok(std::move(keyed));
        }

        Result<std::optional<NonRevokedInterval>, ProtocolFailure> ReadInterval(const json& value) {
            using IntervalResult = Result<std::optional<NonRevokedInterval>, ProtocolFailure>;
            if (value.is_null()) {
                return IntervalResult::Ok(std::nullopt);
            }
            if (!value.is_object()) {
                return IntervalResult::Err(ProtocolFailure::InvalidInput("Revocation interval must be an object"));
            }
            NonRevokedInterval interval;
            for (const auto& [key, field] : {std::pair{"from", &interval.from}, std::pair{"to", &interval.to}}) {
                if (!value.contains(key) || value.at(key).is_null()) {
                    continue;
                }
                const json& bound = value.at(key);
                if (!bound.is_number_unsigned() && !(bound.is_number_integer() && bound.get<int64_t>() >= 0)) {
                    return IntervalResult::Err(ProtocolFailure::InvalidInput(
                        std::string("Revocation interval ") + key + " must be a non-negative integer"));
                }
                *field = value.at(key).get<uint64_t>();
            }
            if (!interval.from.has_value() && !interval.to.has_value()) {
                return IntervalResult::Ok(std::nullopt);
            }
            if (interval.from.has_value() && interval.to.has_value() && *interval.from > *interval.to) {
                return IntervalResult::Err(ProtocolFailure::InvalidInput("Revocation interval ends before it starts"));
            }
            return IntervalResult::Ok(interval);
        }

        bool AnswersAttribute(const json& requested_proof, const std::string& referent) {
            for (const char* section : {"revealed_attrs", "revealed_attr_groups",
                                        "self_attested_attrs", "unrevealed_attrs"}) {
                if (requested_proof.contains(section) && requested_proof.at(section).is_object() &&
                    requested_proof.at(section).contains(referent)) {
                    return true;
                }
            }
            return false;
        }
    }

    Result<PresentationRequestData, ProtocolFailure> PresentationRequestData::Create(
        std::string name,
        std::string_view requested_attributes_json,
        std::string_view requested_predicates_json,
        std::string_view revocation_details_json) {
        auto attributes = ParseInput(requested_attributes_json, "Requested attributes", json::array());
        if (attributes.IsErr()) {
            return RequestDataResult::Err(attributes.UnwrapErr());
        }
        auto predicates = ParseInput(requested_predicates_json, "Requested predicates", json::array());
        if (predicates.IsErr()) {
            return RequestDataResult::Err(predicates.UnwrapErr());
        }
        auto revocation = ParseInput(revocation_details_json, "Revocation details", json::object());
        if (revocation.IsErr()) {
            return RequestDataResult::Err(revocation.UnwrapErr());
        }
        auto nonce = NonceGenerator::NextPresentationNonce();
        if (nonce.IsErr()) {
            return RequestDataResult::Err(nonce.UnwrapErr());
        }

        json request = {
            {"nonce", std::move(nonce).Unwrap()},
            {"name", name.empty() ? std::string(ProtocolConstants::DEFAULT_PRESENTATION_NAME) : std::move(name)},
            {"version", std::string(ProtocolConstants::PRESENTATION_REQUEST_VERSION)},
            {"requested_attributes", std::move(attributes).Unwrap()},
            {"requested_predicates", std::move(predicates).Unwrap()}
        };
        const json& details = revocation.Unwrap();
        if (details.is_object() && (details.contains("from") || details.contains("to"))) {
            request["non_revoked"] = details;
        }
        return FromJson(request);
    }

    Result<PresentationRequestData, ProtocolFailure> PresentationRequestData::FromJson(const json& value) {
        if (!value.is_object()) {
            return RequestDataResult::Err(ProtocolFailure::InvalidInput("Presentation request must be an object"));
        }
        PresentationRequestData data;
        const json nonce = value.value("nonce", json());
        if (!nonce.is_string() || !NonceGenerator::IsValidPresentationNonce(nonce.get<std::string>())) {
            return RequestDataResult::Err(ProtocolFailure::InvalidInput(
                "Presentation request nonce must be a decimal of at most 80 bits"));
        }
        data.nonce_ = nonce.get<std::string>();
        const json name = value.value("name", json(std::string(ProtocolConstants::DEFAULT_PRESENTATION_NAME)));
        const json version = value.value("version", json(std::string(ProtocolConstants::PRESENTATION_REQUEST_VERSION)));
        if (!name.is_string() || !version.is_string()) {
            return RequestDataResult::Err(ProtocolFailure::InvalidInput(
                "Presentation request name and version must be strings"));
        }
        data.name_ = name.get<std::string>();
        data.version_ = version.get<std::string>();

        auto attributes = KeyByReferent(value.value("requested_attributes", json::object()),
                                        ProtocolConstants::ATTRIBUTE_REFERENT_PREFIX,
                                        "Requested attribute", IsAttributeSpec);
        if (attributes.IsErr()) {
            return RequestDataResult::Err(attributes.UnwrapErr());
        }
        auto predicates = KeyByReferent(value.value("requested_predicates", json::object()),
                                        ProtocolConstants::PREDICATE_REFERENT_PREFIX,
                                        "Requested predicate", IsPredicateSpec);
        if (predicates.IsErr()) {
            return RequestDataResult::Err(predicates.UnwrapErr());
        }
        auto interval = ReadInterval(value.value("non_revoked", json()));
        if (interval.IsErr()) {
            return RequestDataResult::Err(interval.UnwrapErr());
        }
        data.requested_attributes_ = std::move(attributes).Unwrap();
        data.requested_predicates_ = std::move(predicates).Unwrap();
        data.non_revoked_ = std::move(interval).Unwrap();
        return RequestDataResult::Ok(std::move(data));
    }

    Result<PresentationRequestData, ProtocolFailure> PresentationRequestData::Parse(std::string_view text) {
        json value = json::parse(text, nullptr, false);
        if (value.is_discarded()) {
            return RequestDataResult::Err(ProtocolFailure::InvalidInput("Presentation request is not valid JSON"));
        }
        return FromJson(value);
    }

    json PresentationRequestData::ToJson() const {
        json value = {
            {"nonce", nonce_},
            {"name", name_},
            {"version", version_},
            {"requested_attributes", requested_attributes_},
            {"requested_predicates", requested_predicates_}
        };
        if (non_revoked_.has_value()) {
            json interval = json::object();
            if (non_revoked_->from.has_value()) {
                interval["from"] = *non_revoked_->from;
            }
            if (non_revoked_->to.has_value()) {
                interval["to"] = *non_revoked_->to;
            }
            value["non_revoked"] = std::move(interval);
        }
        return value;
    }

    Result<Unit, ProtocolFailure> PresentationRequestData::CheckAnswered(const json& proof) const {
        if (!proof.is_object() || !proof.contains("requested_proof") || !proof.at("requested_proof").is_object()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage("Proof has no requested_proof section"));
        }
        const json& requested_proof = proof.at("requested_proof");
        for (const auto& [referent, spec] : requested_attributes_.items()) {
            if (!AnswersAttribute(requested_proof, referent)) {
                return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::ProtocolViolation(
                    "Proof does not answer requested attribute " + referent));
            }
        }
        const bool has_predicates = requested_proof.contains("predicates") &&
                                    requested_proof.at("predicates").is_object();
        for (const auto& [referent, spec] : requested_predicates_.items()) {
            if (!has_predicates || !requested_proof.at("predicates").contains(referent)) {
                return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::ProtocolViolation(
                    "Proof does not answer requested predicate " + referent));
            }
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}
