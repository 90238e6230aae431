#include "aries/did/did_doc.hpp"
#include "aries/core/constants.hpp"
#include "aries/messages/a2a_message.hpp"

#include <algorithm>

namespace aries::protocol::did {
    using json = nlohmann::json;

    namespace {
        constexpr std::string_view kDefaultServiceId = "did:example:123456789abcdefghi;indy";

        AgentService MakeDefaultService() {
            AgentService service;
            service.id = std::string(kDefaultServiceId);
            service.type = std::string(DidDocConstants::SERVICE_TYPE);
            return service;
        }
    }

    DidDoc::DidDoc()
        : context_(DidDocConstants::CONTEXT)
          , services_{MakeDefaultService()} {
    }

    DidDoc::DidDoc(std::string id)
        : DidDoc() {
        SetId(std::move(id));
    }

    DidDoc DidDoc::FromInvitation(const messages::ConnectionInvitation& invitation) {
        DidDoc doc(invitation.id);
        doc.SetServiceEndpoint(invitation.service_endpoint);
        doc.SetKeys(invitation.recipient_keys, invitation.routing_keys);
        return doc;
    }

    void DidDoc::SetId(std::string id) {
        id_ = std::move(id);
        if (!services_.empty()) {
            services_.front().id = id_ + ";" + std::string(DidDocConstants::SERVICE_SUFFIX);
        }
    }

    void DidDoc::SetServiceEndpoint(std::string endpoint) {
        if (services_.empty()) {
            services_.push_back(MakeDefaultService());
        }
        services_.front().service_endpoint = std::move(endpoint);
    }

    void DidDoc::SetKeys(const std::vector<std::string>& recipient_keys,
                         const std::vector<std::string>& routing_keys) {
        if (services_.empty()) {
            services_.push_back(MakeDefaultService());
        }
        AgentService& service = services_.front();

        size_t key_id = public_keys_.size();
        for (const auto& key : recipient_keys) {
            ++key_id;
            const std::string id = std::to_string(key_id);
            const std::string reference = BuildKeyReference(id_, id);
            public_keys_.push_back(Ed25519PublicKey{
                id,
                std::string(DidDocConstants::KEY_TYPE),
                id_,
                key});
            authentication_.push_back(Authentication{
                std::string(DidDocConstants::KEY_AUTHENTICATION_TYPE),
                reference});
            service.recipient_keys.push_back(reference);
        }
        for (const auto& key : routing_keys) {
            service.routing_keys.push_back(key);
        }
    }

    ResolvedKeys DidDoc::ResolveKeys() const {
        ResolvedKeys keys;
        if (services_.empty()) {
            return keys;
        }
        const AgentService& service = services_.front();
        keys.recipient_keys.reserve(service.recipient_keys.size());
        for (const auto& key : service.recipient_keys) {
            keys.recipient_keys.push_back(KeyValue(key));
        }
        keys.routing_keys = service.routing_keys;
        return keys;
    }

    std::string DidDoc::GetServiceEndpoint() const {
        return services_.empty() ? std::string() : services_.front().service_endpoint;
    }

    Result<Unit, ProtocolFailure> DidDoc::Validate() const {
        if (services_.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Addressing("DIDDoc has no service"));
        }
        for (const auto& public_key : public_keys_) {
            if (public_key.type != DidDocConstants::KEY_TYPE) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::MalformedMessage("Unsupported public key type: " + public_key.type));
            }
        }
        for (const auto& auth : authentication_) {
            const auto [did, key_id] = ParseKeyReference(auth.public_key);
            const bool found = std::any_of(public_keys_.begin(), public_keys_.end(),
                                           [&key_id](const Ed25519PublicKey& pk) { return pk.id == key_id; });
            if (!found) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::MalformedMessage("Unresolved authentication key: " + auth.public_key));
            }
        }
        const AgentService& service = services_.front();
        if (service.recipient_keys.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Addressing(std::string(ErrorMessages::NO_RECIPIENT_KEYS)));
        }
        for (const auto& key : service.recipient_keys) {
            if (key.find('#') != std::string::npos && KeyValue(key) == key) {
                return Result<Unit, ProtocolFailure>::Err(
                    ProtocolFailure::MalformedMessage("Unresolved recipient key reference: " + key));
            }
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    std::string DidDoc::KeyValue(const std::string& key) const {
        if (key.find('#') == std::string::npos) {
            return key;
        }
        const auto [did, key_id] = ParseKeyReference(key);
        const auto it = std::find_if(public_keys_.begin(), public_keys_.end(),
                                     [&key_id](const Ed25519PublicKey& pk) { return pk.id == key_id; });
        return it != public_keys_.end() ? it->public_key_base58 : key;
    }

    std::string DidDoc::BuildKeyReference(std::string_view did, std::string_view key_id) {
        return std::string(did) + "#" + std::string(key_id);
    }

    std::pair<std::string, std::string> DidDoc::ParseKeyReference(std::string_view reference) {
        const auto pos = reference.rfind('#');
        if (pos == std::string_view::npos) {
            return {std::string(), std::string(reference)};
        }
        return {std::string(reference.substr(0, pos)), std::string(reference.substr(pos + 1))};
    }

    json DidDoc::ToJson() const {
        json public_keys = json::array();
        for (const auto& pk : public_keys_) {
            public_keys.push_back({
                {"id", pk.id},
                {"type", pk.type},
                {"controller", pk.controller},
                {"publicKeyBase58", pk.public_key_base58}
            });
        }
        json authentication = json::array();
        for (const auto& auth : authentication_) {
            authentication.push_back({{"type", auth.type}, {"publicKey", auth.public_key}});
        }
        json services = json::array();
        for (const auto& service : services_) {
            services.push_back({
                {"id", service.id},
                {"type", service.type},
                {"priority", service.priority},
                {"recipientKeys", service.recipient_keys},
                {"routingKeys", service.routing_keys},
                {"serviceEndpoint", service.service_endpoint}
            });
        }
        return json{
            {"@context", context_},
            {"id", id_},
            {"publicKey", std::move(public_keys)},
            {"authentication", std::move(authentication)},
            {"service", std::move(services)}
        };
    }

    Result<DidDoc, ProtocolFailure> DidDoc::FromJson(const json& value) {
        return Result<DidDoc, ProtocolFailure>::Try(
            [&value]() {
                DidDoc doc;
                doc.context_ = value.value("@context", std::string(DidDocConstants::CONTEXT));
                doc.id_ = value.at("id").get<std::string>();
                doc.services_.clear();
                for (const auto& pk : value.value("publicKey", json::array())) {
                    doc.public_keys_.push_back(Ed25519PublicKey{
                        pk.at("id").get<std::string>(),
                        pk.at("type").get<std::string>(),
                        pk.value("controller", doc.id_),
                        pk.at("publicKeyBase58").get<std::string>()});
                }
                for (const auto& auth : value.value("authentication", json::array())) {
                    doc.authentication_.push_back(Authentication{
                        auth.at("type").get<std::string>(),
                        auth.at("publicKey").get<std::string>()});
                }
                for (const auto& entry : value.value("service", json::array())) {
                    AgentService service;
                    service.id = entry.at("id").get<std::string>();
                    service.type = entry.value("type", std::string(DidDocConstants::SERVICE_TYPE));
                    service.priority = entry.value("priority", 0U);
                    service.recipient_keys = entry.value("recipientKeys", std::vector<std::string>{});
                    service.routing_keys = entry.value("routingKeys", std::vector<std::string>{});
                    service.service_endpoint = entry.at("serviceEndpoint").get<std::string>();
                    doc.services_.push_back(std::move(service));
                }
                return doc;
            },
            [](const std::exception& ex) {
                return ProtocolFailure::MalformedMessage(std::string("Invalid DIDDoc: ") + ex.what());
            });
    }
}
