#pragma once
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace aries::protocol::messages {
struct ConnectionInvitation;
}
namespace aries::protocol::did {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
struct Ed25519PublicKey {
    std::string id;
    std::string type;
    std::string controller;
    std::string public_key_base58;
    bool operator==(const Ed25519PublicKey&) const = default;
};
struct Authentication {
    std::string type;
    std::string public_key;
    bool operator==(const Authentication&) const = default;
};
/// IndyAgent service entry. Recipient keys may be raw verkeys or `did#n`
/// references into the document's publicKey list; routing keys are raw.
struct AgentService {
    std::string id;
    std::string type;
    uint32_t priority = 0;
    std::vector<std::string> recipient_keys;
    std::vector<std::string> routing_keys;
    std::string service_endpoint;
    bool operator==(const AgentService&) const = default;
};
struct ResolvedKeys {
    std::vector<std::string> recipient_keys;
    std::vector<std::string> routing_keys;
};
/// Relationship document: who to encrypt for, which hops to wrap for and
/// where to post. Immutable once a relationship is established, so it is
/// shared across threads read-only.
class DidDoc {
public:
    DidDoc();
    explicit DidDoc(std::string id);
    /// Document an invitee uses to reach the inviter before the response
    /// arrives. The invitation keys are used unchanged.
    [[nodiscard]] static DidDoc FromInvitation(const messages::ConnectionInvitation& invitation);
    [[nodiscard]] const std::string& GetId() const noexcept { return id_; }
    void SetId(std::string id);
    void SetServiceEndpoint(std::string endpoint);
    /// Appends each recipient key as publicKey `n` with an authentication
    /// entry and a `did#n` reference in the service; routing keys are kept raw.
    void SetKeys(const std::vector<std::string>& recipient_keys,
                 const std::vector<std::string>& routing_keys);
    [[nodiscard]] ResolvedKeys ResolveKeys() const;
    [[nodiscard]] std::string GetServiceEndpoint() const;
    [[nodiscard]] const std::vector<Ed25519PublicKey>& GetPublicKeys() const noexcept { return public_keys_; }
    [[nodiscard]] const std::vector<Authentication>& GetAuthentication() const noexcept { return authentication_; }
    [[nodiscard]] const std::vector<AgentService>& GetServices() const noexcept { return services_; }
    /// Checks that the document is usable as a destination: one service, at
    /// least one recipient key and every key reference resolvable.
    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const;
    [[nodiscard]] nlohmann::json ToJson() const;
    [[nodiscard]] static Result<DidDoc, ProtocolFailure> FromJson(const nlohmann::json& json);
    bool operator==(const DidDoc&) const = default;
private:
    [[nodiscard]] std::string KeyValue(const std::string& key) const;
    [[nodiscard]] static std::string BuildKeyReference(std::string_view did, std::string_view key_id);
    [[nodiscard]] static std::pair<std::string, std::string> ParseKeyReference(std::string_view reference);
    std::string context_;
    std::string id_;
    std::vector<Ed25519PublicKey> public_keys_;
    std::vector<Authentication> authentication_;
    std::vector<AgentService> services_;
};
}
