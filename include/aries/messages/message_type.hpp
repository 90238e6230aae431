#pragma once
#include "aries/configuration/agent_config.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
namespace aries::protocol::messages {
using configuration::MessageTypePrefix;
/// Closed set of DIDComm message kinds understood by the engine.
enum class MessageKind : uint8_t {
    ConnectionInvitation,
    ConnectionRequest,
    ConnectionResponse,
    ConnectionProblemReport,
    Ack,
    Ping,
    CredentialProposal,
    CredentialOffer,
    CredentialRequest,
    Credential,
    CredentialAck,
    CredentialProblemReport,
    PresentationProposal,
    PresentationRequest,
    Presentation,
    PresentationAck,
    PresentationProblemReport,
    Forward,
    Generic
};
/// `<prefix><family>/<version>/<name>`, e.g.
/// `did:sov:BzCbsNYhMrjHiqZDTUASHg;spec/present-proof/1.0/presentation`.
struct MessageType {
    std::string family;
    std::string version;
    std::string name;
    /// Accepts the legacy `did:sov` and the `https://didcomm.org/` prefixes.
    [[nodiscard]] static std::optional<MessageType> Parse(std::string_view type);
    [[nodiscard]] static MessageType For(MessageKind kind);
    [[nodiscard]] std::string ToString(MessageTypePrefix prefix) const;
    /// Generic when the family/name pair is not one the engine handles.
    [[nodiscard]] MessageKind Kind() const;
    bool operator==(const MessageType&) const = default;
};
[[nodiscard]] std::string_view MessageKindName(MessageKind kind) noexcept;
}
