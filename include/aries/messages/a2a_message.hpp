#pragma once
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include "aries/did/did_doc.hpp"
#include "aries/messages/message_type.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
namespace aries::protocol::messages {
using protocol::Result;
using protocol::ProtocolFailure;
/// `~thread` decorator. A reply carries the id of the message that opened the
/// exchange as `thid`.
struct Thread {
    std::optional<std::string> thid;
    std::optional<std::string> pthid;
    uint32_t sender_order = 0;
    std::map<std::string, uint32_t> received_orders;
    [[nodiscard]] static Thread ReplyTo(std::string thid) {
        Thread thread;
        thread.thid = std::move(thid);
        return thread;
    }
    [[nodiscard]] bool IsReplyTo(std::string_view id) const {
        return thid.has_value() && *thid == id;
    }
    bool operator==(const Thread&) const = default;
};
/// `~attach` entry; the engine only produces inline base64 JSON payloads.
struct Attachment {
    std::string id;
    std::string mime_type = "application/json";
    std::string base64;
    [[nodiscard]] static Attachment FromContent(std::string_view id, std::string_view content);
    [[nodiscard]] Result<std::string, ProtocolFailure> Content() const;
    bool operator==(const Attachment&) const = default;
};
/// `connection~sig`: Ed25519 signature over sig_data, both base64url.
struct SignatureDecorator {
    std::string type;
    std::string signature;
    std::string sig_data;
    std::string signer;
    bool operator==(const SignatureDecorator&) const = default;
};
struct ConnectionInvitation {
    std::string id;
    std::string label;
    std::vector<std::string> recipient_keys;
    std::vector<std::string> routing_keys;
    std::string service_endpoint;
    bool operator==(const ConnectionInvitation&) const = default;
};
struct ConnectionData {
    std::string did;
    did::DidDoc did_doc;
    bool operator==(const ConnectionData&) const = default;
};
struct ConnectionRequest {
    std::string id;
    std::string label;
    ConnectionData connection;
    std::optional<Thread> thread;
    bool operator==(const ConnectionRequest&) const = default;
};
struct ConnectionResponse {
    std::string id;
    std::optional<Thread> thread;
    SignatureDecorator connection_sig;
    bool operator==(const ConnectionResponse&) const = default;
};
struct ConnectionFamily {};
struct NotificationFamily {};
struct CredentialFamily {};
struct PresentationFamily {};
template<typename Family>
struct ProblemReportMessage {
    std::string id;
    std::optional<Thread> thread;
    std::string problem_code;
    std::string comment;
    bool operator==(const ProblemReportMessage&) const = default;
};
template<typename Family>
struct AckMessage {
    std::string id;
    std::optional<Thread> thread;
    std::string status = "OK";
    bool operator==(const AckMessage&) const = default;
};
using ConnectionProblemReport = ProblemReportMessage<ConnectionFamily>;
using CredentialProblemReport = ProblemReportMessage<CredentialFamily>;
using PresentationProblemReport = ProblemReportMessage<PresentationFamily>;
using Ack = AckMessage<NotificationFamily>;
using CredentialAck = AckMessage<CredentialFamily>;
using PresentationAck = AckMessage<PresentationFamily>;
struct Ping {
    std::string id;
    std::optional<Thread> thread;
    bool response_requested = false;
    std::string comment;
    bool operator==(const Ping&) const = default;
};
struct PreviewAttribute {
    std::string name;
    std::optional<std::string> mime_type;
    std::string value;
    bool operator==(const PreviewAttribute&) const = default;
};
struct CredentialPreview {
    std::vector<PreviewAttribute> attributes;
    bool operator==(const CredentialPreview&) const = default;
};
struct CredentialProposal {
    std::string id;
    std::string comment;
    CredentialPreview credential_proposal;
    std::string schema_id;
    std::string cred_def_id;
    std::optional<Thread> thread;
    bool operator==(const CredentialProposal&) const = default;
};
struct CredentialOffer {
    std::string id;
    std::string comment;
    CredentialPreview credential_preview;
    std::vector<Attachment> offers_attach;
    std::optional<Thread> thread;
    bool operator==(const CredentialOffer&) const = default;
};
struct CredentialRequest {
    std::string id;
    std::string comment;
    std::vector<Attachment> requests_attach;
    std::optional<Thread> thread;
    bool operator==(const CredentialRequest&) const = default;
};
struct Credential {
    std::string id;
    std::string comment;
    std::vector<Attachment> credentials_attach;
    std::optional<Thread> thread;
    bool please_ack = false;
    bool operator==(const Credential&) const = default;
};
struct PresentationPreviewAttribute {
    std::string name;
    std::optional<std::string> cred_def_id;
    std::optional<std::string> value;
    std::optional<std::string> referent;
    bool operator==(const PresentationPreviewAttribute&) const = default;
};
struct PresentationPreviewPredicate {
    std::string name;
    std::optional<std::string> cred_def_id;
    std::string predicate;
    int64_t threshold = 0;
    bool operator==(const PresentationPreviewPredicate&) const = default;
};
struct PresentationPreview {
    std::vector<PresentationPreviewAttribute> attributes;
    std::vector<PresentationPreviewPredicate> predicates;
    bool operator==(const PresentationPreview&) const = default;
};
struct PresentationProposal {
    std::string id;
    std::string comment;
    PresentationPreview presentation_proposal;
    std::optional<Thread> thread;
    bool operator==(const PresentationProposal&) const = default;
};
struct PresentationRequest {
    std::string id;
    std::string comment;
    std::vector<Attachment> request_presentations_attach;
    std::optional<Thread> thread;
    bool operator==(const PresentationRequest&) const = default;
};
struct Presentation {
    std::string id;
    std::string comment;
    std::vector<Attachment> presentations_attach;
    std::optional<Thread> thread;
    bool please_ack = false;
    bool operator==(const Presentation&) const = default;
};
/// Routing instruction: deliver `msg`, an opaque packed envelope, to `to`.
struct Forward {
    std::string to;
    nlohmann::json msg;
    bool operator==(const Forward&) const = default;
};
/// Unrecognized message kept verbatim so it can be re-serialized unchanged.
struct Generic {
    nlohmann::json raw;
    [[nodiscard]] std::string Type() const;
    [[nodiscard]] std::string Id() const;
    bool operator==(const Generic&) const = default;
};
using A2AMessage = std::variant<
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
    Generic>;
[[nodiscard]] MessageKind KindOf(const A2AMessage& message);
/// `@id`; empty for Forward.
[[nodiscard]] std::string MessageId(const A2AMessage& message);
/// `~thread` decorator; nullopt for Forward, Generic and unthreaded messages.
[[nodiscard]] std::optional<Thread> ThreadOf(const A2AMessage& message);
/// True when the message's `~thread.thid` equals thread_id.
[[nodiscard]] bool IsInThread(const A2AMessage& message, std::string_view thread_id);
[[nodiscard]] nlohmann::json ToJson(const A2AMessage& message,
                                    MessageTypePrefix prefix = MessageTypePrefix::Legacy);
/// Canonical JSON text. Generic messages serialize to their raw content.
[[nodiscard]] std::string Serialize(const A2AMessage& message,
                                    MessageTypePrefix prefix = MessageTypePrefix::Legacy);
/// A missing or unknown `@type` yields Generic; a known type with the wrong
/// shape, or a value that is not a JSON object, is MalformedMessage.
[[nodiscard]] Result<A2AMessage, ProtocolFailure> FromJson(const nlohmann::json& value);
[[nodiscard]] Result<A2AMessage, ProtocolFailure> Parse(std::string_view text);
/// Random RFC 4122 version 4 UUID.
[[nodiscard]] std::string NewMessageId();
void to_json(nlohmann::json& j, const Thread& thread);
void from_json(const nlohmann::json& j, Thread& thread);
void to_json(nlohmann::json& j, const Attachment& attachment);
void from_json(const nlohmann::json& j, Attachment& attachment);
}
