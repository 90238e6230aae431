#include "aries/messages/a2a_message.hpp"
#include "aries/crypto/encoding.hpp"
#include "aries/crypto/sodium_interop.hpp"

#include <cstdio>
#include <stdexcept>

namespace aries::protocol::messages {
    using json = nlohmann::json;
    using crypto::Encoding;

    static_assert(std::variant_size_v<A2AMessage> == static_cast<size_t>(MessageKind::Generic) + 1,
                  "A2AMessage alternatives must follow MessageKind order");

    namespace {
        template<typename T>
        void ReadOptional(const json& j, const char* key, std::optional<T>& out) {
            const auto it = j.find(key);
            if (it != j.end() && !it->is_null()) {
                out = it->template get<T>();
            }
        }

        std::string ReadStringOr(const json& j, const char* key, const std::string& fallback = {}) {
            const auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return fallback;
            }
            return it->get<std::string>();
        }

        void WriteThread(json& j, const std::optional<Thread>& thread) {
            if (thread.has_value()) {
                j["~thread"] = *thread;
            }
        }

        void WriteComment(json& j, const std::string& comment) {
            if (!comment.empty()) {
                j["comment"] = comment;
            }
        }

        json Header(const MessageKind kind, const MessageTypePrefix prefix, const std::string& id) {
            json j;
            j["@type"] = MessageType::For(kind).ToString(prefix);
            j["@id"] = id;
            return j;
        }

        template<typename T, typename... Ts>
        constexpr size_t AlternativeIndex(const std::variant<Ts...>*) {
            constexpr bool matches[] = {std::is_same_v<T, Ts>...};
            for (size_t i = 0; i < sizeof...(Ts); ++i) {
                if (matches[i]) {
                    return i;
                }
            }
            return sizeof...(Ts);
        }

        template<typename T>
        constexpr MessageKind KindFor() {
            return static_cast<MessageKind>(AlternativeIndex<T>(static_cast<const A2AMessage*>(nullptr)));
        }
    }

    // ========================================================================
    // Decorators
    // ========================================================================

    void to_json(json& j, const Thread& thread) {
        j = json::object();
        if (thread.thid.has_value()) {
            j["thid"] = *thread.thid;
        }
        if (thread.pthid.has_value()) {
            j["pthid"] = *thread.pthid;
        }
        j["sender_order"] = thread.sender_order;
        j["received_orders"] = thread.received_orders;
    }

    void from_json(const json& j, Thread& thread) {
        ReadOptional(j, "thid", thread.thid);
        ReadOptional(j, "pthid", thread.pthid);
        thread.sender_order = j.value("sender_order", 0U);
        thread.received_orders = j.value("received_orders", std::map<std::string, uint32_t>{});
    }

    void to_json(json& j, const Attachment& attachment) {
        j = json{
            {"@id", attachment.id},
            {"mime-type", attachment.mime_type},
            {"data", {{"base64", attachment.base64}}}
        };
    }

    void from_json(const json& j, Attachment& attachment) {
        attachment.id = j.at("@id").get<std::string>();
        attachment.mime_type = ReadStringOr(j, "mime-type", "application/json");
        attachment.base64 = j.at("data").at("base64").get<std::string>();
    }

    Attachment Attachment::FromContent(std::string_view id, std::string_view content) {
        Attachment attachment;
        attachment.id = std::string(id);
        attachment.base64 = Encoding::Base64Encode(Encoding::AsBytes(content));
        return attachment;
    }

    Result<std::string, ProtocolFailure> Attachment::Content() const {
        auto decoded = Encoding::Base64Decode(base64);
        if (decoded.IsErr()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage("Attachment " + id + " is not valid base64"));
        }
        return Result<std::string, ProtocolFailure>::Ok(Encoding::AsString(decoded.Unwrap()));
    }

    void to_json(json& j, const SignatureDecorator& sig) {
        j = json{
            {"@type", sig.type},
            {"signature", sig.signature},
            {"sig_data", sig.sig_data},
            {"signer", sig.signer}
        };
    }

    void from_json(const json& j, SignatureDecorator& sig) {
        sig.type = ReadStringOr(j, "@type");
        sig.signature = j.at("signature").get<std::string>();
        sig.sig_data = j.at("sig_data").get<std::string>();
        sig.signer = j.at("signer").get<std::string>();
    }

    void to_json(json& j, const PreviewAttribute& attribute) {
        j = json{{"name", attribute.name}, {"value", attribute.value}};
        if (attribute.mime_type.has_value()) {
            j["mime-type"] = *attribute.mime_type;
        }
    }

    void from_json(const json& j, PreviewAttribute& attribute) {
        attribute.name = j.at("name").get<std::string>();
        attribute.value = j.at("value").get<std::string>();
        ReadOptional(j, "mime-type", attribute.mime_type);
    }

    void to_json(json& j, const CredentialPreview& preview) {
        j = json{
            {"@type", MessageType{"issue-credential", "1.0", "credential-preview"}.ToString(MessageTypePrefix::Legacy)},
            {"attributes", preview.attributes}
        };
    }

    void from_json(const json& j, CredentialPreview& preview) {
        preview.attributes = j.value("attributes", std::vector<PreviewAttribute>{});
    }

    void to_json(json& j, const PresentationPreviewAttribute& attribute) {
        j = json{{"name", attribute.name}};
        if (attribute.cred_def_id.has_value()) {
            j["cred_def_id"] = *attribute.cred_def_id;
        }
        if (attribute.value.has_value()) {
            j["value"] = *attribute.value;
        }
        if (attribute.referent.has_value()) {
            j["referent"] = *attribute.referent;
        }
    }

    void from_json(const json& j, PresentationPreviewAttribute& attribute) {
        attribute.name = j.at("name").get<std::string>();
        ReadOptional(j, "cred_def_id", attribute.cred_def_id);
        ReadOptional(j, "value", attribute.value);
        ReadOptional(j, "referent", attribute.referent);
    }

    void to_json(json& j, const PresentationPreviewPredicate& predicate) {
        j = json{
            {"name", predicate.name},
            {"predicate", predicate.predicate},
            {"threshold", predicate.threshold}
        };
        if (predicate.cred_def_id.has_value()) {
            j["cred_def_id"] = *predicate.cred_def_id;
        }
    }

    void from_json(const json& j, PresentationPreviewPredicate& predicate) {
        predicate.name = j.at("name").get<std::string>();
        predicate.predicate = j.at("predicate").get<std::string>();
        predicate.threshold = j.at("threshold").get<int64_t>();
        ReadOptional(j, "cred_def_id", predicate.cred_def_id);
    }

    void to_json(json& j, const PresentationPreview& preview) {
        j = json{
            {"@type", MessageType{"present-proof", "1.0", "presentation-preview"}.ToString(MessageTypePrefix::Legacy)},
            {"attributes", preview.attributes},
            {"predicates", preview.predicates}
        };
    }

    void from_json(const json& j, PresentationPreview& preview) {
        preview.attributes = j.value("attributes", std::vector<PresentationPreviewAttribute>{});
        preview.predicates = j.value("predicates", std::vector<PresentationPreviewPredicate>{});
    }

    // ========================================================================
    // Message bodies
    // ========================================================================

    namespace {
        json Encode(const ConnectionInvitation& msg, const MessageTypePrefix prefix) {
            json j = Header(MessageKind::ConnectionInvitation, prefix, msg.id);
            j["label"] = msg.label;
            j["recipientKeys"] = msg.recipient_keys;
            j["routingKeys"] = msg.routing_keys;
            j["serviceEndpoint"] = msg.service_endpoint;
            return j;
        }

        void Decode(const json& j, ConnectionInvitation& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.label = ReadStringOr(j, "label");
            msg.recipient_keys = j.at("recipientKeys").get<std::vector<std::string>>();
            msg.routing_keys = j.value("routingKeys", std::vector<std::string>{});
            msg.service_endpoint = j.at("serviceEndpoint").get<std::string>();
        }

        json Encode(const ConnectionRequest& msg, const MessageTypePrefix prefix) {
            json j = Header(MessageKind::ConnectionRequest, prefix, msg.id);
            j["label"] = msg.label;
            j["connection"] = json{
                {"DID", msg.connection.did},
                {"DIDDoc", msg.connection.did_doc.ToJson()}
            };
            WriteThread(j, msg.thread);
            return j;
        }

        void Decode(const json& j, ConnectionRequest& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.label = ReadStringOr(j, "label");
            const json& connection = j.at("connection");
            msg.connection.did = connection.at("DID").get<std::string>();
            auto doc = did::DidDoc::FromJson(connection.at("DIDDoc"));
            if (doc.IsErr()) {
                throw std::invalid_argument(doc.UnwrapErr().message);
            }
            msg.connection.did_doc = std::move(doc).Unwrap();
            ReadOptional(j, "~thread", msg.thread);
        }

        json Encode(const ConnectionResponse& msg, const MessageTypePrefix prefix) {
            json j = Header(MessageKind::ConnectionResponse, prefix, msg.id);
            j["connection~sig"] = msg.connection_sig;
            WriteThread(j, msg.thread);
            return j;
        }

        void Decode(const json& j, ConnectionResponse& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.connection_sig = j.at("connection~sig").get<SignatureDecorator>();
            ReadOptional(j, "~thread", msg.thread);
        }

        template<typename Family>
        json Encode(const ProblemReportMessage<Family>& msg, const MessageTypePrefix prefix) {
            json j = Header(KindFor<ProblemReportMessage<Family>>(), prefix, msg.id);
            if (!msg.problem_code.empty()) {
                j["problem-code"] = msg.problem_code;
            }
            j["description"] = json{{"en", msg.comment}, {"code", msg.problem_code}};
            WriteThread(j, msg.thread);
            return j;
        }

        template<typename Family>
        void Decode(const json& j, ProblemReportMessage<Family>& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.problem_code = ReadStringOr(j, "problem-code");
            const auto description = j.find("description");
            if (description != j.end() && description->is_object()) {
                msg.comment = ReadStringOr(*description, "en");
                if (msg.problem_code.empty()) {
                    msg.problem_code = ReadStringOr(*description, "code");
                }
            } else {
                msg.comment = ReadStringOr(j, "comment");
            }
            ReadOptional(j, "~thread", msg.thread);
        }

        template<typename Family>
        json Encode(const AckMessage<Family>& msg, const MessageTypePrefix prefix) {
            json j = Header(KindFor<AckMessage<Family>>(), prefix, msg.id);
            j["status"] = msg.status;
            WriteThread(j, msg.thread);
            return j;
        }

        template<typename Family>
        void Decode(const json& j, AckMessage<Family>& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.status = ReadStringOr(j, "status", "OK");
            ReadOptional(j, "~thread", msg.thread);
        }

        json Encode(const Ping& msg, const MessageTypePrefix prefix) {
            json j = Header(MessageKind::Ping, prefix, msg.id);
            j["response_requested"] = msg.response_requested;
            WriteComment(j, msg.comment);
            WriteThread(j, msg.thread);
            return j;
        }

        void Decode(const json& j, Ping& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.response_requested = j.value("response_requested", false);
            msg.comment = ReadStringOr(j, "comment");
            ReadOptional(j, "~thread", msg.thread);
        }

        json Encode(const CredentialProposal& msg, const MessageTypePrefix prefix) {
            json j = Header(MessageKind::CredentialProposal, prefix, msg.id);
            WriteComment(j, msg.comment);
            j["credential_proposal"] = msg.credential_proposal;
            j["schema_id"] = msg.schema_id;
            j["cred_def_id"] = msg.cred_def_id;
            WriteThread(j, msg.thread);
            return j;
        }

        void Decode(const json& j, CredentialProposal& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.comment = ReadStringOr(j, "comment");
            msg.credential_proposal = j.at("credential_proposal").get<CredentialPreview>();
            msg.schema_id = ReadStringOr(j, "schema_id");
            msg.cred_def_id = ReadStringOr(j, "cred_def_id");
            ReadOptional(j, "~thread", msg.thread);
        }

        json Encode(const CredentialOffer& msg, const MessageTypePrefix prefix) {
            json j = Header(MessageKind::CredentialOffer, prefix, msg.id);
            WriteComment(j, msg.comment);
            j["credential_preview"] = msg.credential_preview;
            j["offers~attach"] = msg.offers_attach;
            WriteThread(j, msg.thread);
            return j;
        }

        void Decode(const json& j, CredentialOffer& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.comment = ReadStringOr(j, "comment");
            msg.credential_preview = j.value("credential_preview", CredentialPreview{});
            msg.offers_attach = j.at("offers~attach").get<std::vector<Attachment>>();
            ReadOptional(j, "~thread", msg.thread);
        }

        json Encode(const CredentialRequest& msg, const MessageTypePrefix prefix) {
            json j = Header(MessageKind::CredentialRequest, prefix, msg.id);
            WriteComment(j, msg.comment);
            j["requests~attach"] = msg.requests_attach;
            WriteThread(j, msg.thread);
            return j;
        }

        void Decode(const json& j, CredentialRequest& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.comment = ReadStringOr(j, "comment");
            msg.requests_attach = j.at("requests~attach").get<std::vector<Attachment>>();
            ReadOptional(j, "~thread", msg.thread);
        }

        json Encode(const Credential& msg, const MessageTypePrefix prefix) {
            json j = Header(MessageKind::Credential, prefix, msg.id);
            WriteComment(j, msg.comment);
            j["credentials~attach"] = msg.credentials_attach;
            if (msg.please_ack) {
                j["~please_ack"] = json::object();
            }
            WriteThread(j, msg.thread);
            return j;
        }

        void Decode(const json& j, Credential& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.comment = ReadStringOr(j, "comment");
            msg.credentials_attach = j.at("credentials~attach").get<std::vector<Attachment>>();
            msg.please_ack = j.contains("~please_ack");
            ReadOptional(j, "~thread", msg.thread);
        }

        json Encode(const PresentationProposal& msg, const MessageTypePrefix prefix) {
            json j = Header(MessageKind::PresentationProposal, prefix, msg.id);
            WriteComment(j, msg.comment);
            j["presentation_proposal"] = msg.presentation_proposal;
            WriteThread(j, msg.thread);
            return j;
        }

        void Decode(const json& j, PresentationProposal& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.comment = ReadStringOr(j, "comment");
            msg.presentation_proposal = j.at("presentation_proposal").get<PresentationPreview>();
            ReadOptional(j, "~thread", msg.thread);
        }

        json Encode(const PresentationRequest& msg, const MessageTypePrefix prefix) {
            json j = Header(MessageKind::PresentationRequest, prefix, msg.id);
            WriteComment(j, msg.comment);
            j["request_presentations~attach"] = msg.request_presentations_attach;
            WriteThread(j, msg.thread);
            return j;
        }

        void Decode(const json& j, PresentationRequest& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.comment = ReadStringOr(j, "comment");
            msg.request_presentations_attach =
                j.at("request_presentations~attach").get<std::vector<Attachment>>();
            ReadOptional(j, "~thread", msg.thread);
        }

        json Encode(const Presentation& msg, const MessageTypePrefix prefix) {
            json j = Header(MessageKind::Presentation, prefix, msg.id);
            WriteComment(j, msg.comment);
            j["presentations~attach"] = msg.presentations_attach;
            if (msg.please_ack) {
                j["~please_ack"] = json::object();
            }
            WriteThread(j, msg.thread);
            return j;
        }

        void Decode(const json& j, Presentation& msg) {
            msg.id = j.at("@id").get<std::string>();
            msg.comment = ReadStringOr(j, "comment");
            msg.presentations_attach = j.at("presentations~attach").get<std::vector<Attachment>>();
            msg.please_ack = j.contains("~please_ack");
            ReadOptional(j, "~thread", msg.thread);
        }

        json Encode(const Forward& msg, const MessageTypePrefix prefix) {
            json j;
            j["@type"] = MessageType::For(MessageKind::Forward).ToString(prefix);
            j["to"] = msg.to;
            j["msg"] = msg.msg;
            return j;
        }

        void Decode(const json& j, Forward& msg) {
            msg.to = j.at("to").get<std::string>();
            msg.msg = j.at("msg");
        }

        json Encode(const Generic& msg, MessageTypePrefix) {
            return msg.raw;
        }

        template<typename T>
        A2AMessage DecodeAs(const json& j) {
            T msg;
            Decode(j, msg);
            return A2AMessage(std::move(msg));
        }
    }

    // ========================================================================
    // A2AMessage
    // ========================================================================

    std::string Generic::Type() const {
        return raw.is_object() ? ReadStringOr(raw, "@type") : std::string();
    }

    std::string Generic::Id() const {
        return raw.is_object() ? ReadStringOr(raw, "@id") : std::string();
    }

    MessageKind KindOf(const A2AMessage& message) {
        return static_cast<MessageKind>(message.index());
    }

    std::string MessageId(const A2AMessage& message) {
        return std::visit([](const auto& msg) -> std::string {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, Forward>) {
                return {};
            } else if constexpr (std::is_same_v<T, Generic>) {
                return msg.Id();
            } else {
                return msg.id;
            }
        }, message);
    }

    std::optional<Thread> ThreadOf(const A2AMessage& message) {
        return std::visit([](const auto& msg) -> std::optional<Thread> {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, Forward> || std::is_same_v<T, Generic> ||
                          std::is_same_v<T, ConnectionInvitation>) {
                return std::nullopt;
            } else {
                return msg.thread;
            }
        }, message);
    }

    bool IsInThread(const A2AMessage& message, std::string_view thread_id) {
        const auto thread = ThreadOf(message);
        return thread.has_value() && thread->IsReplyTo(thread_id);
    }

    json ToJson(const A2AMessage& message, const MessageTypePrefix prefix) {
        return std::visit([prefix](const auto& msg) { return Encode(msg, prefix); }, message);
    }

    std::string Serialize(const A2AMessage& message, const MessageTypePrefix prefix) {
        return ToJson(message, prefix).dump();
    }

    Result<A2AMessage, ProtocolFailure> FromJson(const json& value) {
        if (!value.is_object()) {
            return Result<A2AMessage, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage("Message is not a JSON object"));
        }

        const auto type_it = value.find("@type");
        if (type_it == value.end() || !type_it->is_string()) {
            return Result<A2AMessage, ProtocolFailure>::Ok(Generic{value});
        }
        const auto type = MessageType::Parse(type_it->get<std::string>());
        const MessageKind kind = type.has_value() ? type->Kind() : MessageKind::Generic;

        return Result<A2AMessage, ProtocolFailure>::Try(
            [&value, kind]() -> A2AMessage {
                switch (kind) {
                    case MessageKind::ConnectionInvitation: return DecodeAs<ConnectionInvitation>(value);
                    case MessageKind::ConnectionRequest: return DecodeAs<ConnectionRequest>(value);
                    case MessageKind::ConnectionResponse: return DecodeAs<ConnectionResponse>(value);
                    case MessageKind::ConnectionProblemReport: return DecodeAs<ConnectionProblemReport>(value);
                    case MessageKind::Ack: return DecodeAs<Ack>(value);
                    case MessageKind::Ping: return DecodeAs<Ping>(value);
                    case MessageKind::CredentialProposal: return DecodeAs<CredentialProposal>(value);
                    case MessageKind::CredentialOffer: return DecodeAs<CredentialOffer>(value);
                    case MessageKind::CredentialRequest: return DecodeAs<CredentialRequest>(value);
                    case MessageKind::Credential: return DecodeAs<Credential>(value);
                    case MessageKind::CredentialAck: return DecodeAs<CredentialAck>(value);
                    case MessageKind::CredentialProblemReport: return DecodeAs<CredentialProblemReport>(value);
                    case MessageKind::PresentationProposal: return DecodeAs<PresentationProposal>(value);
                    case MessageKind::PresentationRequest: return DecodeAs<PresentationRequest>(value);
                    case MessageKind::Presentation: return DecodeAs<Presentation>(value);
                    case MessageKind::PresentationAck: return DecodeAs<PresentationAck>(value);
                    case MessageKind::PresentationProblemReport: return DecodeAs<PresentationProblemReport>(value);
                    case MessageKind::Forward: return DecodeAs<Forward>(value);
                    case MessageKind::Generic: break;
                }
                return Generic{value};
            },
            [&type_it](const std::exception& ex) {
                return ProtocolFailure::MalformedMessage(
                    "Invalid " + type_it->get<std::string>() + " message: " + ex.what());
            });
    }

    Result<A2AMessage, ProtocolFailure> Parse(std::string_view text) {
        json value = json::parse(text.begin(), text.end(), nullptr, false);
        if (value.is_discarded()) {
            return Result<A2AMessage, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage("Message is not valid JSON"));
        }
        return FromJson(value);
    }

    std::string NewMessageId() {
        auto bytes = crypto::SodiumInterop::GetRandomBytes(16);
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

        char buffer[37];
        std::snprintf(buffer, sizeof(buffer),
                      "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                      bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                      bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
        return std::string(buffer);
    }
}
