#include "aries/messages/message_type.hpp"

#include <array>

namespace aries::protocol::messages {

    namespace {
        constexpr std::string_view kLegacyPrefix = "did:sov:BzCbsNYhMrjHiqZDTUASHg;spec/";
        constexpr std::string_view kDidCommOrgPrefix = "https://didcomm.org/";

        struct KindEntry {
            MessageKind kind;
            std::string_view family;
            std::string_view name;
        };

        constexpr std::array<KindEntry, 18> kKinds{{
            {MessageKind::ConnectionInvitation, "connections", "invitation"},
            {MessageKind::ConnectionRequest, "connections", "request"},
            {MessageKind::ConnectionResponse, "connections", "response"},
            {MessageKind::ConnectionProblemReport, "connections", "problem_report"},
            {MessageKind::Ack, "notification", "ack"},
            {MessageKind::Ping, "trust_ping", "ping"},
            {MessageKind::CredentialProposal, "issue-credential", "propose-credential"},
            {MessageKind::CredentialOffer, "issue-credential", "offer-credential"},
            {MessageKind::CredentialRequest, "issue-credential", "request-credential"},
            {MessageKind::Credential, "issue-credential", "issue-credential"},
            {MessageKind::CredentialAck, "issue-credential", "ack"},
            {MessageKind::CredentialProblemReport, "issue-credential", "problem-report"},
            {MessageKind::PresentationProposal, "present-proof", "propose-presentation"},
            {MessageKind::PresentationRequest, "present-proof", "request-presentation"},
            {MessageKind::Presentation, "present-proof", "presentation"},
            {MessageKind::PresentationAck, "present-proof", "ack"},
            {MessageKind::PresentationProblemReport, "present-proof", "problem-report"},
            {MessageKind::Forward, "routing", "forward"},
        }};

        constexpr std::string_view kVersion = "1.0";
    }

    std::optional<MessageType> MessageType::Parse(std::string_view type) {
        if (type.starts_with(kLegacyPrefix)) {
            type.remove_prefix(kLegacyPrefix.size());
        } else if (type.starts_with(kDidCommOrgPrefix)) {
            type.remove_prefix(kDidCommOrgPrefix.size());
        } else {
            return std::nullopt;
        }

        const auto first = type.find('/');
        if (first == std::string_view::npos) {
            return std::nullopt;
        }
        const auto second = type.find('/', first + 1);
        if (second == std::string_view::npos || second + 1 >= type.size()) {
            return std::nullopt;
        }
        return MessageType{
            std::string(type.substr(0, first)),
            std::string(type.substr(first + 1, second - first - 1)),
            std::string(type.substr(second + 1))
        };
    }

    MessageType MessageType::For(const MessageKind kind) {
        for (const auto& entry : kKinds) {
            if (entry.kind == kind) {
                return MessageType{std::string(entry.family), std::string(kVersion), std::string(entry.name)};
            }
        }
        return MessageType{"generic", std::string(kVersion), "message"};
    }

    std::string MessageType::ToString(const MessageTypePrefix prefix) const {
        std::string result(prefix == MessageTypePrefix::Legacy ? kLegacyPrefix : kDidCommOrgPrefix);
        result.append(family).append("/").append(version).append("/").append(name);
        return result;
    }

    MessageKind MessageType::Kind() const {
        for (const auto& entry : kKinds) {
            if (entry.family == family && entry.name == name) {
                return entry.kind;
            }
        }
        return MessageKind::Generic;
    }

    std::string_view MessageKindName(const MessageKind kind) noexcept {
        switch (kind) {
            case MessageKind::ConnectionInvitation: return "ConnectionInvitation";
            case MessageKind::ConnectionRequest: return "ConnectionRequest";
            case MessageKind::ConnectionResponse: return "ConnectionResponse";
            case MessageKind::ConnectionProblemReport: return "ConnectionProblemReport";
            case MessageKind::Ack: return "Ack";
            case MessageKind::Ping: return "Ping";
            case MessageKind::CredentialProposal: return "CredentialProposal";
            case MessageKind::CredentialOffer: return "CredentialOffer";
            case MessageKind::CredentialRequest: return "CredentialRequest";
            case MessageKind::Credential: return "Credential";
            case MessageKind::CredentialAck: return "CredentialAck";
            case MessageKind::CredentialProblemReport: return "CredentialProblemReport";
            case MessageKind::PresentationProposal: return "PresentationProposal";
            case MessageKind::PresentationRequest: return "PresentationRequest";
            case MessageKind::Presentation: return "Presentation";
            case MessageKind::PresentationAck: return "PresentationAck";
            case MessageKind::PresentationProblemReport: return "PresentationProblemReport";
            case MessageKind::Forward: return "Forward";
            case MessageKind::Generic: return "Generic";
        }
        return "Unknown";
    }
}
