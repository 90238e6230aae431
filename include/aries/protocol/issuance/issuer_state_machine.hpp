#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/interfaces/i_anoncreds.hpp"
#include "aries/messages/a2a_message.hpp"
#include "aries/protocol/dispatcher.hpp"
#include "aries/protocol/exchange_types.hpp"
#include "aries/protocol/issuance/credential_values.hpp"
#include "protocol/exchange_state.pb.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
namespace aries::protocol::issuance {
using messages::CredentialProblemReport;
using messages::CredentialRequest;
enum class IssuerStateCode : uint32_t {
    Initial = 1,
    OfferSent = 2,
    RequestReceived = 3,
    CredentialSent = 4,
    Completed = 5,
    Failed = 6
};
namespace issuer_states {
struct Initial {
    bool operator==(const Initial&) const = default;
};
struct OfferSent {
    std::string offer_json;
    std::string thread_id;
    bool operator==(const OfferSent&) const = default;
};
struct RequestReceived {
    std::string offer_json;
    std::string thread_id;
    CredentialRequest request;
    bool operator==(const RequestReceived&) const = default;
};
struct CredentialSent {
    std::string thread_id;
    bool operator==(const CredentialSent&) const = default;
};
struct Completed {
    std::string thread_id;
    bool operator==(const Completed&) const = default;
};
struct Failed {
    std::string thread_id;
    CredentialProblemReport problem_report;
    bool operator==(const Failed&) const = default;
};
}
using IssuerState = std::variant<
    issuer_states::Initial,
    issuer_states::OfferSent,
    issuer_states::RequestReceived,
    issuer_states::CredentialSent,
    issuer_states::Completed,
    issuer_states::Failed>;
namespace issuer_events {
struct SendOffer {
    interfaces::IAnoncreds* anoncreds = nullptr;
};
struct RequestReceived {
    CredentialRequest request;
};
struct SendCredential {
    interfaces::IAnoncreds* anoncreds = nullptr;
};
struct AckReceived {
    messages::CredentialAck ack;
};
struct ProblemReportReceived {
    CredentialProblemReport problem_report;
};
}
using IssuerEvent = std::variant<
    issuer_events::SendOffer,
    issuer_events::RequestReceived,
    issuer_events::SendCredential,
    issuer_events::AckReceived,
    issuer_events::ProblemReportReceived>;
/// Issue-credential protocol (Aries RFC 0036), issuer side.
class IssuerStateMachine {
public:
    [[nodiscard]] static IssuerStateMachine Create(std::string source_id,
                                                   std::string cred_def_id,
                                                   CredentialValues values,
                                                   std::string comment);
    [[nodiscard]] Result<IssuerStateMachine, ProtocolFailure> Step(
        const IssuerEvent& event,
        const SendMessageFn* send = nullptr) const;
    [[nodiscard]] std::optional<SelectedMessage> FindMessageToHandle(const Inbox& inbox) const;
    [[nodiscard]] static std::optional<IssuerEvent> EventFromMessage(const A2AMessage& message);
    [[nodiscard]] IssuerStateCode StateCode() const noexcept;
    [[nodiscard]] uint32_t State() const noexcept { return static_cast<uint32_t>(StateCode()); }
    [[nodiscard]] ExchangeStatus Status() const noexcept;
    [[nodiscard]] bool HasTransitions() const noexcept;
    [[nodiscard]] const std::string& GetSourceId() const noexcept { return source_id_; }
    [[nodiscard]] const std::string& GetCredDefId() const noexcept { return cred_def_id_; }
    [[nodiscard]] const CredentialValues& GetCredentialValues() const noexcept { return values_; }
    [[nodiscard]] const IssuerState& GetState() const noexcept { return state_; }
    [[nodiscard]] std::optional<std::string> GetThreadId() const;
    [[nodiscard]] proto::protocol::IssuerState ToProtoState() const;
    [[nodiscard]] static Result<IssuerStateMachine, ProtocolFailure> FromProtoState(
        const proto::protocol::IssuerState& proto);
private:
    IssuerStateMachine(std::string source_id, std::string cred_def_id, CredentialValues values,
                       std::string comment, IssuerState state);
    [[nodiscard]] IssuerStateMachine WithState(IssuerState state) const;
    [[nodiscard]] Result<IssuerStateMachine, ProtocolFailure> OnSendOffer(
        const issuer_events::SendOffer& event, const SendMessageFn* send) const;
    [[nodiscard]] Result<IssuerStateMachine, ProtocolFailure> OnRequestReceived(
        const issuer_events::RequestReceived& event, const SendMessageFn* send) const;
    [[nodiscard]] Result<IssuerStateMachine, ProtocolFailure> OnSendCredential(
        const issuer_events::SendCredential& event, const SendMessageFn* send) const;
    [[nodiscard]] Result<IssuerStateMachine, ProtocolFailure> OnAckReceived(
        const issuer_events::AckReceived& event) const;
    [[nodiscard]] Result<IssuerStateMachine, ProtocolFailure> OnProblemReport(
        const issuer_events::ProblemReportReceived& event) const;
    std::string source_id_;
    std::string cred_def_id_;
    CredentialValues values_;
    std::string comment_;
    IssuerState state_;
};
[[nodiscard]] std::string_view StateName(const IssuerState& state);
}
