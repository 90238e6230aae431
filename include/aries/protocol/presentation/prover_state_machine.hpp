#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/interfaces/i_anoncreds.hpp"
#include "aries/messages/a2a_message.hpp"
#include "aries/protocol/dispatcher.hpp"
#include "aries/protocol/exchange_types.hpp"
#include "protocol/exchange_state.pb.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
namespace aries::protocol::presentation {
using messages::A2AMessage;
using messages::PresentationPreview;
using messages::PresentationProblemReport;
using messages::PresentationProposal;
using messages::PresentationRequest;
enum class ProverStateCode : uint32_t {
    Initial = 1,
    RequestReceived = 2,
    PresentationBuilt = 3,
    Sent = 4,
    Completed = 5,
    Declined = 6,
    ProposalSent = 7,
    Failed = 8
};
namespace prover_states {
struct Initial {
    bool operator==(const Initial&) const = default;
};
struct RequestReceived {
    PresentationRequest request;
    bool operator==(const RequestReceived&) const = default;
};
struct PresentationBuilt {
    PresentationRequest request;
    std::string presentation_json;
    bool operator==(const PresentationBuilt&) const = default;
};
struct Sent {
    PresentationRequest request;
    std::string presentation_json;
    bool operator==(const Sent&) const = default;
};
struct Completed {
    PresentationRequest request;
    std::string presentation_json;
    bool operator==(const Completed&) const = default;
};
struct Declined {
    PresentationRequest request;
    PresentationProblemReport problem_report;
    bool operator==(const Declined&) const = default;
};
/// Waiting for the verifier to answer a counter-proposal with a new request.
struct ProposalSent {
    PresentationRequest request;
    PresentationProposal proposal;
    bool operator==(const ProposalSent&) const = default;
};
struct Failed {
    std::string thread_id;
    PresentationProblemReport problem_report;
    bool operator==(const Failed&) const = default;
};
}
using ProverState = std::variant<
    prover_states::Initial,
    prover_states::RequestReceived,
    prover_states::PresentationBuilt,
    prover_states::Sent,
    prover_states::Completed,
    prover_states::Declined,
    prover_states::ProposalSent,
    prover_states::Failed>;
namespace prover_events {
struct RequestReceived {
    PresentationRequest request;
};
/// selected_credentials_json and self_attested_attrs_json are passed to
/// anoncreds unchanged.
struct GeneratePresentation {
    interfaces::IAnoncreds* anoncreds = nullptr;
    std::string selected_credentials_json;
    std::string self_attested_attrs_json;
};
struct SendPresentation {};
struct AckReceived {
    messages::PresentationAck ack;
};
struct DeclineRequest {
    std::string reason;
};
struct ProposePresentation {
    PresentationPreview preview;
    std::string comment;
};
struct ProblemReportReceived {
    PresentationProblemReport problem_report;
};
}
using ProverEvent = std::variant<
    prover_events::RequestReceived,
    prover_events::GeneratePresentation,
    prover_events::SendPresentation,
    prover_events::AckReceived,
    prover_events::DeclineRequest,
    prover_events::ProposePresentation,
    prover_events::ProblemReportReceived>;
/// Present-proof protocol (Aries RFC 0037), prover side. The thread id is
/// the first request's id, or the thread that request itself continues.
class ProverStateMachine {
public:
    [[nodiscard]] static ProverStateMachine Create(std::string source_id);
    [[nodiscard]] Result<ProverStateMachine, ProtocolFailure> Step(
        const ProverEvent& event,
        const SendMessageFn* send = nullptr) const;
    [[nodiscard]] std::optional<SelectedMessage> FindMessageToHandle(const Inbox& inbox) const;
    [[nodiscard]] static std::optional<ProverEvent> EventFromMessage(const A2AMessage& message);
    [[nodiscard]] ProverStateCode StateCode() const noexcept;
    [[nodiscard]] uint32_t State() const noexcept { return static_cast<uint32_t>(StateCode()); }
    /// Success on Completed; Failed on Declined or Failed.
    [[nodiscard]] ExchangeStatus Status() const noexcept;
    [[nodiscard]] bool HasTransitions() const noexcept;
    [[nodiscard]] const std::string& GetSourceId() const noexcept { return source_id_; }
    [[nodiscard]] const ProverState& GetState() const noexcept { return state_; }
    [[nodiscard]] std::optional<std::string> GetThreadId() const;
    [[nodiscard]] std::optional<PresentationRequest> GetPresentationRequest() const;
    [[nodiscard]] std::optional<std::string> GetPresentationJson() const;
    [[nodiscard]] static std::string ThreadIdOf(const PresentationRequest& request);
    [[nodiscard]] proto::protocol::ProverState ToProtoState() const;
    [[nodiscard]] static Result<ProverStateMachine, ProtocolFailure> FromProtoState(
        const proto::protocol::ProverState& proto);
private:
    ProverStateMachine(std::string source_id, ProverState state);
    [[nodiscard]] ProverStateMachine WithState(ProverState state) const;
    [[nodiscard]] Result<ProverStateMachine, ProtocolFailure> OnRequestReceived(
        const prover_events::RequestReceived& event) const;
    [[nodiscard]] Result<ProverStateMachine, ProtocolFailure> OnGeneratePresentation(
        const prover_events::GeneratePresentation& event) const;
    [[nodiscard]] Result<ProverStateMachine, ProtocolFailure> OnSendPresentation(const SendMessageFn* send) const;
    [[nodiscard]] Result<ProverStateMachine, ProtocolFailure> OnAckReceived(
        const prover_events::AckReceived& event) const;
    [[nodiscard]] Result<ProverStateMachine, ProtocolFailure> OnDeclineRequest(
        const prover_events::DeclineRequest& event, const SendMessageFn* send) const;
    [[nodiscard]] Result<ProverStateMachine, ProtocolFailure> OnProposePresentation(
        const prover_events::ProposePresentation& event, const SendMessageFn* send) const;
    [[nodiscard]] Result<ProverStateMachine, ProtocolFailure> OnProblemReport(
        const prover_events::ProblemReportReceived& event) const;
    std::string source_id_;
    ProverState state_;
};
[[nodiscard]] std::string_view StateName(const ProverState& state);
}
