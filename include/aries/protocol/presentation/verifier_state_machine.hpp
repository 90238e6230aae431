#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/interfaces/i_anoncreds.hpp"
#include "aries/messages/a2a_message.hpp"
#include "aries/protocol/dispatcher.hpp"
#include "aries/protocol/exchange_types.hpp"
#include "aries/protocol/presentation/presentation_request_data.hpp"
#include "protocol/exchange_state.pb.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
namespace aries::protocol::presentation {
using messages::A2AMessage;
using messages::Presentation;
using messages::PresentationProblemReport;
using messages::PresentationRequest;
enum class VerifierStateCode : uint32_t {
    Initial = 1,
    RequestSent = 2,
    PresentationReceived = 3,
    Completed = 4,
    Failed = 5
};
namespace verifier_states {
struct Initial {
    bool operator==(const Initial&) const = default;
};
struct RequestSent {
    std::string thread_id;
    bool operator==(const RequestSent&) const = default;
};
struct PresentationReceived {
    std::string thread_id;
    Presentation presentation;
    bool operator==(const PresentationReceived&) const = default;
};
/// status is Verified or Invalid.
struct Completed {
    std::string thread_id;
    Presentation presentation;
    PresentationStatus status = PresentationStatus::Undefined;
    bool operator==(const Completed&) const = default;
};
struct Failed {
    std::string thread_id;
    PresentationProblemReport problem_report;
    bool operator==(const Failed&) const = default;
};
}
using VerifierState = std::variant<
    verifier_states::Initial,
    verifier_states::RequestSent,
    verifier_states::PresentationReceived,
    verifier_states::Completed,
    verifier_states::Failed>;
namespace verifier_events {
struct SendRequest {};
struct PresentationReceived {
    Presentation presentation;
};
/// send_result answers the prover with an ack (Verified) or a problem
/// report (Invalid).
struct VerifyPresentation {
    interfaces::IAnoncreds* anoncreds = nullptr;
    bool send_result = true;
};
struct ProblemReportReceived {
    PresentationProblemReport problem_report;
};
}
using VerifierEvent = std::variant<
    verifier_events::SendRequest,
    verifier_events::PresentationReceived,
    verifier_events::VerifyPresentation,
    verifier_events::ProblemReportReceived>;
/// Present-proof protocol (Aries RFC 0037), verifier side. The request data,
/// including its nonce, is fixed at creation.
class VerifierStateMachine {
public:
    [[nodiscard]] static VerifierStateMachine Create(std::string source_id, PresentationRequestData request);
    [[nodiscard]] Result<VerifierStateMachine, ProtocolFailure> Step(
        const VerifierEvent& event,
        const SendMessageFn* send = nullptr) const;
    [[nodiscard]] std::optional<SelectedMessage> FindMessageToHandle(const Inbox& inbox) const;
    [[nodiscard]] static std::optional<VerifierEvent> EventFromMessage(const A2AMessage& message);
    [[nodiscard]] VerifierStateCode StateCode() const noexcept;
    [[nodiscard]] uint32_t State() const noexcept { return static_cast<uint32_t>(StateCode()); }
    /// Undefined until terminal; Failed counts as Invalid.
    [[nodiscard]] PresentationStatus Status() const noexcept;
    [[nodiscard]] bool HasTransitions() const noexcept;
    [[nodiscard]] const std::string& GetSourceId() const noexcept { return source_id_; }
    [[nodiscard]] const PresentationRequestData& GetRequestData() const noexcept { return request_; }
    [[nodiscard]] const VerifierState& GetState() const noexcept { return state_; }
    [[nodiscard]] std::optional<std::string> GetThreadId() const;
    /// The request message as sent; the thread id is the message id.
    [[nodiscard]] PresentationRequest BuildRequestMessage(const std::string& message_id) const;
    [[nodiscard]] std::optional<Presentation> GetPresentation() const;
    [[nodiscard]] proto::protocol::VerifierState ToProtoState() const;
    [[nodiscard]] static Result<VerifierStateMachine, ProtocolFailure> FromProtoState(
        const proto::protocol::VerifierState& proto);
private:
    VerifierStateMachine(std::string source_id, PresentationRequestData request, VerifierState state);
    [[nodiscard]] VerifierStateMachine WithState(VerifierState state) const;
    [[nodiscard]] Result<VerifierStateMachine, ProtocolFailure> OnSendRequest(const SendMessageFn* send) const;
    [[nodiscard]] Result<VerifierStateMachine, ProtocolFailure> OnPresentationReceived(
        const verifier_events::PresentationReceived& event) const;
    [[nodiscard]] Result<VerifierStateMachine, ProtocolFailure> OnVerifyPresentation(
        const verifier_events::VerifyPresentation& event, const SendMessageFn* send) const;
    [[nodiscard]] Result<VerifierStateMachine, ProtocolFailure> OnProblemReport(
        const verifier_events::ProblemReportReceived& event) const;
    /// Verified when every referent is answered and anoncreds accepts the
    /// proof. Only anoncreds failures are errors.
    [[nodiscard]] Result<PresentationStatus, ProtocolFailure> Verify(
        interfaces::IAnoncreds& anoncreds, const Presentation& presentation) const;
    std::string source_id_;
    PresentationRequestData request_;
    VerifierState state_;
};
[[nodiscard]] std::string_view StateName(const VerifierState& state);
}
