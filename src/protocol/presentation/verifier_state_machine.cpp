#include "aries/protocol/presentation/verifier_state_machine.hpp"
#include "aries/core/constants.hpp"
#include "aries/debug/protocol_trace.hpp"
#include "aries/protocol/snapshot_codec.hpp"

#include <nlohmann/json.hpp>

namespace aries::protocol::presentation {
    using json = nlohmann::json;
    using messages::Thread;
    using VerifierResult = Result<VerifierStateMachine, ProtocolFailure>;

    namespace {
        constexpr std::string_view kMachineName = "verifier";
        constexpr std::string_view kInvalidPresentation = "invalid-presentation";

        std::string_view EventName(const VerifierEvent& event) {
            switch (event.index()) {
                case 0: return "SendRequest";
                case 1: return "PresentationReceived";
                case 2: return "VerifyPresentation";
                case 3: return "ProblemReportReceived";
                default: return "Unknown";
            }
        }
    }

    std::string_view StateName(const VerifierState& state) {
        switch (state.index()) {
            case 0: return "Initial";
            case 1: return "RequestSent";
            case 2: return "PresentationReceived";
            case 3: return "Completed";
            case 4: return "Failed";
            default: return "Unknown";
        }
    }

    VerifierStateMachine::VerifierStateMachine(std::string source_id, PresentationRequestData request,
                                               VerifierState state)
        : source_id_(std::move(source_id))
          , request_(std::move(request))
          , state_(std::move(state)) {
    }

    VerifierStateMachine VerifierStateMachine::Create(std::string source_id, PresentationRequestData request) {
        return {std::move(source_id), std::move(request), verifier_states::Initial{}};
    }

    VerifierStateMachine VerifierStateMachine::WithState(VerifierState state) const {
        VerifierStateMachine next(source_id_, request_, std::move(state));
        ARIES_TRACE_TRANSITION(debug::Component::Verifier, source_id_, State(), next.State());
        return next;
    }

    VerifierStateCode VerifierStateMachine::StateCode() const noexcept {
        return static_cast<VerifierStateCode>(state_.index() + 1);
    }

    PresentationStatus VerifierStateMachine::Status() const noexcept {
        if (const auto* completed = std::get_if<verifier_states::Completed>(&state_)) {
            return completed->status;
        }
        if (std::holds_alternative<verifier_states::Failed>(state_)) {
            return PresentationStatus::Invalid;
        }
        return PresentationStatus::Undefined;
    }

    bool VerifierStateMachine::HasTransitions() const noexcept {
        return !std::holds_alternative<verifier_states::Completed>(state_) &&
               !std::holds_alternative<verifier_states::Failed>(state_);
    }

    std::optional<std::string> VerifierStateMachine::GetThreadId() const {
        return std::visit([](const auto& state) -> std::optional<std::string> {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, verifier_states::Initial>) {
                return std::nullopt;
            } else {
                return state.thread_id;
            }
        }, state_);
    }

    std::optional<Presentation> VerifierStateMachine::GetPresentation() const {
        if (const auto* received = std::get_if<verifier_states::PresentationReceived>(&state_)) {
            return received->presentation;
        }
        if (const auto* completed = std::get_if<verifier_states::Completed>(&state_)) {
            return completed->presentation;
        }
        return std::nullopt;
    }

    PresentationRequest VerifierStateMachine::BuildRequestMessage(const std::string& message_id) const {
        PresentationRequest request;
        request.id = message_id;
        request.comment = request_.GetName();
        request.request_presentations_attach.push_back(messages::Attachment::FromContent(
            ProtocolConstants::PRESENTATION_REQUEST_ATTACHMENT_ID, request_.Serialize()));
        return request;
    }

    Result<VerifierStateMachine, ProtocolFailure> VerifierStateMachine::Step(
        const VerifierEvent& event,
        const SendMessageFn* send) const {
        if (!HasTransitions()) {
            return VerifierResult::Err(InvalidTransition(kMachineName, StateName(state_), EventName(event)));
        }
        if (std::holds_alternative<verifier_events::SendRequest>(event)) {
            return OnSendRequest(send);
        }
        if (const auto* received = std::get_if<verifier_events::PresentationReceived>(&event)) {
            return OnPresentationReceived(*received);
        }
        if (const auto* verify = std::get_if<verifier_events::VerifyPresentation>(&event)) {
            return OnVerifyPresentation(*verify, send);
        }
        return OnProblemReport(std::get<verifier_events::ProblemReportReceived>(event));
    }

    Result<VerifierStateMachine, ProtocolFailure> VerifierStateMachine::OnSendRequest(
        const SendMessageFn* send) const {
        if (!std::holds_alternative<verifier_states::Initial>(state_)) {
            return VerifierResult::Err(InvalidTransition(kMachineName, StateName(state_), "SendRequest"));
        }
        const PresentationRequest request = BuildRequestMessage(messages::NewMessageId());
        auto sent = SendThrough(send, request);
        if (sent.IsErr()) {
            return VerifierResult::Err(sent.UnwrapErr());
        }
        return VerifierResult::Ok(WithState(verifier_states::RequestSent{request.id}));
    }

    Result<VerifierStateMachine, ProtocolFailure> VerifierStateMachine::OnPresentationReceived(
        const verifier_events::PresentationReceived& event) const {
        const auto* requested = std::get_if<verifier_states::RequestSent>(&state_);
        if (requested == nullptr) {
            return VerifierResult::Err(InvalidTransition(kMachineName, StateName(state_), "PresentationReceived"));
        }
        if (!event.presentation.thread.has_value() ||
            !event.presentation.thread->IsReplyTo(requested->thread_id)) {
            return VerifierResult::Err(ProtocolFailure::ProtocolViolation(
                "Presentation is not threaded to the request"));
        }
        return VerifierResult::Ok(WithState(verifier_states::PresentationReceived{
            requested->thread_id, event.presentation}));
    }

    Result<PresentationStatus, ProtocolFailure> VerifierStateMachine::Verify(
        interfaces::IAnoncreds& anoncreds,
        const Presentation& presentation) const {
        using StatusResult = Result<PresentationStatus, ProtocolFailure>;
        auto proof_json = FirstAttachmentContent(presentation.presentations_attach, "Presentation");
        if (proof_json.IsErr()) {
            return StatusResult::Ok(PresentationStatus::Invalid);
        }
        const json proof = json::parse(proof_json.Unwrap(), nullptr, false);
        if (proof.is_discarded() || request_.CheckAnswered(proof).IsErr()) {
            return StatusResult::Ok(PresentationStatus::Invalid);
        }
        auto valid = anoncreds.VerifierVerifyProof(request_.Serialize(), proof_json.Unwrap());
        if (valid.IsErr()) {
            return StatusResult::Err(valid.UnwrapErr());
        }
        return StatusResult::Ok(valid.Unwrap() ? PresentationStatus::Verified : PresentationStatus::Invalid);
    }

    Result<VerifierStateMachine, ProtocolFailure> VerifierStateMachine::OnVerifyPresentation(
        const verifier_events::VerifyPresentation& event,
        const SendMessageFn* send) const {
        const auto* received = std::get_if<verifier_states::PresentationReceived>(&state_);
        if (received == nullptr) {
            return VerifierResult::Err(InvalidTransition(kMachineName, StateName(state_), "VerifyPresentation"));
        }
        if (event.anoncreds == nullptr) {
            return VerifierResult::Err(
                ProtocolFailure::InvalidInput("VerifyPresentation requires an anoncreds service"));
        }
        auto status = Verify(*event.anoncreds, received->presentation);
        if (status.IsErr()) {
            return VerifierResult::Err(status.UnwrapErr());
        }

        if (event.send_result) {
            A2AMessage reply;
            if (status.Unwrap() == PresentationStatus::Verified) {
                messages::PresentationAck ack;
                ack.id = messages::NewMessageId();
                ack.thread = Thread::ReplyTo(received->thread_id);
                reply = std::move(ack);
            } else {
                PresentationProblemReport report;
                report.id = messages::NewMessageId();
                report.thread = Thread::ReplyTo(received->thread_id);
                report.problem_code = std::string(kInvalidPresentation);
                report.comment = "Presentation does not satisfy the request";
                reply = std::move(report);
            }
            auto sent = SendThrough(send, reply);
            if (sent.IsErr()) {
                return VerifierResult::Err(sent.UnwrapErr());
            }
        }
        return VerifierResult::Ok(WithState(verifier_states::Completed{
            received->thread_id, received->presentation, status.Unwrap()}));
    }

    Result<VerifierStateMachine, ProtocolFailure> VerifierStateMachine::OnProblemReport(
        const verifier_events::ProblemReportReceived& event) const {
        const auto thread_id = GetThreadId();
        if (!thread_id.has_value()) {
            return VerifierResult::Err(InvalidTransition(kMachineName, StateName(state_), "ProblemReportReceived"));
        }
        return VerifierResult::Ok(WithState(verifier_states::Failed{*thread_id, event.problem_report}));
    }

    std::optional<SelectedMessage> VerifierStateMachine::FindMessageToHandle(const Inbox& inbox) const {
        const auto* requested = std::get_if<verifier_states::RequestSent>(&state_);
        if (requested == nullptr) {
            return std::nullopt;
        }
        auto selected = Dispatcher::SelectFirst(inbox, [requested](const A2AMessage& message) {
            return messages::IsInThread(message, requested->thread_id) &&
                   (std::holds_alternative<Presentation>(message) ||
                    std::holds_alternative<PresentationProblemReport>(message));
        });
        if (selected.has_value()) {
            debug::TraceMessageSelected(debug::Component::Verifier, selected->uid,
                                        messages::MessageKindName(messages::KindOf(selected->message)));
        }
        return selected;
    }

    std::optional<VerifierEvent> VerifierStateMachine::EventFromMessage(const A2AMessage& message) {
        if (const auto* presentation = std::get_if<Presentation>(&message)) {
            return verifier_events::PresentationReceived{*presentation};
        }
        if (const auto* report = std::get_if<PresentationProblemReport>(&message)) {
            return verifier_events::ProblemReportReceived{*report};
        }
        return std::nullopt;
    }

    proto::protocol::VerifierState VerifierStateMachine::ToProtoState() const {
        proto::protocol::VerifierState proto;
        proto.set_source_id(source_id_);
        proto.set_state(State());
        proto.set_presentation_request_json(request_.Serialize());
        proto.set_status(static_cast<uint32_t>(Status()));
        if (const auto thread_id = GetThreadId()) {
            proto.set_thread_id(*thread_id);
        }
        if (const auto presentation = GetPresentation()) {
            proto.set_presentation_json(snapshot::EncodeMessage(*presentation));
        }
        if (const auto* failed = std::get_if<verifier_states::Failed>(&state_)) {
            proto.set_problem_report_json(snapshot::EncodeMessage(failed->problem_report));
        }
        return proto;
    }

    Result<VerifierStateMachine, ProtocolFailure> VerifierStateMachine::FromProtoState(
        const proto::protocol::VerifierState& proto) {
        auto request = PresentationRequestData::Parse(proto.presentation_request_json());
        if (request.IsErr()) {
            return VerifierResult::Err(ProtocolFailure::Decode(
                "Snapshot presentation request: " + request.UnwrapErr().message));
        }
        auto build = [&](VerifierState state) {
            return VerifierResult::Ok(VerifierStateMachine(proto.source_id(), request.Unwrap(), std::move(state)));
        };

        switch (static_cast<VerifierStateCode>(proto.state())) {
            case VerifierStateCode::Initial:
                return build(verifier_states::Initial{});
            case VerifierStateCode::RequestSent:
                return build(verifier_states::RequestSent{proto.thread_id()});
            case VerifierStateCode::PresentationReceived:
            case VerifierStateCode::Completed: {
                auto presentation = snapshot::DecodeMessage<Presentation>(
                    proto.presentation_json(), "presentation_json");
                if (presentation.IsErr()) {
                    return VerifierResult::Err(presentation.UnwrapErr());
                }
                if (proto.state() == static_cast<uint32_t>(VerifierStateCode::PresentationReceived)) {
                    return build(verifier_states::PresentationReceived{proto.thread_id(),
                                                                       std::move(presentation).Unwrap()});
                }
                const auto status = static_cast<PresentationStatus>(proto.status());
                if (status != PresentationStatus::Verified && status != PresentationStatus::Invalid) {
                    return VerifierResult::Err(ProtocolFailure::Decode(
                        "Completed verifier snapshot has no verification status"));
                }
                return build(verifier_states::Completed{proto.thread_id(), std::move(presentation).Unwrap(),
                                                        status});
            }
            case VerifierStateCode::Failed: {
                auto report = snapshot::DecodeMessage<PresentationProblemReport>(
                    proto.problem_report_json(), "problem_report_json");
                if (report.IsErr()) {
                    return VerifierResult::Err(report.UnwrapErr());
                }
                return build(verifier_states::Failed{proto.thread_id(), std::move(report).Unwrap()});
            }
        }
        return VerifierResult::Err(ProtocolFailure::Decode(
            "Unknown verifier state code " + std::to_string(proto.state())));
    }
}
