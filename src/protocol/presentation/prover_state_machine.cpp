#include "aries/protocol/presentation/prover_state_machine.hpp"
#include "aries/core/constants.hpp"
#include "aries/debug/protocol_trace.hpp"
#include "aries/protocol/snapshot_codec.hpp"

namespace aries::protocol::presentation {
    using messages::Thread;
    using ProverResult = Result<ProverStateMachine, ProtocolFailure>;

    namespace {
        constexpr std::string_view kMachineName = "prover";
        constexpr std::string_view kRequestDeclined = "request-declined";

        std::string_view EventName(const ProverEvent& event) {
            switch (event.index()) {
                case 0: return "RequestReceived";
                case 1: return "GeneratePresentation";
                case 2: return "SendPresentation";
                case 3: return "AckReceived";
                case 4: return "DeclineRequest";
                case 5: return "ProposePresentation";
                case 6: return "ProblemReportReceived";
                default: return "Unknown";
            }
        }

        /// Request of a state that answers one, before anything was sent back.
        const PresentationRequest* OpenRequest(const ProverState& state) {
            if (const auto* received = std::get_if<prover_states::RequestReceived>(&state)) {
                return &received->request;
            }
            if (const auto* built = std::get_if<prover_states::PresentationBuilt>(&state)) {
                return &built->request;
            }
            return nullptr;
        }
    }

    std::string_view StateName(const ProverState& state) {
        switch (state.index()) {
            case 0: return "Initial";
            case 1: return "RequestReceived";
            case 2: return "PresentationBuilt";
            case 3: return "Sent";
            case 4: return "Completed";
            case 5: return "Declined";
            case 6: return "ProposalSent";
            case 7: return "Failed";
            default: return "Unknown";
        }
    }

    ProverStateMachine::ProverStateMachine(std::string source_id, ProverState state)
        : source_id_(std::move(source_id))
          , state_(std::move(state)) {
    }

    ProverStateMachine ProverStateMachine::Create(std::string source_id) {
        return {std::move(source_id), prover_states::Initial{}};
    }

    ProverStateMachine ProverStateMachine::WithState(ProverState state) const {
        ProverStateMachine next(source_id_, std::move(state));
        ARIES_TRACE_TRANSITION(debug::Component::Prover, source_id_, State(), next.State());
        return next;
    }

    ProverStateCode ProverStateMachine::StateCode() const noexcept {
        return static_cast<ProverStateCode>(state_.index() + 1);
    }

    ExchangeStatus ProverStateMachine::Status() const noexcept {
        if (std::holds_alternative<prover_states::Completed>(state_)) {
            return ExchangeStatus::Success;
        }
        if (std::holds_alternative<prover_states::Declined>(state_) ||
            std::holds_alternative<prover_states::Failed>(state_)) {
            return ExchangeStatus::Failed;
        }
        return ExchangeStatus::Undefined;
    }

    bool ProverStateMachine::HasTransitions() const noexcept {
        return Status() == ExchangeStatus::Undefined;
    }

    std::string ProverStateMachine::ThreadIdOf(const PresentationRequest& request) {
        if (request.thread.has_value() && request.thread->thid.has_value()) {
            return *request.thread->thid;
        }
        return request.id;
    }

    std::optional<std::string> ProverStateMachine::GetThreadId() const {
        if (const auto* failed = std::get_if<prover_states::Failed>(&state_)) {
            return failed->thread_id;
        }
        const auto request = GetPresentationRequest();
        if (!request.has_value()) {
            return std::nullopt;
        }
        return ThreadIdOf(*request);
    }

    std::optional<PresentationRequest> ProverStateMachine::GetPresentationRequest() const {
        return std::visit([](const auto& state) -> std::optional<PresentationRequest> {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, prover_states::Initial> ||
                          std::is_same_v<S, prover_states::Failed>) {
                return std::nullopt;
            } else {
                return state.request;
            }
        }, state_);
    }

    std::optional<std::string> ProverStateMachine::GetPresentationJson() const {
        return std::visit([](const auto& state) -> std::optional<std::string> {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, prover_states::PresentationBuilt> ||
                          std::is_same_v<S, prover_states::Sent> ||
                          std::is_same_v<S, prover_states::Completed>) {
                return state.presentation_json;
            } else {
                return std::nullopt;
            }
        }, state_);
    }

    Result<ProverStateMachine, ProtocolFailure> ProverStateMachine::Step(
        const ProverEvent& event,
        const SendMessageFn* send) const {
        if (!HasTransitions()) {
            return ProverResult::Err(InvalidTransition(kMachineName, StateName(state_), EventName(event)));
        }
        if (const auto* received = std::get_if<prover_events::RequestReceived>(&event)) {
            return OnRequestReceived(*received);
        }
        if (const auto* generate = std::get_if<prover_events::GeneratePresentation>(&event)) {
            return OnGeneratePresentation(*generate);
        }
        if (std::holds_alternative<prover_events::SendPresentation>(event)) {
            return OnSendPresentation(send);
        }
        if (const auto* ack = std::get_if<prover_events::AckReceived>(&event)) {
            return OnAckReceived(*ack);
        }
        if (const auto* decline = std::get_if<prover_events::DeclineRequest>(&event)) {
            return OnDeclineRequest(*decline, send);
        }
        if (const auto* propose = std::get_if<prover_events::ProposePresentation>(&event)) {
            return OnProposePresentation(*propose, send);
        }
        return OnProblemReport(std::get<prover_events::ProblemReportReceived>(event));
    }

    Result<ProverStateMachine, ProtocolFailure> ProverStateMachine::OnRequestReceived(
        const prover_events::RequestReceived& event) const {
        const bool initial = std::holds_alternative<prover_states::Initial>(state_);
        const auto* proposed = std::get_if<prover_states::ProposalSent>(&state_);
        if (!initial && proposed == nullptr) {
            return ProverResult::Err(InvalidTransition(kMachineName, StateName(state_), "RequestReceived"));
        }
        if (proposed != nullptr && ThreadIdOf(event.request) != ThreadIdOf(proposed->request)) {
            return ProverResult::Err(ProtocolFailure::ProtocolViolation(
                "Presentation request does not continue the proposal thread"));
        }
        if (event.request.request_presentations_attach.empty()) {
            return ProverResult::Err(ProtocolFailure::MalformedMessage(
                "Presentation request carries no attachment"));
        }
        return ProverResult::Ok(WithState(prover_states::RequestReceived{event.request}));
    }

    Result<ProverStateMachine, ProtocolFailure> ProverStateMachine::OnGeneratePresentation(
        const prover_events::GeneratePresentation& event) const {
        const auto* request = OpenRequest(state_);
        if (request == nullptr) {
            return ProverResult::Err(InvalidTransition(kMachineName, StateName(state_), "GeneratePresentation"));
        }
        if (event.anoncreds == nullptr) {
            return ProverResult::Err(
                ProtocolFailure::InvalidInput("GeneratePresentation requires an anoncreds service"));
        }
        auto request_json = FirstAttachmentContent(request->request_presentations_attach, "Presentation request");
        if (request_json.IsErr()) {
            return ProverResult::Err(request_json.UnwrapErr());
        }
        auto proof = event.anoncreds->ProverCreateProof(
            request_json.Unwrap(),
            event.selected_credentials_json.empty() ? std::string("{}") : event.selected_credentials_json,
            event.self_attested_attrs_json.empty() ? std::string("{}") : event.self_attested_attrs_json);
        if (proof.IsErr()) {
            return ProverResult::Err(proof.UnwrapErr());
        }
        return ProverResult::Ok(WithState(prover_states::PresentationBuilt{*request, std::move(proof).Unwrap()}));
    }

    Result<ProverStateMachine, ProtocolFailure> ProverStateMachine::OnSendPresentation(
        const SendMessageFn* send) const {
        const auto* built = std::get_if<prover_states::PresentationBuilt>(&state_);
        if (built == nullptr) {
            return ProverResult::Err(InvalidTransition(kMachineName, StateName(state_), "SendPresentation"));
        }
        messages::Presentation presentation;
        presentation.id = messages::NewMessageId();
        presentation.thread = Thread::ReplyTo(ThreadIdOf(built->request));
        presentation.please_ack = true;
        presentation.presentations_attach.push_back(messages::Attachment::FromContent(
            ProtocolConstants::PRESENTATION_ATTACHMENT_ID, built->presentation_json));
        auto sent = SendThrough(send, presentation);
        if (sent.IsErr()) {
            return ProverResult::Err(sent.UnwrapErr());
        }
        return ProverResult::Ok(WithState(prover_states::Sent{built->request, built->presentation_json}));
    }

    Result<ProverStateMachine, ProtocolFailure> ProverStateMachine::OnAckReceived(
        const prover_events::AckReceived& event) const {
        const auto* sent = std::get_if<prover_states::Sent>(&state_);
        if (sent == nullptr) {
            return ProverResult::Err(InvalidTransition(kMachineName, StateName(state_), "AckReceived"));
        }
        if (!event.ack.thread.has_value() || !event.ack.thread->IsReplyTo(ThreadIdOf(sent->request))) {
            return ProverResult::Err(ProtocolFailure::ProtocolViolation(
                "Presentation ack is not threaded to the request"));
        }
        return ProverResult::Ok(WithState(prover_states::Completed{sent->request, sent->presentation_json}));
    }

    Result<ProverStateMachine, ProtocolFailure> ProverStateMachine::OnDeclineRequest(
        const prover_events::DeclineRequest& event,
        const SendMessageFn* send) const {
        const auto* request = OpenRequest(state_);
        if (request == nullptr) {
            return ProverResult::Err(InvalidTransition(kMachineName, StateName(state_), "DeclineRequest"));
        }
        PresentationProblemReport report;
        report.id = messages::NewMessageId();
        report.thread = Thread::ReplyTo(ThreadIdOf(*request));
        report.problem_code = std::string(kRequestDeclined);
        report.comment = event.reason;
        auto sent = SendThrough(send, report);
        if (sent.IsErr()) {
            return ProverResult::Err(sent.UnwrapErr());
        }
        return ProverResult::Ok(WithState(prover_states::Declined{*request, std::move(report)}));
    }

    Result<ProverStateMachine, ProtocolFailure> ProverStateMachine::OnProposePresentation(
        const prover_events::ProposePresentation& event,
        const SendMessageFn* send) const {
        const auto* request = OpenRequest(state_);
        if (request == nullptr) {
            return ProverResult::Err(InvalidTransition(kMachineName, StateName(state_), "ProposePresentation"));
        }
        PresentationProposal proposal;
        proposal.id = messages::NewMessageId();
        proposal.comment = event.comment;
        proposal.presentation_proposal = event.preview;
        proposal.thread = Thread::ReplyTo(ThreadIdOf(*request));
        auto sent = SendThrough(send, proposal);
        if (sent.IsErr()) {
            return ProverResult::Err(sent.UnwrapErr());
        }
        return ProverResult::Ok(WithState(prover_states::ProposalSent{*request, std::move(proposal)}));
    }

    Result<ProverStateMachine, ProtocolFailure> ProverStateMachine::OnProblemReport(
        const prover_events::ProblemReportReceived& event) const {
        const auto thread_id = GetThreadId();
        if (!thread_id.has_value()) {
            return ProverResult::Err(InvalidTransition(kMachineName, StateName(state_), "ProblemReportReceived"));
        }
        return ProverResult::Ok(WithState(prover_states::Failed{*thread_id, event.problem_report}));
    }

    std::optional<SelectedMessage> ProverStateMachine::FindMessageToHandle(const Inbox& inbox) const {
        const auto thread_id = GetThreadId();
        if (!thread_id.has_value() || !HasTransitions()) {
            return std::nullopt;
        }
        const auto code = StateCode();
        auto selected = Dispatcher::SelectFirst(inbox, [&](const A2AMessage& message) {
            if (!messages::IsInThread(message, *thread_id)) {
                return false;
            }
            return std::holds_alternative<PresentationProblemReport>(message) ||
                   (code == ProverStateCode::Sent &&
                    std::holds_alternative<messages::PresentationAck>(message)) ||
                   (code == ProverStateCode::ProposalSent &&
                    std::holds_alternative<PresentationRequest>(message));
        });
        if (selected.has_value()) {
            debug::TraceMessageSelected(debug::Component::Prover, selected->uid,
                                        messages::MessageKindName(messages::KindOf(selected->message)));
        }
        return selected;
    }

    std::optional<ProverEvent> ProverStateMachine::EventFromMessage(const A2AMessage& message) {
        if (const auto* request = std::get_if<PresentationRequest>(&message)) {
            return prover_events::RequestReceived{*request};
        }
        if (const auto* ack = std::get_if<messages::PresentationAck>(&message)) {
            return prover_events::AckReceived{*ack};
        }
        if (const auto* report = std::get_if<PresentationProblemReport>(&message)) {
            return prover_events::ProblemReportReceived{*report};
        }
        return std::nullopt;
    }

    proto::protocol::ProverState ProverStateMachine::ToProtoState() const {
        proto::protocol::ProverState proto;
        proto.set_source_id(source_id_);
        proto.set_state(State());
        if (const auto thread_id = GetThreadId()) {
            proto.set_thread_id(*thread_id);
        }
        if (const auto request = GetPresentationRequest()) {
            proto.set_request_message_json(snapshot::EncodeMessage(*request));
        }
        if (const auto presentation = GetPresentationJson()) {
            proto.set_presentation_json(*presentation);
        }
        if (const auto* proposed = std::get_if<prover_states::ProposalSent>(&state_)) {
            proto.set_proposal_json(snapshot::EncodeMessage(proposed->proposal));
        }
        if (const auto* declined = std::get_if<prover_states::Declined>(&state_)) {
            proto.set_problem_report_json(snapshot::EncodeMessage(declined->problem_report));
        }
        if (const auto* failed = std::get_if<prover_states::Failed>(&state_)) {
            proto.set_problem_report_json(snapshot::EncodeMessage(failed->problem_report));
        }
        return proto;
    }

    Result<ProverStateMachine, ProtocolFailure> ProverStateMachine::FromProtoState(
        const proto::protocol::ProverState& proto) {
        auto build = [&proto](ProverState state) {
            return ProverResult::Ok(ProverStateMachine(proto.source_id(), std::move(state)));
        };
        const auto code = static_cast<ProverStateCode>(proto.state());
        if (code == ProverStateCode::Initial) {
            return build(prover_states::Initial{});
        }
        if (code < ProverStateCode::Initial || code > ProverStateCode::Failed) {
            return ProverResult::Err(ProtocolFailure::Decode(
                "Unknown prover state code " + std::to_string(proto.state())));
        }
        if (code == ProverStateCode::Failed || code == ProverStateCode::Declined) {
            auto report = snapshot::DecodeMessage<PresentationProblemReport>(
                proto.problem_report_json(), "problem_report_json");
            if (report.IsErr()) {
                return ProverResult::Err(report.UnwrapErr());
            }
            if (code == ProverStateCode::Failed) {
                return build(prover_states::Failed{proto.thread_id(), std::move(report).Unwrap()});
            }
            auto request = snapshot::DecodeMessage<PresentationRequest>(
                proto.request_message_json(), "request_message_json");
            if (request.IsErr()) {
                return ProverResult::Err(request.UnwrapErr());
            }
            return build(prover_states::Declined{std::move(request).Unwrap(), std::move(report).Unwrap()});
        }

        auto request = snapshot::DecodeMessage<PresentationRequest>(
            proto.request_message_json(), "request_message_json");
        if (request.IsErr()) {
            return ProverResult::Err(request.UnwrapErr());
        }
        switch (code) {
            case ProverStateCode::RequestReceived:
                return build(prover_states::RequestReceived{std::move(request).Unwrap()});
            case ProverStateCode::PresentationBuilt:
                return build(prover_states::PresentationBuilt{std::move(request).Unwrap(), proto.presentation_json()});
            case ProverStateCode::Sent:
                return build(prover_states::Sent{std::move(request).Unwrap(), proto.presentation_json()});
            case ProverStateCode::Completed:
                return build(prover_states::Completed{std::move(request).Unwrap(), proto.presentation_json()});
            default:
                break;
        }
        auto proposal = snapshot::DecodeMessage<PresentationProposal>(proto.proposal_json(), "proposal_json");
        if (proposal.IsErr()) {
            return ProverResult::Err(proposal.UnwrapErr());
        }
        return build(prover_states::ProposalSent{std::move(request).Unwrap(), std::move(proposal).Unwrap()});
    }
}
