#include "aries/protocol/issuance/holder_state_machine.hpp"
#include "aries/core/constants.hpp"
#include "aries/debug/protocol_trace.hpp"
#include "aries/protocol/snapshot_codec.hpp"

namespace aries::protocol::issuance {
    using messages::Thread;
    using HolderResult = Result<HolderStateMachine, ProtocolFailure>;

    namespace {
        constexpr std::string_view kMachineName = "holder";
        constexpr std::string_view kOfferDeclined = "offer-declined";

        std::string_view EventName(const HolderEvent& event) {
            switch (event.index()) {
                case 0: return "OfferReceived";
                case 1: return "SendRequest";
                case 2: return "CredentialReceived";
                case 3: return "StoreCredential";
                case 4: return "DeclineOffer";
                case 5: return "ProblemReportReceived";
                case 6: return "SendAck";
                default: return "Unknown";
            }
        }
    }

    std::string_view StateName(const HolderState& state) {
        switch (state.index()) {
            case 0: return "Initial";
            case 1: return "OfferReceived";
            case 2: return "RequestSent";
            case 3: return "CredentialReceived";
            case 4: return "Completed";
            case 5: return "Failed";
            default: return "Unknown";
        }
    }

    HolderStateMachine::HolderStateMachine(std::string source_id, HolderState state)
        : source_id_(std::move(source_id))
          , state_(std::move(state)) {
    }

    HolderStateMachine HolderStateMachine::Create(std::string source_id) {
        return {std::move(source_id), holder_states::Initial{}};
    }

    HolderStateMachine HolderStateMachine::WithState(HolderState state) const {
        HolderStateMachine next(source_id_, std::move(state));
        ARIES_TRACE_TRANSITION(debug::Component::Holder, source_id_, State(), next.State());
        return next;
    }

    HolderStateCode HolderStateMachine::StateCode() const noexcept {
        return static_cast<HolderStateCode>(state_.index() + 1);
    }

    ExchangeStatus HolderStateMachine::Status() const noexcept {
        if (std::holds_alternative<holder_states::Completed>(state_)) {
            return ExchangeStatus::Success;
        }
        if (std::holds_alternative<holder_states::Failed>(state_)) {
            return ExchangeStatus::Failed;
        }
        return ExchangeStatus::Undefined;
    }

    bool HolderStateMachine::HasTransitions() const noexcept {
        return Status() == ExchangeStatus::Undefined;
    }

    std::optional<std::string> HolderStateMachine::GetThreadId() const {
        return std::visit([](const auto& state) -> std::optional<std::string> {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, holder_states::Initial>) {
                return std::nullopt;
            } else if constexpr (std::is_same_v<S, holder_states::Failed>) {
                return state.thread_id;
            } else {
                return state.offer.id;
            }
        }, state_);
    }

    std::optional<CredentialOffer> HolderStateMachine::GetOffer() const {
        return std::visit([](const auto& state) -> std::optional<CredentialOffer> {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, holder_states::Initial> ||
                          std::is_same_v<S, holder_states::Failed>) {
                return std::nullopt;
            } else {
                return state.offer;
            }
        }, state_);
    }

    Result<HolderStateMachine, ProtocolFailure> HolderStateMachine::Step(
        const HolderEvent& event,
        const SendMessageFn* send) const {
        if (std::holds_alternative<holder_events::SendAck>(event)) {
            return OnSendAck(send);
        }
        if (!HasTransitions()) {
            return HolderResult::Err(InvalidTransition(kMachineName, StateName(state_), EventName(event)));
        }
        if (const auto* offer = std::get_if<holder_events::OfferReceived>(&event)) {
            return OnOfferReceived(*offer);
        }
        if (const auto* request = std::get_if<holder_events::SendRequest>(&event)) {
            return OnSendRequest(*request, send);
        }
        if (const auto* credential = std::get_if<holder_events::CredentialReceived>(&event)) {
            return OnCredentialReceived(*credential);
        }
        if (const auto* store = std::get_if<holder_events::StoreCredential>(&event)) {
            return OnStoreCredential(*store);
        }
        if (const auto* decline = std::get_if<holder_events::DeclineOffer>(&event)) {
            return OnDeclineOffer(*decline, send);
        }
        return OnProblemReport(std::get<holder_events::ProblemReportReceived>(event));
    }

    Result<HolderStateMachine, ProtocolFailure> HolderStateMachine::OnOfferReceived(
        const holder_events::OfferReceived& event) const {
        if (!std::holds_alternative<holder_states::Initial>(state_)) {
            return HolderResult::Err(InvalidTransition(kMachineName, StateName(state_), "OfferReceived"));
        }
        if (event.offer.offers_attach.empty()) {
            return HolderResult::Err(ProtocolFailure::MalformedMessage("Credential offer carries no attachment"));
        }
        return HolderResult::Ok(WithState(holder_states::OfferReceived{event.offer}));
    }

    Result<HolderStateMachine, ProtocolFailure> HolderStateMachine::OnSendRequest(
        const holder_events::SendRequest& event,
        const SendMessageFn* send) const {
        const auto* received = std::get_if<holder_states::OfferReceived>(&state_);
        if (received == nullptr) {
            return HolderResult::Err(InvalidTransition(kMachineName, StateName(state_), "SendRequest"));
        }
        if (event.anoncreds == nullptr) {
            return HolderResult::Err(ProtocolFailure::InvalidInput("SendRequest requires an anoncreds service"));
        }
        auto offer_json = FirstAttachmentContent(received->offer.offers_attach, "Credential offer");
        if (offer_json.IsErr()) {
            return HolderResult::Err(offer_json.UnwrapErr());
        }
        auto bundle = event.anoncreds->ProverCreateCredentialRequest(event.prover_did, offer_json.Unwrap());
        if (bundle.IsErr()) {
            return HolderResult::Err(bundle.UnwrapErr());
        }

        messages::CredentialRequest request;
        request.id = messages::NewMessageId();
        request.thread = Thread::ReplyTo(received->offer.id);
        request.requests_attach.push_back(messages::Attachment::FromContent(
            ProtocolConstants::REQUEST_ATTACHMENT_ID, bundle.Unwrap().request_json));
        auto sent = SendThrough(send, request);
        if (sent.IsErr()) {
            return HolderResult::Err(sent.UnwrapErr());
        }
        return HolderResult::Ok(WithState(holder_states::RequestSent{
            received->offer, std::move(offer_json).Unwrap(), bundle.Unwrap().request_metadata_json}));
    }

    Result<HolderStateMachine, ProtocolFailure> HolderStateMachine::OnCredentialReceived(
        const holder_events::CredentialReceived& event) const {
        const auto* requested = std::get_if<holder_states::RequestSent>(&state_);
        if (requested == nullptr) {
            return HolderResult::Err(InvalidTransition(kMachineName, StateName(state_), "CredentialReceived"));
        }
        if (!event.credential.thread.has_value() || !event.credential.thread->IsReplyTo(requested->offer.id)) {
            return HolderResult::Err(ProtocolFailure::ProtocolViolation(
                "Credential is not threaded to the offer"));
        }
        return HolderResult::Ok(WithState(holder_states::CredentialReceived{
            requested->offer, requested->request_metadata_json, event.credential}));
    }

    Result<HolderStateMachine, ProtocolFailure> HolderStateMachine::OnStoreCredential(
        const holder_events::StoreCredential& event) const {
        const auto* received = std::get_if<holder_states::CredentialReceived>(&state_);
        if (received == nullptr) {
            return HolderResult::Err(InvalidTransition(kMachineName, StateName(state_), "StoreCredential"));
        }
        if (event.anoncreds == nullptr) {
            return HolderResult::Err(ProtocolFailure::InvalidInput("StoreCredential requires an anoncreds service"));
        }
        auto credential_json = FirstAttachmentContent(received->credential.credentials_attach, "Credential");
        if (credential_json.IsErr()) {
            return HolderResult::Err(credential_json.UnwrapErr());
        }
        auto credential_id = event.anoncreds->ProverStoreCredential(
            received->request_metadata_json, credential_json.Unwrap());
        if (credential_id.IsErr()) {
            return HolderResult::Err(credential_id.UnwrapErr());
        }
        return HolderResult::Ok(WithState(holder_states::Completed{
            received->offer, received->credential, std::move(credential_id).Unwrap()}));
    }

    Result<HolderStateMachine, ProtocolFailure> HolderStateMachine::OnSendAck(const SendMessageFn* send) const {
        const auto* completed = std::get_if<holder_states::Completed>(&state_);
        if (completed == nullptr) {
            return HolderResult::Err(InvalidTransition(kMachineName, StateName(state_), "SendAck"));
        }
        if (!completed->credential.please_ack) {
            return HolderResult::Err(ProtocolFailure::ProtocolViolation("Issuer did not ask for a credential ack"));
        }
        messages::CredentialAck ack;
        ack.id = messages::NewMessageId();
        ack.thread = Thread::ReplyTo(completed->offer.id);
        auto sent = SendThrough(send, ack);
        if (sent.IsErr()) {
            return HolderResult::Err(sent.UnwrapErr());
        }
        return HolderResult::Ok(*this);
    }

    Result<HolderStateMachine, ProtocolFailure> HolderStateMachine::OnDeclineOffer(
        const holder_events::DeclineOffer& event,
        const SendMessageFn* send) const {
        const auto* received = std::get_if<holder_states::OfferReceived>(&state_);
        if (received == nullptr) {
            return HolderResult::Err(InvalidTransition(kMachineName, StateName(state_), "DeclineOffer"));
        }
        CredentialProblemReport report;
        report.id = messages::NewMessageId();
        report.thread = Thread::ReplyTo(received->offer.id);
        report.problem_code = std::string(kOfferDeclined);
        report.comment = event.comment;
        auto sent = SendThrough(send, report);
        if (sent.IsErr()) {
            return HolderResult::Err(sent.UnwrapErr());
        }
        return HolderResult::Ok(WithState(holder_states::Failed{received->offer.id, std::move(report)}));
    }

    Result<HolderStateMachine, ProtocolFailure> HolderStateMachine::OnProblemReport(
        const holder_events::ProblemReportReceived& event) const {
        const auto thread_id = GetThreadId();
        if (!thread_id.has_value()) {
            return HolderResult::Err(InvalidTransition(kMachineName, StateName(state_), "ProblemReportReceived"));
        }
        return HolderResult::Ok(WithState(holder_states::Failed{*thread_id, event.problem_report}));
    }

    std::optional<SelectedMessage> HolderStateMachine::FindMessageToHandle(const Inbox& inbox) const {
        const auto thread_id = GetThreadId();
        if (!thread_id.has_value() || !HasTransitions()) {
            return std::nullopt;
        }
        const auto code = StateCode();
        auto selected = Dispatcher::SelectFirst(inbox, [&](const A2AMessage& message) {
            if (!messages::IsInThread(message, *thread_id)) {
                return false;
            }
            return std::holds_alternative<CredentialProblemReport>(message) ||
                   (code == HolderStateCode::RequestSent && std::holds_alternative<Credential>(message));
        });
        if (selected.has_value()) {
            debug::TraceMessageSelected(debug::Component::Holder, selected->uid,
                                        messages::MessageKindName(messages::KindOf(selected->message)));
        }
        return selected;
    }

    std::optional<HolderEvent> HolderStateMachine::EventFromMessage(const A2AMessage& message) {
        if (const auto* offer = std::get_if<CredentialOffer>(&message)) {
            return holder_events::OfferReceived{*offer};
        }
        if (const auto* credential = std::get_if<Credential>(&message)) {
            return holder_events::CredentialReceived{*credential};
        }
        if (const auto* report = std::get_if<CredentialProblemReport>(&message)) {
            return holder_events::ProblemReportReceived{*report};
        }
        return std::nullopt;
    }

    proto::protocol::HolderState HolderStateMachine::ToProtoState() const {
        proto::protocol::HolderState proto;
        proto.set_source_id(source_id_);
        proto.set_state(State());
        if (const auto thread_id = GetThreadId()) {
            proto.set_thread_id(*thread_id);
        }
        std::visit([&proto](const auto& state) {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, holder_states::Failed>) {
                proto.set_problem_report_json(snapshot::EncodeMessage(state.problem_report));
            } else if constexpr (!std::is_same_v<S, holder_states::Initial>) {
                proto.set_offer_message_json(snapshot::EncodeMessage(state.offer));
            }
            if constexpr (std::is_same_v<S, holder_states::RequestSent>) {
                proto.set_offer_json(state.offer_json);
            }
            if constexpr (std::is_same_v<S, holder_states::RequestSent> ||
                          std::is_same_v<S, holder_states::CredentialReceived>) {
                proto.set_request_metadata_json(state.request_metadata_json);
            }
            if constexpr (std::is_same_v<S, holder_states::CredentialReceived> ||
                          std::is_same_v<S, holder_states::Completed>) {
                proto.set_credential_message_json(snapshot::EncodeMessage(state.credential));
            }
            if constexpr (std::is_same_v<S, holder_states::Completed>) {
                proto.set_credential_id(state.credential_id);
            }
        }, state_);
        return proto;
    }

    Result<HolderStateMachine, ProtocolFailure> HolderStateMachine::FromProtoState(
        const proto::protocol::HolderState& proto) {
        auto build = [&proto](HolderState state) {
            return HolderResult::Ok(HolderStateMachine(proto.source_id(), std::move(state)));
        };
        const auto code = static_cast<HolderStateCode>(proto.state());
        if (code == HolderStateCode::Initial) {
            return build(holder_states::Initial{});
        }
        if (code == HolderStateCode::Failed) {
            auto report = snapshot::DecodeMessage<CredentialProblemReport>(
                proto.problem_report_json(), "problem_report_json");
            if (report.IsErr()) {
                return HolderResult::Err(report.UnwrapErr());
            }
            return build(holder_states::Failed{proto.thread_id(), std::move(report).Unwrap()});
        }
        if (code < HolderStateCode::Initial || code > HolderStateCode::Failed) {
            return HolderResult::Err(ProtocolFailure::Decode(
                "Unknown holder state code " + std::to_string(proto.state())));
        }

        auto offer = snapshot::DecodeMessage<CredentialOffer>(proto.offer_message_json(), "offer_message_json");
        if (offer.IsErr()) {
            return HolderResult::Err(offer.UnwrapErr());
        }
        if (code == HolderStateCode::OfferReceived) {
            return build(holder_states::OfferReceived{std::move(offer).Unwrap()});
        }
        if (code == HolderStateCode::RequestSent) {
            return build(holder_states::RequestSent{std::move(offer).Unwrap(), proto.offer_json(),
                                                    proto.request_metadata_json()});
        }
        auto credential = snapshot::DecodeMessage<Credential>(
            proto.credential_message_json(), "credential_message_json");
        if (credential.IsErr()) {
            return HolderResult::Err(credential.UnwrapErr());
        }
        if (code == HolderStateCode::CredentialReceived) {
            return build(holder_states::CredentialReceived{std::move(offer).Unwrap(),
                                                           proto.request_metadata_json(),
                                                           std::move(credential).Unwrap()});
        }
        return build(holder_states::Completed{std::move(offer).Unwrap(), std::move(credential).Unwrap(),
                                              proto.credential_id()});
    }
}
