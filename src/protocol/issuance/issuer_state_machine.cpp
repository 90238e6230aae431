#include "aries/protocol/issuance/issuer_state_machine.hpp"
#include "aries/core/constants.hpp"
#include "aries/debug/protocol_trace.hpp"
#include "aries/protocol/snapshot_codec.hpp"

#include <nlohmann/json.hpp>

namespace aries::protocol::issuance {
    using json = nlohmann::json;
    using messages::Thread;
    using IssuerResult = Result<IssuerStateMachine, ProtocolFailure>;

    namespace {
        constexpr std::string_view kMachineName = "issuer";
        constexpr std::string_view kRequestNotAccepted = "request-not-accepted";

        std::string_view EventName(const IssuerEvent& event) {
            switch (event.index()) {
                case 0: return "SendOffer";
                case 1: return "RequestReceived";
                case 2: return "SendCredential";
                case 3: return "AckReceived";
                case 4: return "ProblemReportReceived";
                default: return "Unknown";
            }
        }

        /// cred_def_id of an anoncreds offer or request, empty when absent.
        std::string CredDefIdOf(const std::string& anoncreds_json) {
            const json value = json::parse(anoncreds_json, nullptr, false);
            if (value.is_discarded() || !value.is_object() || !value.contains("cred_def_id") ||
                !value.at("cred_def_id").is_string()) {
                return {};
            }
            return value.at("cred_def_id").get<std::string>();
        }

        CredentialProblemReport MakeProblemReport(const std::string& thread_id, std::string comment) {
            CredentialProblemReport report;
            report.id = messages::NewMessageId();
            report.thread = Thread::ReplyTo(thread_id);
            report.problem_code = std::string(kRequestNotAccepted);
            report.comment = std::move(comment);
            return report;
        }
    }

    std::string_view StateName(const IssuerState& state) {
        switch (state.index()) {
            case 0: return "Initial";
            case 1: return "OfferSent";
            case 2: return "RequestReceived";
            case 3: return "CredentialSent";
            case 4: return "Completed";
            case 5: return "Failed";
            default: return "Unknown";
        }
    }

    IssuerStateMachine::IssuerStateMachine(std::string source_id, std::string cred_def_id,
                                           CredentialValues values, std::string comment,
                                           IssuerState state)
        : source_id_(std::move(source_id))
          , cred_def_id_(std::move(cred_def_id))
          , values_(std::move(values))
          , comment_(std::move(comment))
          , state_(std::move(state)) {
    }

    IssuerStateMachine IssuerStateMachine::Create(std::string source_id, std::string cred_def_id,
                                                  CredentialValues values, std::string comment) {
        return {std::move(source_id), std::move(cred_def_id), std::move(values), std::move(comment),
                issuer_states::Initial{}};
    }

    IssuerStateMachine IssuerStateMachine::WithState(IssuerState state) const {
        IssuerStateMachine next(source_id_, cred_def_id_, values_, comment_, std::move(state));
        ARIES_TRACE_TRANSITION(debug::Component::Issuer, source_id_, State(), next.State());
        return next;
    }

    IssuerStateCode IssuerStateMachine::StateCode() const noexcept {
        return static_cast<IssuerStateCode>(state_.index() + 1);
    }

    ExchangeStatus IssuerStateMachine::Status() const noexcept {
        if (std::holds_alternative<issuer_states::Completed>(state_)) {
            return ExchangeStatus::Success;
        }
        if (std::holds_alternative<issuer_states::Failed>(state_)) {
            return ExchangeStatus::Failed;
        }
        return ExchangeStatus::Undefined;
    }

    bool IssuerStateMachine::HasTransitions() const noexcept {
        return Status() == ExchangeStatus::Undefined;
    }

    std::optional<std::string> IssuerStateMachine::GetThreadId() const {
        return std::visit([](const auto& state) -> std::optional<std::string> {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, issuer_states::Initial>) {
                return std::nullopt;
            } else {
                return state.thread_id;
            }
        }, state_);
    }

    Result<IssuerStateMachine, ProtocolFailure> IssuerStateMachine::Step(
        const IssuerEvent& event,
        const SendMessageFn* send) const {
        if (!HasTransitions()) {
            return IssuerResult::Err(InvalidTransition(kMachineName, StateName(state_), EventName(event)));
        }
        if (const auto* offer = std::get_if<issuer_events::SendOffer>(&event)) {
            return OnSendOffer(*offer, send);
        }
        if (const auto* request = std::get_if<issuer_events::RequestReceived>(&event)) {
            return OnRequestReceived(*request, send);
        }
        if (const auto* credential = std::get_if<issuer_events::SendCredential>(&event)) {
            return OnSendCredential(*credential, send);
        }
        if (const auto* ack = std::get_if<issuer_events::AckReceived>(&event)) {
            return OnAckReceived(*ack);
        }
        return OnProblemReport(std::get<issuer_events::ProblemReportReceived>(event));
    }

    Result<IssuerStateMachine, ProtocolFailure> IssuerStateMachine::OnSendOffer(
        const issuer_events::SendOffer& event,
        const SendMessageFn* send) const {
        if (!std::holds_alternative<issuer_states::Initial>(state_)) {
            return IssuerResult::Err(InvalidTransition(kMachineName, StateName(state_), "SendOffer"));
        }
        if (event.anoncreds == nullptr) {
            return IssuerResult::Err(ProtocolFailure::InvalidInput("SendOffer requires an anoncreds service"));
        }
        auto offer_json = event.anoncreds->IssuerCreateCredentialOffer(cred_def_id_);
        if (offer_json.IsErr()) {
            return IssuerResult::Err(offer_json.UnwrapErr());
        }

        messages::CredentialOffer offer;
        offer.id = messages::NewMessageId();
        offer.comment = comment_;
        offer.credential_preview = values_.ToPreview();
        offer.offers_attach.push_back(messages::Attachment::FromContent(
            ProtocolConstants::OFFER_ATTACHMENT_ID, offer_json.Unwrap()));
        auto sent = SendThrough(send, offer);
        if (sent.IsErr()) {
            return IssuerResult::Err(sent.UnwrapErr());
        }
        return IssuerResult::Ok(WithState(issuer_states::OfferSent{std::move(offer_json).Unwrap(), offer.id}));
    }

    Result<IssuerStateMachine, ProtocolFailure> IssuerStateMachine::OnRequestReceived(
        const issuer_events::RequestReceived& event,
        const SendMessageFn* send) const {
        const auto* offered = std::get_if<issuer_states::OfferSent>(&state_);
        if (offered == nullptr) {
            return IssuerResult::Err(InvalidTransition(kMachineName, StateName(state_), "RequestReceived"));
        }
        if (!event.request.thread.has_value() || !event.request.thread->IsReplyTo(offered->thread_id)) {
            return IssuerResult::Err(ProtocolFailure::ProtocolViolation(
                "Credential request is not threaded to the offer"));
        }

        std::string reason;
        auto request_json = FirstAttachmentContent(event.request.requests_attach, "Credential request");
        if (request_json.IsErr()) {
            reason = request_json.UnwrapErr().message;
        } else if (CredDefIdOf(request_json.Unwrap()) != CredDefIdOf(offered->offer_json)) {
            reason = "Credential request does not match the offered credential definition";
        }
        if (!reason.empty()) {
            auto report = MakeProblemReport(offered->thread_id, std::move(reason));
            auto sent = SendThrough(send, report);
            if (sent.IsErr()) {
                return IssuerResult::Err(sent.UnwrapErr());
            }
            return IssuerResult::Ok(WithState(issuer_states::Failed{offered->thread_id, std::move(report)}));
        }
        return IssuerResult::Ok(WithState(issuer_states::RequestReceived{
            offered->offer_json, offered->thread_id, event.request}));
    }

    Result<IssuerStateMachine, ProtocolFailure> IssuerStateMachine::OnSendCredential(
        const issuer_events::SendCredential& event,
        const SendMessageFn* send) const {
        const auto* received = std::get_if<issuer_states::RequestReceived>(&state_);
        if (received == nullptr) {
            return IssuerResult::Err(InvalidTransition(kMachineName, StateName(state_), "SendCredential"));
        }
        if (event.anoncreds == nullptr) {
            return IssuerResult::Err(ProtocolFailure::InvalidInput("SendCredential requires an anoncreds service"));
        }
        auto request_json = FirstAttachmentContent(received->request.requests_attach, "Credential request");
        if (request_json.IsErr()) {
            return IssuerResult::Err(request_json.UnwrapErr());
        }
        auto encoded = values_.Encode();
        if (encoded.IsErr()) {
            return IssuerResult::Err(encoded.UnwrapErr());
        }
        auto credential_json = event.anoncreds->IssuerCreateCredential(
            received->offer_json, request_json.Unwrap(), encoded.Unwrap().dump());
        if (credential_json.IsErr()) {
            return IssuerResult::Err(credential_json.UnwrapErr());
        }

        messages::Credential credential;
        credential.id = messages::NewMessageId();
        credential.thread = Thread::ReplyTo(received->thread_id);
        credential.please_ack = true;
        credential.credentials_attach.push_back(messages::Attachment::FromContent(
            ProtocolConstants::CREDENTIAL_ATTACHMENT_ID, credential_json.Unwrap()));
        auto sent = SendThrough(send, credential);
        if (sent.IsErr()) {
            return IssuerResult::Err(sent.UnwrapErr());
        }
        return IssuerResult::Ok(WithState(issuer_states::CredentialSent{received->thread_id}));
    }

    Result<IssuerStateMachine, ProtocolFailure> IssuerStateMachine::OnAckReceived(
        const issuer_events::AckReceived& event) const {
        const auto* sent = std::get_if<issuer_states::CredentialSent>(&state_);
        if (sent == nullptr) {
            return IssuerResult::Err(InvalidTransition(kMachineName, StateName(state_), "AckReceived"));
        }
        if (!event.ack.thread.has_value() || !event.ack.thread->IsReplyTo(sent->thread_id)) {
            return IssuerResult::Err(ProtocolFailure::ProtocolViolation(
                "Credential ack is not threaded to the offer"));
        }
        return IssuerResult::Ok(WithState(issuer_states::Completed{sent->thread_id}));
    }

    Result<IssuerStateMachine, ProtocolFailure> IssuerStateMachine::OnProblemReport(
        const issuer_events::ProblemReportReceived& event) const {
        const auto thread_id = GetThreadId();
        if (!thread_id.has_value()) {
            return IssuerResult::Err(InvalidTransition(kMachineName, StateName(state_), "ProblemReportReceived"));
        }
        return IssuerResult::Ok(WithState(issuer_states::Failed{*thread_id, event.problem_report}));
    }

    std::optional<SelectedMessage> IssuerStateMachine::FindMessageToHandle(const Inbox& inbox) const {
        const auto thread_id = GetThreadId();
        if (!thread_id.has_value() || !HasTransitions()) {
            return std::nullopt;
        }
        const auto code = StateCode();
        auto selected = Dispatcher::SelectFirst(inbox, [&](const A2AMessage& message) {
            if (!messages::IsInThread(message, *thread_id)) {
                return false;
            }
            if (std::holds_alternative<CredentialProblemReport>(message)) {
                return true;
            }
            return (code == IssuerStateCode::OfferSent && std::holds_alternative<CredentialRequest>(message)) ||
                   (code == IssuerStateCode::CredentialSent &&
                    std::holds_alternative<messages::CredentialAck>(message));
        });
        if (selected.has_value()) {
            debug::TraceMessageSelected(debug::Component::Issuer, selected->uid,
                                        messages::MessageKindName(messages::KindOf(selected->message)));
        }
        return selected;
    }

    std::optional<IssuerEvent> IssuerStateMachine::EventFromMessage(const A2AMessage& message) {
        if (const auto* request = std::get_if<CredentialRequest>(&message)) {
            return issuer_events::RequestReceived{*request};
        }
        if (const auto* ack = std::get_if<messages::CredentialAck>(&message)) {
            return issuer_events::AckReceived{*ack};
        }
        if (const auto* report = std::get_if<CredentialProblemReport>(&message)) {
            return issuer_events::ProblemReportReceived{*report};
        }
        return std::nullopt;
    }

    proto::protocol::IssuerState IssuerStateMachine::ToProtoState() const {
        proto::protocol::IssuerState proto;
        proto.set_source_id(source_id_);
        proto.set_cred_def_id(cred_def_id_);
        proto.set_credential_values_json(values_.ToJson());
        proto.set_comment(comment_);
        proto.set_state(State());
        std::visit([&proto](const auto& state) {
            using S = std::decay_t<decltype(state)>;
            if constexpr (!std::is_same_v<S, issuer_states::Initial>) {
                proto.set_thread_id(state.thread_id);
            }
            if constexpr (std::is_same_v<S, issuer_states::OfferSent> ||
                          std::is_same_v<S, issuer_states::RequestReceived>) {
                proto.set_offer_json(state.offer_json);
            }
            if constexpr (std::is_same_v<S, issuer_states::RequestReceived>) {
                proto.set_request_json(snapshot::EncodeMessage(state.request));
            }
            if constexpr (std::is_same_v<S, issuer_states::Failed>) {
                proto.set_problem_report_json(snapshot::EncodeMessage(state.problem_report));
            }
        }, state_);
        return proto;
    }

    Result<IssuerStateMachine, ProtocolFailure> IssuerStateMachine::FromProtoState(
        const proto::protocol::IssuerState& proto) {
        auto values = CredentialValues::Parse(proto.credential_values_json());
        if (values.IsErr()) {
            return IssuerResult::Err(ProtocolFailure::Decode(
                "Snapshot credential values: " + values.UnwrapErr().message));
        }
        auto build = [&](IssuerState state) {
            return IssuerResult::Ok(IssuerStateMachine(proto.source_id(), proto.cred_def_id(),
                                                       values.Unwrap(), proto.comment(), std::move(state)));
        };

        switch (static_cast<IssuerStateCode>(proto.state())) {
            case IssuerStateCode::Initial:
                return build(issuer_states::Initial{});
            case IssuerStateCode::OfferSent:
                return build(issuer_states::OfferSent{proto.offer_json(), proto.thread_id()});
            case IssuerStateCode::RequestReceived: {
                auto request = snapshot::DecodeMessage<CredentialRequest>(proto.request_json(), "request_json");
                if (request.IsErr()) {
                    return IssuerResult::Err(request.UnwrapErr());
                }
                return build(issuer_states::RequestReceived{proto.offer_json(), proto.thread_id(),
                                                            std::move(request).Unwrap()});
            }
            case IssuerStateCode::CredentialSent:
                return build(issuer_states::CredentialSent{proto.thread_id()});
            case IssuerStateCode::Completed:
                return build(issuer_states::Completed{proto.thread_id()});
            case IssuerStateCode::Failed: {
                auto report = snapshot::DecodeMessage<CredentialProblemReport>(
                    proto.problem_report_json(), "problem_report_json");
                if (report.IsErr()) {
                    return IssuerResult::Err(report.UnwrapErr());
                }
                return build(issuer_states::Failed{proto.thread_id(), std::move(report).Unwrap()});
            }
        }
        return IssuerResult::Err(ProtocolFailure::Decode(
            "Unknown issuer state code " + std::to_string(proto.state())));
    }
}
