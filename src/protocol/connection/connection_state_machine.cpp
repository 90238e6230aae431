#include "aries/protocol/connection/connection_state_machine.hpp"
#include "aries/protocol/connection/connection_signature.hpp"
#include "aries/protocol/snapshot_codec.hpp"
#include "aries/debug/protocol_trace.hpp"

#include <nlohmann/json.hpp>

namespace aries::protocol::connection {
    using json = nlohmann::json;
    using messages::Thread;
    using ConnectionResult = Result<ConnectionStateMachine, ProtocolFailure>;

    namespace {
        constexpr std::string_view kMachineName = "connection";
        constexpr std::string_view kRequestNotAccepted = "request_not_accepted";
        constexpr std::string_view kResponseNotAccepted = "response_not_accepted";

        ConnectionProblemReport MakeProblemReport(const std::string& thread_id,
                                                  std::string_view code,
                                                  std::string comment) {
            ConnectionProblemReport report;
            report.id = messages::NewMessageId();
            report.thread = Thread::ReplyTo(thread_id);
            report.problem_code = std::string(code);
            report.comment = std::move(comment);
            return report;
        }

        std::string_view EventName(const ConnectionEvent& event) {
            switch (event.index()) {
                case 0: return "Connect";
                case 1: return "InvitationReceived";
                case 2: return "RequestReceived";
                case 3: return "SendResponse";
                case 4: return "ResponseReceived";
                case 5: return "SendAck";
                case 6: return "AckReceived";
                case 7: return "ProblemReportReceived";
                default: return "Unknown";
            }
        }

        Result<did::DidDoc, ProtocolFailure> ParseDidDoc(const std::string& text) {
            auto parsed = Result<json, ProtocolFailure>::Try(
                [&text]() { return json::parse(text); },
                [](const std::exception& ex) {
                    return ProtocolFailure::Decode(std::string("Snapshot DID document: ") + ex.what());
                });
            if (parsed.IsErr()) {
                return Result<did::DidDoc, ProtocolFailure>::Err(parsed.UnwrapErr());
            }
            return did::DidDoc::FromJson(parsed.Unwrap());
        }
    }

    std::string_view StateName(const ConnectionState& state) {
        switch (state.index()) {
            case 0: return "Initial";
            case 1: return "Invited";
            case 2: return "Requested";
            case 3: return "Responded";
            case 4: return "Completed";
            case 5: return "Failed";
            default: return "Unknown";
        }
    }

    ConnectionStateMachine::ConnectionStateMachine(const ConnectionRole role, std::string source_id,
                                                   PairwiseInfo pairwise, ConnectionState state)
        : role_(role)
          , source_id_(std::move(source_id))
          , pairwise_(std::move(pairwise))
          , state_(std::move(state)) {
    }

    ConnectionStateMachine ConnectionStateMachine::CreateInviter(std::string source_id, PairwiseInfo pairwise) {
        return {ConnectionRole::Inviter, std::move(source_id), std::move(pairwise), states::Initial{}};
    }

    ConnectionStateMachine ConnectionStateMachine::CreateInvitee(std::string source_id, PairwiseInfo pairwise) {
        return {ConnectionRole::Invitee, std::move(source_id), std::move(pairwise), states::Initial{}};
    }

    ConnectionStateMachine ConnectionStateMachine::WithState(ConnectionState state) const {
        ConnectionStateMachine next(role_, source_id_, pairwise_, std::move(state));
        ARIES_TRACE_TRANSITION(debug::Component::Connection, source_id_, State(), next.State());
        return next;
    }

    ProtocolFailure ConnectionStateMachine::Violation(std::string_view event) const {
        return InvalidTransition(kMachineName, StateName(state_), event);
    }

    ConnectionStateCode ConnectionStateMachine::StateCode() const noexcept {
        return static_cast<ConnectionStateCode>(state_.index() + 1);
    }

    bool ConnectionStateMachine::HasTransitions() const noexcept {
        return !std::holds_alternative<states::Completed>(state_) &&
               !std::holds_alternative<states::Failed>(state_);
    }

    Result<ConnectionStateMachine, ProtocolFailure> ConnectionStateMachine::Step(
        const ConnectionEvent& event,
        const SendMessageFn* send) const {
        if (!HasTransitions()) {
            return ConnectionResult::Err(Violation(EventName(event)));
        }
        if (std::holds_alternative<events::Connect>(event)) {
            return OnConnect(send);
        }
        if (const auto* received = std::get_if<events::InvitationReceived>(&event)) {
            return OnInvitationReceived(*received);
        }
        if (const auto* received = std::get_if<events::RequestReceived>(&event)) {
            return OnRequestReceived(*received);
        }
        if (const auto* respond = std::get_if<events::SendResponse>(&event)) {
            return OnSendResponse(*respond, send);
        }
        if (const auto* received = std::get_if<events::ResponseReceived>(&event)) {
            return OnResponseReceived(*received, send);
        }
        if (std::holds_alternative<events::SendAck>(event)) {
            return OnSendAck(send);
        }
        if (const auto* received = std::get_if<events::AckReceived>(&event)) {
            return OnAckReceived(*received);
        }
        return OnProblemReport(std::get<events::ProblemReportReceived>(event));
    }

    Result<ConnectionStateMachine, ProtocolFailure> ConnectionStateMachine::OnConnect(
        const SendMessageFn* send) const {
        if (role_ == ConnectionRole::Inviter) {
            if (!std::holds_alternative<states::Initial>(state_)) {
                return ConnectionResult::Err(Violation("Connect"));
            }
            ConnectionInvitation invitation;
            invitation.id = messages::NewMessageId();
            invitation.label = pairwise_.label;
            invitation.recipient_keys = {pairwise_.pw_verkey};
            invitation.routing_keys = pairwise_.routing_keys;
            invitation.service_endpoint = pairwise_.endpoint;
            return ConnectionResult::Ok(WithState(states::Invited{std::move(invitation)}));
        }

        const auto* invited = std::get_if<states::Invited>(&state_);
        if (invited == nullptr) {
            return ConnectionResult::Err(Violation("Connect"));
        }
        ConnectionRequest request;
        request.id = messages::NewMessageId();
        request.label = pairwise_.label;
        request.connection.did = pairwise_.pw_did;
        request.connection.did_doc = BuildMyDidDoc();
        auto sent = SendThrough(send, request);
        if (sent.IsErr()) {
            return ConnectionResult::Err(sent.UnwrapErr());
        }
        return ConnectionResult::Ok(WithState(states::Requested{
            invited->invitation,
            std::move(request),
            std::string(),
            did::DidDoc::FromInvitation(invited->invitation)
        }));
    }

    Result<ConnectionStateMachine, ProtocolFailure> ConnectionStateMachine::OnInvitationReceived(
        const events::InvitationReceived& event) const {
        if (role_ != ConnectionRole::Invitee || !std::holds_alternative<states::Initial>(state_)) {
            return ConnectionResult::Err(Violation("InvitationReceived"));
        }
        if (event.invitation.recipient_keys.empty() || event.invitation.service_endpoint.empty()) {
            return ConnectionResult::Err(ProtocolFailure::MalformedMessage(
                "Invitation must carry a recipient key and a service endpoint"));
        }
        return ConnectionResult::Ok(WithState(states::Invited{event.invitation}));
    }

    Result<ConnectionStateMachine, ProtocolFailure> ConnectionStateMachine::OnRequestReceived(
        const events::RequestReceived& event) const {
        const auto* invited = std::get_if<states::Invited>(&state_);
        if (role_ != ConnectionRole::Inviter || invited == nullptr) {
            return ConnectionResult::Err(Violation("RequestReceived"));
        }
        const auto valid = event.request.connection.did_doc.Validate();
        if (valid.IsErr()) {
            // The requester's document is unusable, so there is nowhere to report to
            return ConnectionResult::Ok(WithState(states::Failed{
                MakeProblemReport(event.request.id, kRequestNotAccepted, valid.UnwrapErr().message)
            }));
        }
        return ConnectionResult::Ok(WithState(states::Requested{
            invited->invitation,
            event.request,
            event.request.connection.did,
            event.request.connection.did_doc
        }));
    }

    Result<ConnectionStateMachine, ProtocolFailure> ConnectionStateMachine::OnSendResponse(
        const events::SendResponse& event,
        const SendMessageFn* send) const {
        const auto* requested = std::get_if<states::Requested>(&state_);
        if (role_ != ConnectionRole::Inviter || requested == nullptr) {
            return ConnectionResult::Err(Violation("SendResponse"));
        }
        if (event.keys == nullptr) {
            return ConnectionResult::Err(
                ProtocolFailure::InvalidInput("SendResponse requires a key provider"));
        }

        messages::ConnectionData data;
        data.did = pairwise_.pw_did;
        data.did_doc = BuildMyDidDoc();
        auto signature = ConnectionSignature::Sign(
            *event.keys, requested->invitation.recipient_keys.front(), data, event.timestamp);
        if (signature.IsErr()) {
            return ConnectionResult::Err(signature.UnwrapErr());
        }

        ConnectionResponse response;
        response.id = messages::NewMessageId();
        response.thread = Thread::ReplyTo(requested->request.id);
        response.connection_sig = std::move(signature).Unwrap();
        auto sent = SendThrough(send, response);
        if (sent.IsErr()) {
            return ConnectionResult::Err(sent.UnwrapErr());
        }
        return ConnectionResult::Ok(WithState(states::Responded{
            requested->invitation,
            requested->request,
            std::move(response),
            requested->their_did,
            requested->their_did_doc
        }));
    }

    Result<ConnectionStateMachine, ProtocolFailure> ConnectionStateMachine::OnResponseReceived(
        const events::ResponseReceived& event,
        const SendMessageFn* send) const {
        const auto* requested = std::get_if<states::Requested>(&state_);
        if (role_ != ConnectionRole::Invitee || requested == nullptr) {
            return ConnectionResult::Err(Violation("ResponseReceived"));
        }
        const auto& response = event.response;
        if (!response.thread.has_value() || !response.thread->IsReplyTo(requested->request.id)) {
            return ConnectionResult::Err(ProtocolFailure::ProtocolViolation(
                "Connection response is not threaded to the request"));
        }

        std::string reason;
        auto verified = ConnectionSignature::Verify(response.connection_sig);
        if (verified.IsErr()) {
            reason = verified.UnwrapErr().message;
        } else if (response.connection_sig.signer != requested->invitation.recipient_keys.front()) {
            reason = "Response is not signed with the invitation key";
        } else if (const auto doc_valid = verified.Unwrap().did_doc.Validate(); doc_valid.IsErr()) {
            reason = doc_valid.UnwrapErr().message;
        }

        if (!reason.empty()) {
            auto report = MakeProblemReport(requested->request.id, kResponseNotAccepted, reason);
            if (send != nullptr) {
                auto sent = SendThrough(send, report);
                if (sent.IsErr()) {
                    return ConnectionResult::Err(sent.UnwrapErr());
                }
            }
            return ConnectionResult::Ok(WithState(states::Failed{std::move(report)}));
        }

        auto data = std::move(verified).Unwrap();
        return ConnectionResult::Ok(WithState(states::Responded{
            requested->invitation,
            requested->request,
            response,
            std::move(data.did),
            std::move(data.did_doc)
        }));
    }

    Result<ConnectionStateMachine, ProtocolFailure> ConnectionStateMachine::OnSendAck(
        const SendMessageFn* send) const {
        const auto* responded = std::get_if<states::Responded>(&state_);
        if (role_ != ConnectionRole::Invitee || responded == nullptr) {
            return ConnectionResult::Err(Violation("SendAck"));
        }
        messages::Ack ack;
        ack.id = messages::NewMessageId();
        ack.thread = Thread::ReplyTo(responded->request.id);
        auto sent = SendThrough(send, ack);
        if (sent.IsErr()) {
            return ConnectionResult::Err(sent.UnwrapErr());
        }
        return ConnectionResult::Ok(WithState(states::Completed{
            responded->invitation,
            responded->request,
            responded->their_did,
            responded->their_did_doc
        }));
    }

    Result<ConnectionStateMachine, ProtocolFailure> ConnectionStateMachine::OnAckReceived(
        const events::AckReceived& event) const {
        const auto* responded = std::get_if<states::Responded>(&state_);
        if (role_ != ConnectionRole::Inviter || responded == nullptr) {
            return ConnectionResult::Err(Violation("AckReceived"));
        }
        if (event.thread_id != responded->request.id) {
            return ConnectionResult::Err(ProtocolFailure::ProtocolViolation(
                "Acknowledgement is not threaded to the connection request"));
        }
        return ConnectionResult::Ok(WithState(states::Completed{
            responded->invitation,
            responded->request,
            responded->their_did,
            responded->their_did_doc
        }));
    }

    Result<ConnectionStateMachine, ProtocolFailure> ConnectionStateMachine::OnProblemReport(
        const events::ProblemReportReceived& event) const {
        if (std::holds_alternative<states::Initial>(state_)) {
            return ConnectionResult::Err(Violation("ProblemReportReceived"));
        }
        return ConnectionResult::Ok(WithState(states::Failed{event.problem_report}));
    }

    std::optional<SelectedMessage> ConnectionStateMachine::FindMessageToHandle(const Inbox& inbox) const {
        const auto thread_id = GetThreadId();
        const auto code = StateCode();
        const bool inviter = role_ == ConnectionRole::Inviter;

        auto selected = Dispatcher::SelectFirst(inbox, [&](const A2AMessage& message) {
            if (std::holds_alternative<ConnectionProblemReport>(message)) {
                return thread_id.has_value() && messages::IsInThread(message, *thread_id);
            }
            switch (code) {
                case ConnectionStateCode::Invited:
                    return inviter && std::holds_alternative<ConnectionRequest>(message);
                case ConnectionStateCode::Requested:
                    return !inviter && std::holds_alternative<ConnectionResponse>(message) &&
                           messages::IsInThread(message, *thread_id);
                case ConnectionStateCode::Responded:
                    return inviter &&
                           (std::holds_alternative<messages::Ack>(message) ||
                            std::holds_alternative<messages::Ping>(message)) &&
                           messages::IsInThread(message, *thread_id);
                default:
                    return false;
            }
        });
        if (selected.has_value()) {
            debug::TraceMessageSelected(debug::Component::Connection, selected->uid,
                                        messages::MessageKindName(messages::KindOf(selected->message)));
        }
        return selected;
    }

    std::optional<ConnectionEvent> ConnectionStateMachine::EventFromMessage(const A2AMessage& message) {
        if (const auto* invitation = std::get_if<ConnectionInvitation>(&message)) {
            return events::InvitationReceived{*invitation};
        }
        if (const auto* request = std::get_if<ConnectionRequest>(&message)) {
            return events::RequestReceived{*request};
        }
        if (const auto* response = std::get_if<ConnectionResponse>(&message)) {
            return events::ResponseReceived{*response};
        }
        if (std::holds_alternative<messages::Ack>(message) || std::holds_alternative<messages::Ping>(message)) {
            const auto thread = messages::ThreadOf(message);
            return events::AckReceived{thread.has_value() ? thread->thid.value_or("") : std::string()};
        }
        if (const auto* report = std::get_if<ConnectionProblemReport>(&message)) {
            return events::ProblemReportReceived{*report};
        }
        return std::nullopt;
    }

    std::optional<ConnectionInvitation> ConnectionStateMachine::GetInvitation() const {
        return std::visit([](const auto& state) -> std::optional<ConnectionInvitation> {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, states::Initial> || std::is_same_v<S, states::Failed>) {
                return std::nullopt;
            } else {
                return state.invitation;
            }
        }, state_);
    }

    std::optional<did::DidDoc> ConnectionStateMachine::GetRemoteDidDoc() const {
        return std::visit([this](const auto& state) -> std::optional<did::DidDoc> {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, states::Invited>) {
                if (role_ == ConnectionRole::Invitee) {
                    return did::DidDoc::FromInvitation(state.invitation);
                }
                return std::nullopt;
            } else if constexpr (std::is_same_v<S, states::Requested> ||
                                 std::is_same_v<S, states::Responded> ||
                                 std::is_same_v<S, states::Completed>) {
                return state.their_did_doc;
            } else {
                return std::nullopt;
            }
        }, state_);
    }

    std::optional<std::string> ConnectionStateMachine::GetTheirDid() const {
        return std::visit([](const auto& state) -> std::optional<std::string> {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, states::Requested> ||
                          std::is_same_v<S, states::Responded> ||
                          std::is_same_v<S, states::Completed>) {
                if (state.their_did.empty()) {
                    return std::nullopt;
                }
                return state.their_did;
            } else {
                return std::nullopt;
            }
        }, state_);
    }

    std::optional<std::string> ConnectionStateMachine::GetTheirVerkey() const {
        const auto doc = GetRemoteDidDoc();
        if (!doc.has_value()) {
            return std::nullopt;
        }
        const auto keys = doc->ResolveKeys();
        if (keys.recipient_keys.empty()) {
            return std::nullopt;
        }
        return keys.recipient_keys.front();
    }

    std::optional<std::string> ConnectionStateMachine::GetThreadId() const {
        return std::visit([](const auto& state) -> std::optional<std::string> {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, states::Requested> ||
                          std::is_same_v<S, states::Responded> ||
                          std::is_same_v<S, states::Completed>) {
                return state.request.id;
            } else {
                return std::nullopt;
            }
        }, state_);
    }

    did::DidDoc ConnectionStateMachine::BuildMyDidDoc() const {
        did::DidDoc doc(pairwise_.pw_did);
        doc.SetServiceEndpoint(pairwise_.endpoint);
        doc.SetKeys({pairwise_.pw_verkey}, pairwise_.routing_keys);
        return doc;
    }

    proto::protocol::ConnectionState ConnectionStateMachine::ToProtoState() const {
        proto::protocol::ConnectionState proto;
        proto.set_source_id(source_id_);
        proto.set_role(role_ == ConnectionRole::Inviter
                           ? proto::protocol::CONNECTION_ROLE_INVITER
                           : proto::protocol::CONNECTION_ROLE_INVITEE);
        proto.set_pw_did(pairwise_.pw_did);
        proto.set_pw_verkey(pairwise_.pw_verkey);
        proto.set_endpoint(pairwise_.endpoint);
        for (const auto& key : pairwise_.routing_keys) {
            proto.add_routing_keys(key);
        }
        proto.set_label(pairwise_.label);
        proto.set_state(State());

        std::visit([&proto](const auto& state) {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, states::Failed>) {
                proto.set_problem_report_json(snapshot::EncodeMessage(state.problem_report));
            } else if constexpr (!std::is_same_v<S, states::Initial>) {
                proto.set_invitation_json(snapshot::EncodeMessage(state.invitation));
                if constexpr (!std::is_same_v<S, states::Invited>) {
                    proto.set_request_json(snapshot::EncodeMessage(state.request));
                    proto.set_their_did(state.their_did);
                    proto.set_their_did_doc_json(state.their_did_doc.ToJson().dump());
                }
                if constexpr (std::is_same_v<S, states::Responded>) {
                    proto.set_response_json(snapshot::EncodeMessage(state.response));
                }
            }
        }, state_);
        return proto;
    }

    Result<ConnectionStateMachine, ProtocolFailure> ConnectionStateMachine::FromProtoState(
        const proto::protocol::ConnectionState& proto) {
        PairwiseInfo pairwise;
        pairwise.pw_did = proto.pw_did();
        pairwise.pw_verkey = proto.pw_verkey();
        pairwise.endpoint = proto.endpoint();
        pairwise.routing_keys.assign(proto.routing_keys().begin(), proto.routing_keys().end());
        pairwise.label = proto.label();
        const ConnectionRole role = proto.role() == proto::protocol::CONNECTION_ROLE_INVITER
                                        ? ConnectionRole::Inviter
                                        : ConnectionRole::Invitee;
        auto build = [&](ConnectionState state) {
            return ConnectionResult::Ok(ConnectionStateMachine(role, proto.source_id(), pairwise, std::move(state)));
        };

        const auto code = static_cast<ConnectionStateCode>(proto.state());
        if (code == ConnectionStateCode::Initial) {
            return build(states::Initial{});
        }
        if (code == ConnectionStateCode::Failed) {
            auto report = snapshot::DecodeMessage<ConnectionProblemReport>(
                proto.problem_report_json(), "problem_report_json");
            if (report.IsErr()) {
                return ConnectionResult::Err(report.UnwrapErr());
            }
            return build(states::Failed{std::move(report).Unwrap()});
        }
        if (code < ConnectionStateCode::Initial || code > ConnectionStateCode::Failed) {
            return ConnectionResult::Err(ProtocolFailure::Decode(
                "Unknown connection state code " + std::to_string(proto.state())));
        }

        auto invitation = snapshot::DecodeMessage<ConnectionInvitation>(proto.invitation_json(), "invitation_json");
        if (invitation.IsErr()) {
            return ConnectionResult::Err(invitation.UnwrapErr());
        }
        if (code == ConnectionStateCode::Invited) {
            return build(states::Invited{std::move(invitation).Unwrap()});
        }

        auto request = snapshot::DecodeMessage<ConnectionRequest>(proto.request_json(), "request_json");
        if (request.IsErr()) {
            return ConnectionResult::Err(request.UnwrapErr());
        }
        auto their_doc = ParseDidDoc(proto.their_did_doc_json());
        if (their_doc.IsErr()) {
            return ConnectionResult::Err(their_doc.UnwrapErr());
        }
        if (code == ConnectionStateCode::Requested) {
            return build(states::Requested{std::move(invitation).Unwrap(), std::move(request).Unwrap(),
                                           proto.their_did(), std::move(their_doc).Unwrap()});
        }
        if (code == ConnectionStateCode::Completed) {
            return build(states::Completed{std::move(invitation).Unwrap(), std::move(request).Unwrap(),
                                           proto.their_did(), std::move(their_doc).Unwrap()});
        }
        auto response = snapshot::DecodeMessage<ConnectionResponse>(proto.response_json(), "response_json");
        if (response.IsErr()) {
            return ConnectionResult::Err(response.UnwrapErr());
        }
        return build(states::Responded{std::move(invitation).Unwrap(), std::move(request).Unwrap(),
                                       std::move(response).Unwrap(), proto.their_did(),
                                       std::move(their_doc).Unwrap()});
    }
}
