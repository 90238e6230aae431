#include "aries/protocol/presentation/prover.hpp"
#include "aries/protocol/exchange_driver.hpp"

namespace aries::protocol::presentation {
    using ProverHandleResult = Result<Prover, ProtocolFailure>;
    using UnitResult = Result<Unit, ProtocolFailure>;
    using TextResult = Result<std::string, ProtocolFailure>;

    Result<Prover, ProtocolFailure> Prover::Create(const AgentContext& context,
                                                   std::string source_id,
                                                   const PresentationRequest& request) {
        if (!context.anoncreds) {
            return ProverHandleResult::Err(
                ProtocolFailure::InvalidInput("Presenting proofs requires an anoncreds service"));
        }
        auto sm = ProverStateMachine::Create(std::move(source_id)).Step(prover_events::RequestReceived{request});
        if (sm.IsErr()) {
            return ProverHandleResult::Err(sm.UnwrapErr());
        }
        return ProverHandleResult::Ok(Prover(context, std::move(sm).Unwrap()));
    }

    Result<std::vector<std::pair<std::string, PresentationRequest>>, ProtocolFailure>
    Prover::GetPresentationRequests(const connection::Connection& connection) {
        using RequestsResult = Result<std::vector<std::pair<std::string, PresentationRequest>>, ProtocolFailure>;
        auto ready = RequireCompleted(connection);
        if (ready.IsErr()) {
            return RequestsResult::Err(ready.UnwrapErr());
        }
        auto inbox = connection.GetMessages();
        if (inbox.IsErr()) {
            return RequestsResult::Err(inbox.UnwrapErr());
        }
        return RequestsResult::Ok(Dispatcher::CollectMessages<PresentationRequest>(inbox.Unwrap()));
    }

    Result<std::string, ProtocolFailure> Prover::GetPresentationRequest() const {
        const auto request = sm_.GetPresentationRequest();
        if (!request.has_value()) {
            return TextResult::Err(ProtocolFailure::InvalidState("Prover holds no presentation request"));
        }
        return FirstAttachmentContent(request->request_presentations_attach, "Presentation request");
    }

    Result<std::string, ProtocolFailure> Prover::RetrieveCredentials() const {
        auto request_json = GetPresentationRequest();
        if (request_json.IsErr()) {
            return request_json;
        }
        if (!context_.anoncreds) {
            return TextResult::Err(
                ProtocolFailure::InvalidInput("Retrieving credentials requires an anoncreds service"));
        }
        return context_.anoncreds->ProverRetrieveCredentials(request_json.Unwrap());
    }

    Result<Unit, ProtocolFailure> Prover::GeneratePresentation(std::string selected_credentials_json,
                                                               std::string self_attested_attrs_json) {
        return Apply(prover_events::GeneratePresentation{
                         context_.anoncreds.get(), std::move(selected_credentials_json),
                         std::move(self_attested_attrs_json)},
                     nullptr);
    }

    Result<Unit, ProtocolFailure> Prover::SendPresentation(const connection::Connection& connection) {
        auto ready = RequireCompleted(connection);
        if (ready.IsErr()) {
            return ready;
        }
        const SendMessageFn send = connection.SendMessageClosure();
        return Apply(prover_events::SendPresentation{}, &send);
    }

    Result<Unit, ProtocolFailure> Prover::DeclinePresentationRequest(const connection::Connection& connection,
                                                                     std::string reason) {
        auto ready = RequireCompleted(connection);
        if (ready.IsErr()) {
            return ready;
        }
        const SendMessageFn send = connection.SendMessageClosure();
        return Apply(prover_events::DeclineRequest{std::move(reason)}, &send);
    }

    Result<Unit, ProtocolFailure> Prover::DeclinePresentationRequest(const connection::Connection& connection,
                                                                     PresentationPreview proposal,
                                                                     std::string comment) {
        auto ready = RequireCompleted(connection);
        if (ready.IsErr()) {
            return ready;
        }
        const SendMessageFn send = connection.SendMessageClosure();
        return Apply(prover_events::ProposePresentation{std::move(proposal), std::move(comment)}, &send);
    }

    Result<Unit, ProtocolFailure> Prover::UpdateState(const connection::Connection& connection) {
        return PollExchange(*this, connection);
    }

    Result<Unit, ProtocolFailure> Prover::HandleMessage(const A2AMessage& message,
                                                        const connection::Connection& connection) {
        auto event = ProverStateMachine::EventFromMessage(message);
        if (!event.has_value()) {
            return UnitResult::Err(ProtocolFailure::ProtocolViolation(
                "Prover cannot handle " + std::string(messages::MessageKindName(messages::KindOf(message)))));
        }
        const SendMessageFn send = connection.SendMessageClosure();
        return Apply(*event, &send);
    }

    Result<Unit, ProtocolFailure> Prover::Apply(const ProverEvent& event, const SendMessageFn* send) {
        auto next = sm_.Step(event, send);
        if (next.IsErr()) {
            return UnitResult::Err(next.UnwrapErr());
        }
        sm_ = std::move(next).Unwrap();
        return UnitResult::Ok(unit);
    }

    Result<std::string, ProtocolFailure> Prover::GetPresentation() const {
        auto presentation = sm_.GetPresentationJson();
        if (!presentation.has_value()) {
            return TextResult::Err(ProtocolFailure::InvalidState("Presentation has not been generated"));
        }
        return TextResult::Ok(std::move(*presentation));
    }

    Result<std::string, ProtocolFailure> Prover::Serialize() const {
        return SerializeSnapshot(sm_.ToProtoState(), "prover");
    }

    Result<Prover, ProtocolFailure> Prover::Deserialize(const AgentContext& context, const std::string& data) {
        auto proto = ParseSnapshot<proto::protocol::ProverState>(data, "prover");
        if (proto.IsErr()) {
            return ProverHandleResult::Err(proto.UnwrapErr());
        }
        auto sm = ProverStateMachine::FromProtoState(proto.Unwrap());
        if (sm.IsErr()) {
            return ProverHandleResult::Err(sm.UnwrapErr());
        }
        return ProverHandleResult::Ok(Prover(context, std::move(sm).Unwrap()));
    }
}
