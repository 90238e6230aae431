#include "aries/protocol/presentation/verifier.hpp"
#include "aries/protocol/exchange_driver.hpp"

namespace aries::protocol::presentation {
    using VerifierHandleResult = Result<Verifier, ProtocolFailure>;
    using UnitResult = Result<Unit, ProtocolFailure>;

    Result<Verifier, ProtocolFailure> Verifier::Create(const AgentContext& context,
                                                       std::string source_id,
                                                       std::string_view requested_attributes_json,
                                                       std::string_view requested_predicates_json,
                                                       std::string_view revocation_details_json,
                                                       std::string name) {
        if (!context.anoncreds) {
            return VerifierHandleResult::Err(
                ProtocolFailure::InvalidInput("Verifying presentations requires an anoncreds service"));
        }
        auto request = PresentationRequestData::Create(std::move(name), requested_attributes_json,
                                                       requested_predicates_json, revocation_details_json);
        if (request.IsErr()) {
            return VerifierHandleResult::Err(request.UnwrapErr());
        }
        return VerifierHandleResult::Ok(Verifier(
            context, VerifierStateMachine::Create(std::move(source_id), std::move(request).Unwrap())));
    }

    Result<Unit, ProtocolFailure> Verifier::SendPresentationRequest(const connection::Connection& connection) {
        auto ready = RequireCompleted(connection);
        if (ready.IsErr()) {
            return ready;
        }
        const SendMessageFn send = connection.SendMessageClosure();
        auto next = sm_.Step(verifier_events::SendRequest{}, &send);
        if (next.IsErr()) {
            return UnitResult::Err(next.UnwrapErr());
        }
        sm_ = std::move(next).Unwrap();
        return UnitResult::Ok(unit);
    }

    Result<Unit, ProtocolFailure> Verifier::UpdateState(const connection::Connection& connection) {
        return PollExchange(*this, connection);
    }

    Result<Unit, ProtocolFailure> Verifier::HandleMessage(const A2AMessage& message,
                                                          const connection::Connection& connection) {
        auto event = VerifierStateMachine::EventFromMessage(message);
        if (!event.has_value()) {
            return UnitResult::Err(ProtocolFailure::ProtocolViolation(
                "Verifier cannot handle " + std::string(messages::MessageKindName(messages::KindOf(message)))));
        }
        const SendMessageFn send = connection.SendMessageClosure();
        auto stepped = sm_.Step(*event, &send);
        if (stepped.IsErr()) {
            return UnitResult::Err(stepped.UnwrapErr());
        }
        auto next = std::move(stepped).Unwrap();
        if (next.StateCode() == VerifierStateCode::PresentationReceived) {
            auto verified = next.Step(verifier_events::VerifyPresentation{
                                          context_.anoncreds.get(), context_.config.AcksPresentations()},
                                      &send);
            if (verified.IsErr()) {
                return UnitResult::Err(verified.UnwrapErr());
            }
            next = std::move(verified).Unwrap();
        }
        sm_ = std::move(next);
        return UnitResult::Ok(unit);
    }

    Result<std::string, ProtocolFailure> Verifier::GetPresentation() const {
        const auto presentation = sm_.GetPresentation();
        if (!presentation.has_value()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("No presentation has been received"));
        }
        return FirstAttachmentContent(presentation->presentations_attach, "Presentation");
    }

    Result<PresentationRequest, ProtocolFailure> Verifier::GetPresentationRequestMessage() const {
        const auto thread_id = sm_.GetThreadId();
        if (!thread_id.has_value()) {
            return Result<PresentationRequest, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Presentation request has not been sent"));
        }
        return Result<PresentationRequest, ProtocolFailure>::Ok(sm_.BuildRequestMessage(*thread_id));
    }

    Result<std::string, ProtocolFailure> Verifier::Serialize() const {
        return SerializeSnapshot(sm_.ToProtoState(), "verifier");
    }

    Result<Verifier, ProtocolFailure> Verifier::Deserialize(const AgentContext& context, const std::string& data) {
        auto proto = ParseSnapshot<proto::protocol::VerifierState>(data, "verifier");
        if (proto.IsErr()) {
            return VerifierHandleResult::Err(proto.UnwrapErr());
        }
        auto sm = VerifierStateMachine::FromProtoState(proto.Unwrap());
        if (sm.IsErr()) {
            return VerifierHandleResult::Err(sm.UnwrapErr());
        }
        return VerifierHandleResult::Ok(Verifier(context, std::move(sm).Unwrap()));
    }
}
