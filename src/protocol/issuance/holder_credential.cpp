#include "aries/protocol/issuance/holder_credential.hpp"
#include "aries/protocol/exchange_driver.hpp"

namespace aries::protocol::issuance {
    using HolderCredentialResult = Result<HolderCredential, ProtocolFailure>;
    using UnitResult = Result<Unit, ProtocolFailure>;

    namespace {
        const holder_states::Completed* CompletedState(const HolderStateMachine& sm) {
            return std::get_if<holder_states::Completed>(&sm.GetState());
        }
    }

    Result<HolderCredential, ProtocolFailure> HolderCredential::Create(const AgentContext& context,
                                                                       std::string source_id,
                                                                       const CredentialOffer& offer) {
        if (!context.anoncreds) {
            return HolderCredentialResult::Err(
                ProtocolFailure::InvalidInput("Holding credentials requires an anoncreds service"));
        }
        auto sm = HolderStateMachine::Create(std::move(source_id)).Step(holder_events::OfferReceived{offer});
        if (sm.IsErr()) {
            return HolderCredentialResult::Err(sm.UnwrapErr());
        }
        return HolderCredentialResult::Ok(HolderCredential(context, std::move(sm).Unwrap()));
    }

    Result<std::vector<std::pair<std::string, CredentialOffer>>, ProtocolFailure>
    HolderCredential::GetCredentialOffers(const connection::Connection& connection) {
        using OffersResult = Result<std::vector<std::pair<std::string, CredentialOffer>>, ProtocolFailure>;
        auto ready = RequireCompleted(connection);
        if (ready.IsErr()) {
            return OffersResult::Err(ready.UnwrapErr());
        }
        auto inbox = connection.GetMessages();
        if (inbox.IsErr()) {
            return OffersResult::Err(inbox.UnwrapErr());
        }
        return OffersResult::Ok(Dispatcher::CollectMessages<CredentialOffer>(inbox.Unwrap()));
    }

    Result<Unit, ProtocolFailure> HolderCredential::SendRequest(const connection::Connection& connection) {
        auto ready = RequireCompleted(connection);
        if (ready.IsErr()) {
            return ready;
        }
        const SendMessageFn send = connection.SendMessageClosure();
        auto next = sm_.Step(holder_events::SendRequest{context_.anoncreds.get(), connection.GetPwDid()}, &send);
        if (next.IsErr()) {
            return UnitResult::Err(next.UnwrapErr());
        }
        sm_ = std::move(next).Unwrap();
        return UnitResult::Ok(unit);
    }

    Result<Unit, ProtocolFailure> HolderCredential::DeclineOffer(const connection::Connection& connection,
                                                                 std::string comment) {
        auto ready = RequireCompleted(connection);
        if (ready.IsErr()) {
            return ready;
        }
        const SendMessageFn send = connection.SendMessageClosure();
        auto next = sm_.Step(holder_events::DeclineOffer{std::move(comment)}, &send);
        if (next.IsErr()) {
            return UnitResult::Err(next.UnwrapErr());
        }
        sm_ = std::move(next).Unwrap();
        return UnitResult::Ok(unit);
    }

    Result<Unit, ProtocolFailure> HolderCredential::UpdateState(const connection::Connection& connection) {
        return PollExchange(*this, connection);
    }

    Result<Unit, ProtocolFailure> HolderCredential::HandleMessage(const A2AMessage& message,
                                                                  const connection::Connection& connection) {
        auto event = HolderStateMachine::EventFromMessage(message);
        if (!event.has_value()) {
            return UnitResult::Err(ProtocolFailure::ProtocolViolation(
                "Holder cannot handle " + std::string(messages::MessageKindName(messages::KindOf(message)))));
        }
        const SendMessageFn send = connection.SendMessageClosure();
        auto stepped = sm_.Step(*event, &send);
        if (stepped.IsErr()) {
            return UnitResult::Err(stepped.UnwrapErr());
        }
        auto next = std::move(stepped).Unwrap();
        if (next.StateCode() != HolderStateCode::CredentialReceived) {
            sm_ = std::move(next);
            return UnitResult::Ok(unit);
        }
        auto stored = next.Step(holder_events::StoreCredential{context_.anoncreds.get()});
        if (stored.IsErr()) {
            return UnitResult::Err(stored.UnwrapErr());
        }
        // The wallet holds the credential from here on; a failed ack must not replay the store.
        sm_ = std::move(stored).Unwrap();
        const auto* completed = CompletedState(sm_);
        if (completed != nullptr && completed->credential.please_ack) {
            auto acked = sm_.Step(holder_events::SendAck{}, &send);
            if (acked.IsErr()) {
                return UnitResult::Err(acked.UnwrapErr());
            }
        }
        return UnitResult::Ok(unit);
    }

    Result<std::string, ProtocolFailure> HolderCredential::GetCredential() const {
        const auto* completed = CompletedState(sm_);
        if (completed == nullptr) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Credential has not been received and stored"));
        }
        return FirstAttachmentContent(completed->credential.credentials_attach, "Credential");
    }

    Result<std::string, ProtocolFailure> HolderCredential::GetCredentialId() const {
        const auto* completed = CompletedState(sm_);
        if (completed == nullptr) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::InvalidState("Credential has not been received and stored"));
        }
        return Result<std::string, ProtocolFailure>::Ok(completed->credential_id);
    }

    Result<std::string, ProtocolFailure> HolderCredential::Serialize() const {
        return SerializeSnapshot(sm_.ToProtoState(), "holder");
    }

    Result<HolderCredential, ProtocolFailure> HolderCredential::Deserialize(const AgentContext& context,
                                                                            const std::string& data) {
        auto proto = ParseSnapshot<proto::protocol::HolderState>(data, "holder");
        if (proto.IsErr()) {
            return HolderCredentialResult::Err(proto.UnwrapErr());
        }
        auto sm = HolderStateMachine::FromProtoState(proto.Unwrap());
        if (sm.IsErr()) {
            return HolderCredentialResult::Err(sm.UnwrapErr());
        }
        return HolderCredentialResult::Ok(HolderCredential(context, std::move(sm).Unwrap()));
    }
}
