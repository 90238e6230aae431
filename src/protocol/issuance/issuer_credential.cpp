#include "aries/protocol/issuance/issuer_credential.hpp"
#include "aries/protocol/exchange_driver.hpp"

namespace aries::protocol::issuance {
    using IssuerCredentialResult = Result<IssuerCredential, ProtocolFailure>;
    using UnitResult = Result<Unit, ProtocolFailure>;

    Result<IssuerCredential, ProtocolFailure> IssuerCredential::Create(const AgentContext& context,
                                                                       std::string source_id,
                                                                       std::string cred_def_id,
                                                                       std::string_view credential_values_json,
                                                                       std::string comment) {
        if (!context.anoncreds) {
            return IssuerCredentialResult::Err(
                ProtocolFailure::InvalidInput("Issuing credentials requires an anoncreds service"));
        }
        if (cred_def_id.empty()) {
            return IssuerCredentialResult::Err(ProtocolFailure::InvalidInput("Credential definition id is empty"));
        }
        auto values = CredentialValues::Parse(credential_values_json);
        if (values.IsErr()) {
            return IssuerCredentialResult::Err(values.UnwrapErr());
        }
        return IssuerCredentialResult::Ok(IssuerCredential(
            context,
            IssuerStateMachine::Create(std::move(source_id), std::move(cred_def_id),
                                       std::move(values).Unwrap(), std::move(comment))));
    }

    Result<Unit, ProtocolFailure> IssuerCredential::Apply(const IssuerEvent& event,
                                                          const connection::Connection& connection) {
        const SendMessageFn send = connection.SendMessageClosure();
        auto next = sm_.Step(event, &send);
        if (next.IsErr()) {
            return UnitResult::Err(next.UnwrapErr());
        }
        sm_ = std::move(next).Unwrap();
        return UnitResult::Ok(unit);
    }

    Result<Unit, ProtocolFailure> IssuerCredential::SendOffer(const connection::Connection& connection) {
        auto ready = RequireCompleted(connection);
        if (ready.IsErr()) {
            return ready;
        }
        return Apply(issuer_events::SendOffer{context_.anoncreds.get()}, connection);
    }

    Result<Unit, ProtocolFailure> IssuerCredential::SendCredential(const connection::Connection& connection) {
        auto ready = RequireCompleted(connection);
        if (ready.IsErr()) {
            return ready;
        }
        return Apply(issuer_events::SendCredential{context_.anoncreds.get()}, connection);
    }

    Result<Unit, ProtocolFailure> IssuerCredential::UpdateState(const connection::Connection& connection) {
        return PollExchange(*this, connection);
    }

    Result<Unit, ProtocolFailure> IssuerCredential::HandleMessage(const A2AMessage& message,
                                                                  const connection::Connection& connection) {
        auto event = IssuerStateMachine::EventFromMessage(message);
        if (!event.has_value()) {
            return UnitResult::Err(ProtocolFailure::ProtocolViolation(
                "Issuer cannot handle " + std::string(messages::MessageKindName(messages::KindOf(message)))));
        }
        return Apply(*event, connection);
    }

    Result<std::string, ProtocolFailure> IssuerCredential::Serialize() const {
        return SerializeSnapshot(sm_.ToProtoState(), "issuer");
    }

    Result<IssuerCredential, ProtocolFailure> IssuerCredential::Deserialize(const AgentContext& context,
                                                                            const std::string& data) {
        auto proto = ParseSnapshot<proto::protocol::IssuerState>(data, "issuer");
        if (proto.IsErr()) {
            return IssuerCredentialResult::Err(proto.UnwrapErr());
        }
        auto sm = IssuerStateMachine::FromProtoState(proto.Unwrap());
        if (sm.IsErr()) {
            return IssuerCredentialResult::Err(sm.UnwrapErr());
        }
        return IssuerCredentialResult::Ok(IssuerCredential(context, std::move(sm).Unwrap()));
    }
}
