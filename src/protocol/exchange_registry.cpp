#include "aries/protocol/exchange_registry.hpp"
#include "aries/protocol/exchange_driver.hpp"

namespace aries::protocol {
    using HandleResult = Result<uint32_t, ProtocolFailure>;
    using UnitResult = Result<Unit, ProtocolFailure>;
    using TextResult = Result<std::string, ProtocolFailure>;

    namespace {
        template<typename Exchange>
        HandleResult StateAfterPoll(Exchange& exchange, const Connection& connection) {
            auto polled = exchange.UpdateState(connection);
            if (polled.IsErr()) {
                return HandleResult::Err(polled.UnwrapErr());
            }
            return HandleResult::Ok(exchange.State());
        }

        /// Pending message of type T with the given relay uid.
        template<typename T>
        Result<T, ProtocolFailure> PendingMessage(const Connection& connection,
                                                  std::string_view uid,
                                                  std::string_view what) {
            auto inbox = connection.GetMessages();
            if (inbox.IsErr()) {
                return Result<T, ProtocolFailure>::Err(inbox.UnwrapErr());
            }
            const auto& messages = inbox.Unwrap();
            const auto it = messages.find(std::string(uid));
            if (it == messages.end()) {
                return Result<T, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                    "No pending message with uid " + std::string(uid)));
            }
            const auto* typed = std::get_if<T>(&it->second);
            if (typed == nullptr) {
                return Result<T, ProtocolFailure>::Err(ProtocolFailure::InvalidInput(
                    "Message " + std::string(uid) + " is not a " + std::string(what)));
            }
            return Result<T, ProtocolFailure>::Ok(*typed);
        }
    }

    ExchangeRegistry::ExchangeRegistry(AgentContext context)
        : context_(std::move(context))
          , connections_("connection")
          , issuers_("issuer credential")
          , holders_("holder credential")
          , verifiers_("verifier")
          , provers_("prover") {
    }

    Result<std::unique_ptr<ExchangeRegistry>, ProtocolFailure> ExchangeRegistry::Create(AgentContext context) {
        using RegistryResult = Result<std::unique_ptr<ExchangeRegistry>, ProtocolFailure>;
        auto valid = context.Validate();
        if (valid.IsErr()) {
            return RegistryResult::Err(valid.UnwrapErr());
        }
        return RegistryResult::Ok(std::unique_ptr<ExchangeRegistry>(new ExchangeRegistry(std::move(context))));
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::CreateConnection(std::string source_id) {
        return Register(connections_, Connection::CreateInviter(context_, std::move(source_id)));
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::CreateConnectionWithInvite(std::string source_id,
                                                                                  std::string_view invitation_json) {
        auto message = messages::Parse(invitation_json);
        if (message.IsErr()) {
            return HandleResult::Err(message.UnwrapErr());
        }
        const auto* invitation = std::get_if<messages::ConnectionInvitation>(&message.Unwrap());
        if (invitation == nullptr) {
            return HandleResult::Err(ProtocolFailure::InvalidInput("Invite details are not a connection invitation"));
        }
        return Register(connections_, Connection::CreateWithInvite(context_, std::move(source_id), *invitation));
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::Connect(const uint32_t connection_handle) {
        return connections_.WithHandle(connection_handle, [](Connection& connection) {
            return connection.Connect();
        });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::UpdateConnectionState(const uint32_t connection_handle) {
        return connections_.WithHandle(connection_handle, [](Connection& connection) {
            auto polled = connection.UpdateState();
            if (polled.IsErr()) {
                return HandleResult::Err(polled.UnwrapErr());
            }
            return HandleResult::Ok(connection.State());
        });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::GetConnectionState(const uint32_t connection_handle) const {
        return connections_.WithHandle(connection_handle, [](const Connection& connection) {
            return HandleResult::Ok(connection.State());
        });
    }

    Result<std::string, ProtocolFailure> ExchangeRegistry::GetInviteDetails(const uint32_t connection_handle) const {
        return connections_.WithHandle(connection_handle, [](const Connection& connection) {
            auto invitation = connection.GetInviteDetails();
            if (invitation.IsErr()) {
                return TextResult::Err(invitation.UnwrapErr());
            }
            return TextResult::Ok(messages::Serialize(invitation.Unwrap(),
                                                      connection.GetConfig().GetMessageTypePrefix()));
        });
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::SendGenericMessage(const uint32_t connection_handle,
                                                                       std::string_view content) const {
        return connections_.WithHandle(connection_handle, [content](const Connection& connection) {
            return connection.SendGenericMessage(content);
        });
    }

    Result<std::string, ProtocolFailure> ExchangeRegistry::SerializeConnection(const uint32_t connection_handle) const {
        return connections_.WithHandle(connection_handle, [](const Connection& connection) {
            return connection.Serialize();
        });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::DeserializeConnection(const std::string& data) {
        return Register(connections_, Connection::Deserialize(context_, data));
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::ReleaseConnection(const uint32_t connection_handle) {
        return connections_.Release(connection_handle);
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::CreateIssuerCredential(std::string source_id,
                                                                              std::string cred_def_id,
                                                                              std::string_view credential_values_json,
                                                                              std::string comment) {
        return Register(issuers_, IssuerCredential::Create(context_, std::move(source_id), std::move(cred_def_id),
                                                           credential_values_json, std::move(comment)));
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::IssuerSendOffer(const uint32_t issuer_handle,
                                                                    const uint32_t connection_handle) {
        return WithExchange(issuers_, issuer_handle, connection_handle,
                            [](IssuerCredential& issuer, const Connection& connection) {
                                return issuer.SendOffer(connection);
                            });
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::IssuerSendCredential(const uint32_t issuer_handle,
                                                                         const uint32_t connection_handle) {
        return WithExchange(issuers_, issuer_handle, connection_handle,
                            [](IssuerCredential& issuer, const Connection& connection) {
                                return issuer.SendCredential(connection);
                            });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::IssuerUpdateState(const uint32_t issuer_handle,
                                                                          const uint32_t connection_handle) {
        return WithExchange(issuers_, issuer_handle, connection_handle,
                            [](IssuerCredential& issuer, const Connection& connection) {
                                return StateAfterPoll(issuer, connection);
                            });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::GetIssuerState(const uint32_t issuer_handle) const {
        return issuers_.WithHandle(issuer_handle, [](const IssuerCredential& issuer) {
            return HandleResult::Ok(issuer.State());
        });
    }

    Result<std::string, ProtocolFailure> ExchangeRegistry::SerializeIssuerCredential(
        const uint32_t issuer_handle) const {
        return issuers_.WithHandle(issuer_handle, [](const IssuerCredential& issuer) {
            return issuer.Serialize();
        });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::DeserializeIssuerCredential(const std::string& data) {
        return Register(issuers_, IssuerCredential::Deserialize(context_, data));
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::ReleaseIssuerCredential(const uint32_t issuer_handle) {
        return issuers_.Release(issuer_handle);
    }

    Result<std::vector<std::pair<std::string, messages::CredentialOffer>>, ProtocolFailure>
    ExchangeRegistry::GetCredentialOffers(const uint32_t connection_handle) const {
        return connections_.WithHandle(connection_handle, [](const Connection& connection) {
            return HolderCredential::GetCredentialOffers(connection);
        });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::CreateHolderCredential(const uint32_t connection_handle,
                                                                              std::string source_id,
                                                                              std::string_view offer_uid) {
        using HolderResult = Result<HolderCredential, ProtocolFailure>;
        auto holder = connections_.WithHandle(connection_handle, [&](const Connection& connection) {
            auto ready = RequireCompleted(connection);
            if (ready.IsErr()) {
                return HolderResult::Err(ready.UnwrapErr());
            }
            auto offer = PendingMessage<messages::CredentialOffer>(connection, offer_uid, "credential offer");
            if (offer.IsErr()) {
                return HolderResult::Err(offer.UnwrapErr());
            }
            auto created = HolderCredential::Create(context_, std::move(source_id), offer.Unwrap());
            if (created.IsErr()) {
                return created;
            }
            auto reviewed = connection.UpdateMessageStatus(offer_uid);
            if (reviewed.IsErr()) {
                return HolderResult::Err(reviewed.UnwrapErr());
            }
            return created;
        });
        return Register(holders_, std::move(holder));
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::HolderSendRequest(const uint32_t holder_handle,
                                                                      const uint32_t connection_handle) {
        return WithExchange(holders_, holder_handle, connection_handle,
                            [](HolderCredential& holder, const Connection& connection) {
                                return holder.SendRequest(connection);
                            });
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::HolderDeclineOffer(const uint32_t holder_handle,
                                                                       const uint32_t connection_handle,
                                                                       std::string comment) {
        return WithExchange(holders_, holder_handle, connection_handle,
                            [&comment](HolderCredential& holder, const Connection& connection) {
                                return holder.DeclineOffer(connection, std::move(comment));
                            });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::HolderUpdateState(const uint32_t holder_handle,
                                                                          const uint32_t connection_handle) {
        return WithExchange(holders_, holder_handle, connection_handle,
                            [](HolderCredential& holder, const Connection& connection) {
                                return StateAfterPoll(holder, connection);
                            });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::GetHolderState(const uint32_t holder_handle) const {
        return holders_.WithHandle(holder_handle, [](const HolderCredential& holder) {
            return HandleResult::Ok(holder.State());
        });
    }

    Result<std::string, ProtocolFailure> ExchangeRegistry::GetCredential(const uint32_t holder_handle) const {
        return holders_.WithHandle(holder_handle, [](const HolderCredential& holder) {
            return holder.GetCredential();
        });
    }

    Result<std::string, ProtocolFailure> ExchangeRegistry::SerializeHolderCredential(
        const uint32_t holder_handle) const {
        return holders_.WithHandle(holder_handle, [](const HolderCredential& holder) {
            return holder.Serialize();
        });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::DeserializeHolderCredential(const std::string& data) {
        return Register(holders_, HolderCredential::Deserialize(context_, data));
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::ReleaseHolderCredential(const uint32_t holder_handle) {
        return holders_.Release(holder_handle);
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::CreateVerifier(std::string source_id,
                                                                      std::string_view requested_attributes_json,
                                                                      std::string_view requested_predicates_json,
                                                                      std::string_view revocation_details_json,
                                                                      std::string name) {
        return Register(verifiers_, Verifier::Create(context_, std::move(source_id), requested_attributes_json,
                                                     requested_predicates_json, revocation_details_json,
                                                     std::move(name)));
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::VerifierSendRequest(const uint32_t verifier_handle,
                                                                        const uint32_t connection_handle) {
        return WithExchange(verifiers_, verifier_handle, connection_handle,
                            [](Verifier& verifier, const Connection& connection) {
                                return verifier.SendPresentationRequest(connection);
                            });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::VerifierUpdateState(const uint32_t verifier_handle,
                                                                            const uint32_t connection_handle) {
        return WithExchange(verifiers_, verifier_handle, connection_handle,
                            [](Verifier& verifier, const Connection& connection) {
                                return StateAfterPoll(verifier, connection);
                            });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::GetVerifierState(const uint32_t verifier_handle) const {
        return verifiers_.WithHandle(verifier_handle, [](const Verifier& verifier) {
            return HandleResult::Ok(verifier.State());
        });
    }

    Result<PresentationStatus, ProtocolFailure> ExchangeRegistry::GetPresentationStatus(
        const uint32_t verifier_handle) const {
        return verifiers_.WithHandle(verifier_handle, [](const Verifier& verifier) {
            return Result<PresentationStatus, ProtocolFailure>::Ok(verifier.GetPresentationStatus());
        });
    }

    Result<std::string, ProtocolFailure> ExchangeRegistry::GetVerifiedPresentation(
        const uint32_t verifier_handle) const {
        return verifiers_.WithHandle(verifier_handle, [](const Verifier& verifier) {
            return verifier.GetPresentation();
        });
    }

    Result<std::string, ProtocolFailure> ExchangeRegistry::SerializeVerifier(const uint32_t verifier_handle) const {
        return verifiers_.WithHandle(verifier_handle, [](const Verifier& verifier) {
            return verifier.Serialize();
        });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::DeserializeVerifier(const std::string& data) {
        return Register(verifiers_, Verifier::Deserialize(context_, data));
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::ReleaseVerifier(const uint32_t verifier_handle) {
        return verifiers_.Release(verifier_handle);
    }

    Result<std::vector<std::pair<std::string, messages::PresentationRequest>>, ProtocolFailure>
    ExchangeRegistry::GetPresentationRequests(const uint32_t connection_handle) const {
        return connections_.WithHandle(connection_handle, [](const Connection& connection) {
            return Prover::GetPresentationRequests(connection);
        });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::CreateProver(const uint32_t connection_handle,
                                                                    std::string source_id,
                                                                    std::string_view request_uid) {
        using ProverResult = Result<Prover, ProtocolFailure>;
        auto prover = connections_.WithHandle(connection_handle, [&](const Connection& connection) {
            auto ready = RequireCompleted(connection);
            if (ready.IsErr()) {
                return ProverResult::Err(ready.UnwrapErr());
            }
            auto request = PendingMessage<messages::PresentationRequest>(connection, request_uid,
                                                                         "presentation request");
            if (request.IsErr()) {
                return ProverResult::Err(request.UnwrapErr());
            }
            auto created = Prover::Create(context_, std::move(source_id), request.Unwrap());
            if (created.IsErr()) {
                return created;
            }
            auto reviewed = connection.UpdateMessageStatus(request_uid);
            if (reviewed.IsErr()) {
                return ProverResult::Err(reviewed.UnwrapErr());
            }
            return created;
        });
        return Register(provers_, std::move(prover));
    }

    Result<std::string, ProtocolFailure> ExchangeRegistry::ProverRetrieveCredentials(
        const uint32_t prover_handle) const {
        return provers_.WithHandle(prover_handle, [](const Prover& prover) {
            return prover.RetrieveCredentials();
        });
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::ProverGeneratePresentation(const uint32_t prover_handle,
                                                                               std::string selected_credentials_json,
                                                                               std::string self_attested_attrs_json) {
        return provers_.WithHandle(prover_handle, [&](Prover& prover) {
            return prover.GeneratePresentation(std::move(selected_credentials_json),
                                               std::move(self_attested_attrs_json));
        });
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::ProverSendPresentation(const uint32_t prover_handle,
                                                                           const uint32_t connection_handle) {
        return WithExchange(provers_, prover_handle, connection_handle,
                            [](Prover& prover, const Connection& connection) {
                                return prover.SendPresentation(connection);
                            });
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::ProverDeclineRequest(const uint32_t prover_handle,
                                                                         const uint32_t connection_handle,
                                                                         std::string reason) {
        return WithExchange(provers_, prover_handle, connection_handle,
                            [&reason](Prover& prover, const Connection& connection) {
                                return prover.DeclinePresentationRequest(connection, std::move(reason));
                            });
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::ProverProposePresentation(const uint32_t prover_handle,
                                                                              const uint32_t connection_handle,
                                                                              messages::PresentationPreview proposal,
                                                                              std::string comment) {
        return WithExchange(provers_, prover_handle, connection_handle,
                            [&](Prover& prover, const Connection& connection) {
                                return prover.DeclinePresentationRequest(connection, std::move(proposal),
                                                                         std::move(comment));
                            });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::ProverUpdateState(const uint32_t prover_handle,
                                                                          const uint32_t connection_handle) {
        return WithExchange(provers_, prover_handle, connection_handle,
                            [](Prover& prover, const Connection& connection) {
                                return StateAfterPoll(prover, connection);
                            });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::GetProverState(const uint32_t prover_handle) const {
        return provers_.WithHandle(prover_handle, [](const Prover& prover) {
            return HandleResult::Ok(prover.State());
        });
    }

    Result<std::string, ProtocolFailure> ExchangeRegistry::SerializeProver(const uint32_t prover_handle) const {
        return provers_.WithHandle(prover_handle, [](const Prover& prover) {
            return prover.Serialize();
        });
    }

    Result<uint32_t, ProtocolFailure> ExchangeRegistry::DeserializeProver(const std::string& data) {
        return Register(provers_, Prover::Deserialize(context_, data));
    }

    Result<Unit, ProtocolFailure> ExchangeRegistry::ReleaseProver(const uint32_t prover_handle) {
        return provers_.Release(prover_handle);
    }
}
