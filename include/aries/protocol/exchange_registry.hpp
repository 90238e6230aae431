#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/protocol/agent_context.hpp"
#include "aries/protocol/connection/connection.hpp"
#include "aries/protocol/handle_registry.hpp"
#include "aries/protocol/issuance/holder_credential.hpp"
#include "aries/protocol/issuance/issuer_credential.hpp"
#include "aries/protocol/presentation/prover.hpp"
#include "aries/protocol/presentation/verifier.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace aries::protocol {
using connection::Connection;
using issuance::HolderCredential;
using issuance::IssuerCredential;
using presentation::Prover;
using presentation::Verifier;
/// Handle-based surface over every exchange one agent runs.
///
/// Each exchange kind lives in its own HandleRegistry. Calls that touch an
/// exchange and its connection lock the exchange handle first, then the
/// connection handle.
class ExchangeRegistry {
public:
    [[nodiscard]] static Result<std::unique_ptr<ExchangeRegistry>, ProtocolFailure> Create(AgentContext context);
    ExchangeRegistry(const ExchangeRegistry&) = delete;
    ExchangeRegistry& operator=(const ExchangeRegistry&) = delete;
    [[nodiscard]] const AgentContext& GetContext() const noexcept { return context_; }
    // Connections
    [[nodiscard]] Result<uint32_t, ProtocolFailure> CreateConnection(std::string source_id);
    /// invitation_json is a connections/1.0/invitation message.
    [[nodiscard]] Result<uint32_t, ProtocolFailure> CreateConnectionWithInvite(std::string source_id,
                                                                               std::string_view invitation_json);
    [[nodiscard]] Result<Unit, ProtocolFailure> Connect(uint32_t connection_handle);
    /// Returns the state code after the poll.
    [[nodiscard]] Result<uint32_t, ProtocolFailure> UpdateConnectionState(uint32_t connection_handle);
    [[nodiscard]] Result<uint32_t, ProtocolFailure> GetConnectionState(uint32_t connection_handle) const;
    [[nodiscard]] Result<std::string, ProtocolFailure> GetInviteDetails(uint32_t connection_handle) const;
    [[nodiscard]] Result<Unit, ProtocolFailure> SendGenericMessage(uint32_t connection_handle,
                                                                   std::string_view content) const;
    [[nodiscard]] Result<std::string, ProtocolFailure> SerializeConnection(uint32_t connection_handle) const;
    [[nodiscard]] Result<uint32_t, ProtocolFailure> DeserializeConnection(const std::string& data);
    [[nodiscard]] Result<Unit, ProtocolFailure> ReleaseConnection(uint32_t connection_handle);
    // Issuer
    [[nodiscard]] Result<uint32_t, ProtocolFailure> CreateIssuerCredential(std::string source_id,
                                                                           std::string cred_def_id,
                                                                           std::string_view credential_values_json,
                                                                           std::string comment);
    [[nodiscard]] Result<Unit, ProtocolFailure> IssuerSendOffer(uint32_t issuer_handle, uint32_t connection_handle);
    [[nodiscard]] Result<Unit, ProtocolFailure> IssuerSendCredential(uint32_t issuer_handle,
                                                                     uint32_t connection_handle);
    [[nodiscard]] Result<uint32_t, ProtocolFailure> IssuerUpdateState(uint32_t issuer_handle,
                                                                      uint32_t connection_handle);
    [[nodiscard]] Result<uint32_t, ProtocolFailure> GetIssuerState(uint32_t issuer_handle) const;
    [[nodiscard]] Result<std::string, ProtocolFailure> SerializeIssuerCredential(uint32_t issuer_handle) const;
    [[nodiscard]] Result<uint32_t, ProtocolFailure> DeserializeIssuerCredential(const std::string& data);
    [[nodiscard]] Result<Unit, ProtocolFailure> ReleaseIssuerCredential(uint32_t issuer_handle);
    // Holder
    [[nodiscard]] Result<std::vector<std::pair<std::string, messages::CredentialOffer>>, ProtocolFailure>
    GetCredentialOffers(uint32_t connection_handle) const;
    /// Starts a holder exchange from the pending offer with relay uid
    /// offer_uid and marks that message reviewed.
    [[nodiscard]] Result<uint32_t, ProtocolFailure> CreateHolderCredential(uint32_t connection_handle,
                                                                           std::string source_id,
                                                                           std::string_view offer_uid);
    [[nodiscard]] Result<Unit, ProtocolFailure> HolderSendRequest(uint32_t holder_handle,
                                                                  uint32_t connection_handle);
    [[nodiscard]] Result<Unit, ProtocolFailure> HolderDeclineOffer(uint32_t holder_handle,
                                                                   uint32_t connection_handle,
                                                                   std::string comment);
    [[nodiscard]] Result<uint32_t, ProtocolFailure> HolderUpdateState(uint32_t holder_handle,
                                                                      uint32_t connection_handle);
    [[nodiscard]] Result<uint32_t, ProtocolFailure> GetHolderState(uint32_t holder_handle) const;
    [[nodiscard]] Result<std::string, ProtocolFailure> GetCredential(uint32_t holder_handle) const;
    [[nodiscard]] Result<std::string, ProtocolFailure> SerializeHolderCredential(uint32_t holder_handle) const;
    [[nodiscard]] Result<uint32_t, ProtocolFailure> DeserializeHolderCredential(const std::string& data);
    [[nodiscard]] Result<Unit, ProtocolFailure> ReleaseHolderCredential(uint32_t holder_handle);
    // Verifier
    [[nodiscard]] Result<uint32_t, ProtocolFailure> CreateVerifier(std::string source_id,
                                                                   std::string_view requested_attributes_json,
                                                                   std::string_view requested_predicates_json,
                                                                   std::string_view revocation_details_json,
                                                                   std::string name);
    [[nodiscard]] Result<Unit, ProtocolFailure> VerifierSendRequest(uint32_t verifier_handle,
                                                                    uint32_t connection_handle);
    [[nodiscard]] Result<uint32_t, ProtocolFailure> VerifierUpdateState(uint32_t verifier_handle,
                                                                        uint32_t connection_handle);
    [[nodiscard]] Result<uint32_t, ProtocolFailure> GetVerifierState(uint32_t verifier_handle) const;
    [[nodiscard]] Result<PresentationStatus, ProtocolFailure> GetPresentationStatus(uint32_t verifier_handle) const;
    [[nodiscard]] Result<std::string, ProtocolFailure> GetVerifiedPresentation(uint32_t verifier_handle) const;
    [[nodiscard]] Result<std::string, ProtocolFailure> SerializeVerifier(uint32_t verifier_handle) const;
    [[nodiscard]] Result<uint32_t, ProtocolFailure> DeserializeVerifier(const std::string& data);
    [[nodiscard]] Result<Unit, ProtocolFailure> ReleaseVerifier(uint32_t verifier_handle);
    // Prover
    [[nodiscard]] Result<std::vector<std::pair<std::string, messages::PresentationRequest>>, ProtocolFailure>
    GetPresentationRequests(uint32_t connection_handle) const;
    /// Starts a prover exchange from the pending request with relay uid
    /// request_uid and marks that message reviewed.
    [[nodiscard]] Result<uint32_t, ProtocolFailure> CreateProver(uint32_t connection_handle,
                                                                 std::string source_id,
                                                                 std::string_view request_uid);
    [[nodiscard]] Result<std::string, ProtocolFailure> ProverRetrieveCredentials(uint32_t prover_handle) const;
    [[nodiscard]] Result<Unit, ProtocolFailure> ProverGeneratePresentation(uint32_t prover_handle,
                                                                           std::string selected_credentials_json,
                                                                           std::string self_attested_attrs_json);
    [[nodiscard]] Result<Unit, ProtocolFailure> ProverSendPresentation(uint32_t prover_handle,
                                                                       uint32_t connection_handle);
    [[nodiscard]] Result<Unit, ProtocolFailure> ProverDeclineRequest(uint32_t prover_handle,
                                                                     uint32_t connection_handle,
                                                                     std::string reason);
    [[nodiscard]] Result<Unit, ProtocolFailure> ProverProposePresentation(uint32_t prover_handle,
                                                                          uint32_t connection_handle,
                                                                          messages::PresentationPreview proposal,
                                                                          std::string comment);
    [[nodiscard]] Result<uint32_t, ProtocolFailure> ProverUpdateState(uint32_t prover_handle,
                                                                      uint32_t connection_handle);
    [[nodiscard]] Result<uint32_t, ProtocolFailure> GetProverState(uint32_t prover_handle) const;
    [[nodiscard]] Result<std::string, ProtocolFailure> SerializeProver(uint32_t prover_handle) const;
    [[nodiscard]] Result<uint32_t, ProtocolFailure> DeserializeProver(const std::string& data);
    [[nodiscard]] Result<Unit, ProtocolFailure> ReleaseProver(uint32_t prover_handle);
private:
    explicit ExchangeRegistry(AgentContext context);
    /// Locks exchange_handle, then connection_handle, and runs
    /// fn(Exchange&, Connection&).
    template<typename Exchange, typename F>
    [[nodiscard]] auto WithExchange(const HandleRegistry<Exchange>& exchanges,
                                    uint32_t exchange_handle,
                                    uint32_t connection_handle,
                                    F&& fn) const {
        return exchanges.WithHandle(exchange_handle, [&](Exchange& exchange) {
            return connections_.WithHandle(connection_handle, [&](Connection& connection) {
                return fn(exchange, connection);
            });
        });
    }
    template<typename T>
    [[nodiscard]] static Result<uint32_t, ProtocolFailure> Register(HandleRegistry<T>& registry,
                                                                    Result<T, ProtocolFailure> created) {
        if (created.IsErr()) {
            return Result<uint32_t, ProtocolFailure>::Err(created.UnwrapErr());
        }
        return registry.Add(std::move(created).Unwrap());
    }
    AgentContext context_;
    HandleRegistry<Connection> connections_;
    HandleRegistry<IssuerCredential> issuers_;
    HandleRegistry<HolderCredential> holders_;
    HandleRegistry<Verifier> verifiers_;
    HandleRegistry<Prover> provers_;
};
}
