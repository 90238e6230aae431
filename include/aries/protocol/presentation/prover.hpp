#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/protocol/agent_context.hpp"
#include "aries/protocol/connection/connection.hpp"
#include "aries/protocol/presentation/prover_state_machine.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
namespace aries::protocol::presentation {
/// Prover side of one proof exchange, started from a received request.
class Prover {
public:
    [[nodiscard]] static Result<Prover, ProtocolFailure> Create(
        const AgentContext& context,
        std::string source_id,
        const PresentationRequest& request);
    /// Requests waiting in the connection's inbox, keyed by relay uid.
    [[nodiscard]] static Result<std::vector<std::pair<std::string, PresentationRequest>>, ProtocolFailure>
    GetPresentationRequests(const connection::Connection& connection);
    /// Wallet credentials that could answer each referent of the request.
    [[nodiscard]] Result<std::string, ProtocolFailure> RetrieveCredentials() const;
    [[nodiscard]] Result<Unit, ProtocolFailure> GeneratePresentation(std::string selected_credentials_json,
                                                                     std::string self_attested_attrs_json);
    [[nodiscard]] Result<Unit, ProtocolFailure> SendPresentation(const connection::Connection& connection);
    [[nodiscard]] Result<Unit, ProtocolFailure> DeclinePresentationRequest(const connection::Connection& connection,
                                                                           std::string reason);
    /// Answers the request with a counter-proposal instead of a presentation.
    [[nodiscard]] Result<Unit, ProtocolFailure> DeclinePresentationRequest(const connection::Connection& connection,
                                                                           PresentationPreview proposal,
                                                                           std::string comment);
    [[nodiscard]] Result<Unit, ProtocolFailure> UpdateState(const connection::Connection& connection);
    [[nodiscard]] Result<Unit, ProtocolFailure> HandleMessage(const A2AMessage& message,
                                                              const connection::Connection& connection);
    [[nodiscard]] uint32_t State() const noexcept { return sm_.State(); }
    [[nodiscard]] ExchangeStatus Status() const noexcept { return sm_.Status(); }
    [[nodiscard]] bool HasTransitions() const noexcept { return sm_.HasTransitions(); }
    [[nodiscard]] const std::string& GetSourceId() const noexcept { return sm_.GetSourceId(); }
    /// Request attachment JSON of the current request.
    [[nodiscard]] Result<std::string, ProtocolFailure> GetPresentationRequest() const;
    /// Proof JSON; InvalidState before GeneratePresentation.
    [[nodiscard]] Result<std::string, ProtocolFailure> GetPresentation() const;
    [[nodiscard]] const ProverStateMachine& GetStateMachine() const noexcept { return sm_; }
    [[nodiscard]] Result<std::string, ProtocolFailure> Serialize() const;
    [[nodiscard]] static Result<Prover, ProtocolFailure> Deserialize(
        const AgentContext& context,
        const std::string& data);
private:
    Prover(AgentContext context, ProverStateMachine sm)
        : context_(std::move(context)), sm_(std::move(sm)) {}
    [[nodiscard]] Result<Unit, ProtocolFailure> Apply(const ProverEvent& event, const SendMessageFn* send);
    AgentContext context_;
    ProverStateMachine sm_;
};
}
