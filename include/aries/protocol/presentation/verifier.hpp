#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/protocol/agent_context.hpp"
#include "aries/protocol/connection/connection.hpp"
#include "aries/protocol/presentation/verifier_state_machine.hpp"
#include <cstdint>
#include <string>
#include <string_view>
namespace aries::protocol::presentation {
/// Verifier side of one proof exchange.
class Verifier {
public:
    /// Attribute, predicate and revocation arguments are JSON text; empty
    /// text means none requested.
    [[nodiscard]] static Result<Verifier, ProtocolFailure> Create(
        const AgentContext& context,
        std::string source_id,
        std::string_view requested_attributes_json,
        std::string_view requested_predicates_json,
        std::string_view revocation_details_json,
        std::string name);
    [[nodiscard]] Result<Unit, ProtocolFailure> SendPresentationRequest(const connection::Connection& connection);
    [[nodiscard]] Result<Unit, ProtocolFailure> UpdateState(const connection::Connection& connection);
    /// A received presentation is verified in the same call.
    [[nodiscard]] Result<Unit, ProtocolFailure> HandleMessage(const A2AMessage& message,
                                                              const connection::Connection& connection);
    [[nodiscard]] uint32_t State() const noexcept { return sm_.State(); }
    [[nodiscard]] PresentationStatus GetPresentationStatus() const noexcept { return sm_.Status(); }
    [[nodiscard]] bool HasTransitions() const noexcept { return sm_.HasTransitions(); }
    [[nodiscard]] const std::string& GetSourceId() const noexcept { return sm_.GetSourceId(); }
    /// Proof JSON carried by the presentation; InvalidState before one arrived.
    [[nodiscard]] Result<std::string, ProtocolFailure> GetPresentation() const;
    [[nodiscard]] std::string GetPresentationRequest() const { return sm_.GetRequestData().Serialize(); }
    /// The request message as sent; InvalidState before SendPresentationRequest.
    [[nodiscard]] Result<PresentationRequest, ProtocolFailure> GetPresentationRequestMessage() const;
    [[nodiscard]] const VerifierStateMachine& GetStateMachine() const noexcept { return sm_; }
    [[nodiscard]] Result<std::string, ProtocolFailure> Serialize() const;
    [[nodiscard]] static Result<Verifier, ProtocolFailure> Deserialize(
        const AgentContext& context,
        const std::string& data);
private:
    Verifier(AgentContext context, VerifierStateMachine sm)
        : context_(std::move(context)), sm_(std::move(sm)) {}
    AgentContext context_;
    VerifierStateMachine sm_;
};
}
