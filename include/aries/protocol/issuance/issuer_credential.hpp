#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/protocol/agent_context.hpp"
#include "aries/protocol/connection/connection.hpp"
#include "aries/protocol/issuance/issuer_state_machine.hpp"
#include <cstdint>
#include <string>
#include <string_view>
namespace aries::protocol::issuance {
/// Issuer side of one credential exchange, driven over a completed connection.
class IssuerCredential {
public:
    /// credential_values_json: `{"name": "value"}`; InvalidInput when it is not.
    [[nodiscard]] static Result<IssuerCredential, ProtocolFailure> Create(
        const AgentContext& context,
        std::string source_id,
        std::string cred_def_id,
        std::string_view credential_values_json,
        std::string comment);
    [[nodiscard]] Result<Unit, ProtocolFailure> SendOffer(const connection::Connection& connection);
    [[nodiscard]] Result<Unit, ProtocolFailure> SendCredential(const connection::Connection& connection);
    [[nodiscard]] Result<Unit, ProtocolFailure> UpdateState(const connection::Connection& connection);
    [[nodiscard]] Result<Unit, ProtocolFailure> HandleMessage(const A2AMessage& message,
                                                              const connection::Connection& connection);
    [[nodiscard]] uint32_t State() const noexcept { return sm_.State(); }
    [[nodiscard]] ExchangeStatus Status() const noexcept { return sm_.Status(); }
    [[nodiscard]] bool HasTransitions() const noexcept { return sm_.HasTransitions(); }
    [[nodiscard]] const std::string& GetSourceId() const noexcept { return sm_.GetSourceId(); }
    [[nodiscard]] const IssuerStateMachine& GetStateMachine() const noexcept { return sm_; }
    [[nodiscard]] Result<std::string, ProtocolFailure> Serialize() const;
    [[nodiscard]] static Result<IssuerCredential, ProtocolFailure> Deserialize(
        const AgentContext& context,
        const std::string& data);
private:
    IssuerCredential(AgentContext context, IssuerStateMachine sm)
        : context_(std::move(context)), sm_(std::move(sm)) {}
    [[nodiscard]] Result<Unit, ProtocolFailure> Apply(const IssuerEvent& event,
                                                      const connection::Connection& connection);
    AgentContext context_;
    IssuerStateMachine sm_;
};
}
