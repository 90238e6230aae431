#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/protocol/agent_context.hpp"
#include "aries/protocol/connection/connection.hpp"
#include "aries/protocol/issuance/holder_state_machine.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
namespace aries::protocol::issuance {
/// Holder side of one credential exchange, started from a received offer.
class HolderCredential {
public:
    [[nodiscard]] static Result<HolderCredential, ProtocolFailure> Create(
        const AgentContext& context,
        std::string source_id,
        const CredentialOffer& offer);
    /// Offers waiting in the connection's inbox, keyed by relay uid.
    [[nodiscard]] static Result<std::vector<std::pair<std::string, CredentialOffer>>, ProtocolFailure>
    GetCredentialOffers(const connection::Connection& connection);
    [[nodiscard]] Result<Unit, ProtocolFailure> SendRequest(const connection::Connection& connection);
    [[nodiscard]] Result<Unit, ProtocolFailure> DeclineOffer(const connection::Connection& connection,
                                                             std::string comment);
    [[nodiscard]] Result<Unit, ProtocolFailure> UpdateState(const connection::Connection& connection);
    /// A received credential is stored (and acked) in the same call.
    [[nodiscard]] Result<Unit, ProtocolFailure> HandleMessage(const A2AMessage& message,
                                                              const connection::Connection& connection);
    [[nodiscard]] uint32_t State() const noexcept { return sm_.State(); }
    [[nodiscard]] ExchangeStatus Status() const noexcept { return sm_.Status(); }
    [[nodiscard]] bool HasTransitions() const noexcept { return sm_.HasTransitions(); }
    [[nodiscard]] const std::string& GetSourceId() const noexcept { return sm_.GetSourceId(); }
    /// Credential JSON as issued; InvalidState before Completed.
    [[nodiscard]] Result<std::string, ProtocolFailure> GetCredential() const;
    [[nodiscard]] Result<std::string, ProtocolFailure> GetCredentialId() const;
    [[nodiscard]] const HolderStateMachine& GetStateMachine() const noexcept { return sm_; }
    [[nodiscard]] Result<std::string, ProtocolFailure> Serialize() const;
    [[nodiscard]] static Result<HolderCredential, ProtocolFailure> Deserialize(
        const AgentContext& context,
        const std::string& data);
private:
    HolderCredential(AgentContext context, HolderStateMachine sm)
        : context_(std::move(context)), sm_(std::move(sm)) {}
    AgentContext context_;
    HolderStateMachine sm_;
};
}
