#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/protocol/agent_context.hpp"
#include "aries/protocol/connection/connection_state_machine.hpp"
#include "aries/protocol/dispatcher.hpp"
#include "aries/protocol/exchange_types.hpp"
#include <cstdint>
#include <string>
#include <string_view>
namespace aries::protocol::connection {
/// Pairwise relationship owned by one handle. Wraps the connection state
/// machine and gives the other exchanges a channel to the peer: an inbox
/// read from the relay and an authcrypted, forward-wrapped send path.
///
/// Every method runs to completion on the caller's thread. A failed call
/// leaves the state machine exactly as it was.
class Connection {
public:
    /// Creates a pairwise DID and its relay mailbox; Connect() then builds
    /// the invitation.
    [[nodiscard]] static Result<Connection, ProtocolFailure> CreateInviter(
        const AgentContext& context,
        std::string source_id);
    [[nodiscard]] static Result<Connection, ProtocolFailure> CreateWithInvite(
        const AgentContext& context,
        std::string source_id,
        const ConnectionInvitation& invitation);
    [[nodiscard]] Result<Unit, ProtocolFailure> Connect();
    /// Polls the relay and applies at most one message. No match is a no-op.
    [[nodiscard]] Result<Unit, ProtocolFailure> UpdateState();
    /// Applies one inbound message plus the automatic reply it calls for.
    [[nodiscard]] Result<Unit, ProtocolFailure> HandleMessage(const A2AMessage& message);
    [[nodiscard]] uint32_t State() const noexcept { return sm_.State(); }
    [[nodiscard]] bool HasTransitions() const noexcept { return sm_.HasTransitions(); }
    [[nodiscard]] bool IsCompleted() const noexcept {
        return sm_.StateCode() == ConnectionStateCode::Completed;
    }
    [[nodiscard]] Result<ConnectionInvitation, ProtocolFailure> GetInviteDetails() const;
    [[nodiscard]] Result<std::string, ProtocolFailure> GetTheirPwDid() const;
    [[nodiscard]] Result<std::string, ProtocolFailure> GetTheirVerkey() const;
    [[nodiscard]] const std::string& GetPwDid() const noexcept { return sm_.GetPairwiseInfo().pw_did; }
    [[nodiscard]] const std::string& GetPwVerkey() const noexcept { return sm_.GetPairwiseInfo().pw_verkey; }
    [[nodiscard]] const std::string& GetSourceId() const noexcept { return sm_.GetSourceId(); }
    /// Sends free text as a basic message; only on a completed relationship.
    [[nodiscard]] Result<Unit, ProtocolFailure> SendGenericMessage(std::string_view content) const;
    /// Packs for the peer's current document and posts to its endpoint.
    [[nodiscard]] Result<Unit, ProtocolFailure> SendMessage(const A2AMessage& message) const;
    /// Send function bound to the peer as known right now.
    [[nodiscard]] SendMessageFn SendMessageClosure() const;
    /// Downloads and unpacks this relationship's mailbox. Once the peer's
    /// verkey is known every message must be authcrypted by it.
    [[nodiscard]] Result<Inbox, ProtocolFailure> GetMessages() const;
    /// Marks a consumed message as reviewed on the relay.
    [[nodiscard]] Result<Unit, ProtocolFailure> UpdateMessageStatus(std::string_view uid) const;
    [[nodiscard]] const ConnectionStateMachine& GetStateMachine() const noexcept { return sm_; }
    [[nodiscard]] const configuration::AgentConfig& GetConfig() const noexcept { return context_.config; }
    [[nodiscard]] Result<std::string, ProtocolFailure> Serialize() const;
    [[nodiscard]] static Result<Connection, ProtocolFailure> Deserialize(
        const AgentContext& context,
        const std::string& data);
private:
    Connection(AgentContext context, ConnectionStateMachine sm)
        : context_(std::move(context)), sm_(std::move(sm)) {}
    [[nodiscard]] static Result<PairwiseInfo, ProtocolFailure> CreatePairwise(const AgentContext& context);
    [[nodiscard]] SendMessageFn SenderFor(const ConnectionStateMachine& sm) const;
    AgentContext context_;
    ConnectionStateMachine sm_;
};
}
