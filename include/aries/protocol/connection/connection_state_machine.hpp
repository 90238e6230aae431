#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/did/did_doc.hpp"
#include "aries/interfaces/i_key_provider.hpp"
#include "aries/messages/a2a_message.hpp"
#include "aries/protocol/dispatcher.hpp"
#include "aries/protocol/exchange_types.hpp"
#include "protocol/exchange_state.pb.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
namespace aries::protocol::connection {
using messages::ConnectionInvitation;
using messages::ConnectionProblemReport;
using messages::ConnectionRequest;
using messages::ConnectionResponse;
enum class ConnectionRole : uint8_t {
    Inviter,
    Invitee
};
enum class ConnectionStateCode : uint32_t {
    Initial = 1,
    Invited = 2,
    Requested = 3,
    Responded = 4,
    Completed = 5,
    Failed = 6
};
/// This agent's side of the relationship.
struct PairwiseInfo {
    std::string pw_did;
    std::string pw_verkey;
    std::string endpoint;
    std::vector<std::string> routing_keys;
    std::string label;
    bool operator==(const PairwiseInfo&) const = default;
};
namespace states {
struct Initial {
    bool operator==(const Initial&) const = default;
};
struct Invited {
    ConnectionInvitation invitation;
    bool operator==(const Invited&) const = default;
};
/// The inviter learns their DID and document from the request; the invitee
/// addresses the invitation keys until the response arrives.
struct Requested {
    ConnectionInvitation invitation;
    ConnectionRequest request;
    std::string their_did;
    did::DidDoc their_did_doc;
    bool operator==(const Requested&) const = default;
};
struct Responded {
    ConnectionInvitation invitation;
    ConnectionRequest request;
    ConnectionResponse response;
    std::string their_did;
    did::DidDoc their_did_doc;
    bool operator==(const Responded&) const = default;
};
struct Completed {
    ConnectionInvitation invitation;
    ConnectionRequest request;
    std::string their_did;
    did::DidDoc their_did_doc;
    bool operator==(const Completed&) const = default;
};
struct Failed {
    ConnectionProblemReport problem_report;
    bool operator==(const Failed&) const = default;
};
}
using ConnectionState = std::variant<
    states::Initial,
    states::Invited,
    states::Requested,
    states::Responded,
    states::Completed,
    states::Failed>;
namespace events {
/// Inviter: publish an invitation. Invitee: send the connection request.
struct Connect {};
struct InvitationReceived {
    ConnectionInvitation invitation;
};
struct RequestReceived {
    ConnectionRequest request;
};
/// Signs the response with the invitation key lent by keys.
struct SendResponse {
    const interfaces::IKeyProvider* keys = nullptr;
    uint64_t timestamp = 0;
};
struct ResponseReceived {
    ConnectionResponse response;
};
struct SendAck {};
/// Ack or Ping threaded to the request.
struct AckReceived {
    std::string thread_id;
};
struct ProblemReportReceived {
    ConnectionProblemReport problem_report;
};
}
using ConnectionEvent = std::variant<
    events::Connect,
    events::InvitationReceived,
    events::RequestReceived,
    events::SendResponse,
    events::ResponseReceived,
    events::SendAck,
    events::AckReceived,
    events::ProblemReportReceived>;
/// Connection protocol (Aries RFC 0160) as an immutable value. Step returns
/// the next value and never touches the receiver.
class ConnectionStateMachine {
public:
    [[nodiscard]] static ConnectionStateMachine CreateInviter(std::string source_id, PairwiseInfo pairwise);
    [[nodiscard]] static ConnectionStateMachine CreateInvitee(std::string source_id, PairwiseInfo pairwise);
    /// ProtocolViolation for a (state, event) pair the protocol does not
    /// define. Transitions that emit a message call send once and fail as a
    /// whole when it fails.
    [[nodiscard]] Result<ConnectionStateMachine, ProtocolFailure> Step(
        const ConnectionEvent& event,
        const SendMessageFn* send = nullptr) const;
    [[nodiscard]] std::optional<SelectedMessage> FindMessageToHandle(const Inbox& inbox) const;
    /// Maps an inbound message to the event it triggers; nullopt for message
    /// kinds the connection protocol never consumes.
    [[nodiscard]] static std::optional<ConnectionEvent> EventFromMessage(const A2AMessage& message);
    [[nodiscard]] ConnectionStateCode StateCode() const noexcept;
    [[nodiscard]] uint32_t State() const noexcept { return static_cast<uint32_t>(StateCode()); }
    [[nodiscard]] bool HasTransitions() const noexcept;
    [[nodiscard]] ConnectionRole GetRole() const noexcept { return role_; }
    [[nodiscard]] const std::string& GetSourceId() const noexcept { return source_id_; }
    [[nodiscard]] const PairwiseInfo& GetPairwiseInfo() const noexcept { return pairwise_; }
    [[nodiscard]] const ConnectionState& GetState() const noexcept { return state_; }
    [[nodiscard]] std::optional<ConnectionInvitation> GetInvitation() const;
    /// Where messages to the peer go in the current state, if anywhere yet.
    [[nodiscard]] std::optional<did::DidDoc> GetRemoteDidDoc() const;
    [[nodiscard]] std::optional<std::string> GetTheirDid() const;
    [[nodiscard]] std::optional<std::string> GetTheirVerkey() const;
    /// Id of the connection request, which threads every later message.
    [[nodiscard]] std::optional<std::string> GetThreadId() const;
    [[nodiscard]] did::DidDoc BuildMyDidDoc() const;
    [[nodiscard]] proto::protocol::ConnectionState ToProtoState() const;
    [[nodiscard]] static Result<ConnectionStateMachine, ProtocolFailure> FromProtoState(
        const proto::protocol::ConnectionState& proto);
    bool operator==(const ConnectionStateMachine&) const = default;
private:
    ConnectionStateMachine(ConnectionRole role, std::string source_id, PairwiseInfo pairwise,
                           ConnectionState state);
    [[nodiscard]] ConnectionStateMachine WithState(ConnectionState state) const;
    [[nodiscard]] Result<ConnectionStateMachine, ProtocolFailure> OnConnect(const SendMessageFn* send) const;
    [[nodiscard]] Result<ConnectionStateMachine, ProtocolFailure> OnInvitationReceived(
        const events::InvitationReceived& event) const;
    [[nodiscard]] Result<ConnectionStateMachine, ProtocolFailure> OnRequestReceived(
        const events::RequestReceived& event) const;
    [[nodiscard]] Result<ConnectionStateMachine, ProtocolFailure> OnSendResponse(
        const events::SendResponse& event, const SendMessageFn* send) const;
    [[nodiscard]] Result<ConnectionStateMachine, ProtocolFailure> OnResponseReceived(
        const events::ResponseReceived& event, const SendMessageFn* send) const;
    [[nodiscard]] Result<ConnectionStateMachine, ProtocolFailure> OnSendAck(const SendMessageFn* send) const;
    [[nodiscard]] Result<ConnectionStateMachine, ProtocolFailure> OnAckReceived(
        const events::AckReceived& event) const;
    [[nodiscard]] Result<ConnectionStateMachine, ProtocolFailure> OnProblemReport(
        const events::ProblemReportReceived& event) const;
    [[nodiscard]] ProtocolFailure Violation(std::string_view event) const;
    ConnectionRole role_;
    std::string source_id_;
    PairwiseInfo pairwise_;
    ConnectionState state_;
};
[[nodiscard]] std::string_view StateName(const ConnectionState& state);
}
