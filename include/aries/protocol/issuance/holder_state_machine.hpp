#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/interfaces/i_anoncreds.hpp"
#include "aries/messages/a2a_message.hpp"
#include "aries/protocol/dispatcher.hpp"
#include "aries/protocol/exchange_types.hpp"
#include "protocol/exchange_state.pb.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
namespace aries::protocol::issuance {
using messages::Credential;
using messages::CredentialOffer;
using messages::CredentialProblemReport;
enum class HolderStateCode : uint32_t {
    Initial = 1,
    OfferReceived = 2,
    RequestSent = 3,
    CredentialReceived = 4,
    Completed = 5,
    Failed = 6
};
namespace holder_states {
struct Initial {
    bool operator==(const Initial&) const = default;
};
struct OfferReceived {
    CredentialOffer offer;
    bool operator==(const OfferReceived&) const = default;
};
struct RequestSent {
    CredentialOffer offer;
    std::string offer_json;
    std::string request_metadata_json;
    bool operator==(const RequestSent&) const = default;
};
struct CredentialReceived {
    CredentialOffer offer;
    std::string request_metadata_json;
    Credential credential;
    bool operator==(const CredentialReceived&) const = default;
};
struct Completed {
    CredentialOffer offer;
    Credential credential;
    std::string credential_id;
    bool operator==(const Completed&) const = default;
};
struct Failed {
    std::string thread_id;
    CredentialProblemReport problem_report;
    bool operator==(const Failed&) const = default;
};
}
using HolderState = std::variant<
    holder_states::Initial,
    holder_states::OfferReceived,
    holder_states::RequestSent,
    holder_states::CredentialReceived,
    holder_states::Completed,
    holder_states::Failed>;
namespace holder_events {
struct OfferReceived {
    CredentialOffer offer;
};
/// prover_did is the holder's pairwise DID on the connection.
struct SendRequest {
    interfaces::IAnoncreds* anoncreds = nullptr;
    std::string prover_did;
};
struct CredentialReceived {
    Credential credential;
};
/// Stores the received credential; the machine completes once the wallet holds it.
struct StoreCredential {
    interfaces::IAnoncreds* anoncreds = nullptr;
};
/// Acks a stored credential. Valid only in Completed and only when the issuer asked.
struct SendAck {};
struct DeclineOffer {
    std::string comment;
};
struct ProblemReportReceived {
    CredentialProblemReport problem_report;
};
}
using HolderEvent = std::variant<
    holder_events::OfferReceived,
    holder_events::SendRequest,
    holder_events::CredentialReceived,
    holder_events::StoreCredential,
    holder_events::DeclineOffer,
    holder_events::ProblemReportReceived,
    holder_events::SendAck>;
/// Issue-credential protocol (Aries RFC 0036), holder side. The offer id
/// threads the whole exchange.
class HolderStateMachine {
public:
    [[nodiscard]] static HolderStateMachine Create(std::string source_id);
    [[nodiscard]] Result<HolderStateMachine, ProtocolFailure> Step(
        const HolderEvent& event,
        const SendMessageFn* send = nullptr) const;
    [[nodiscard]] std::optional<SelectedMessage> FindMessageToHandle(const Inbox& inbox) const;
    [[nodiscard]] static std::optional<HolderEvent> EventFromMessage(const A2AMessage& message);
    [[nodiscard]] HolderStateCode StateCode() const noexcept;
    [[nodiscard]] uint32_t State() const noexcept { return static_cast<uint32_t>(StateCode()); }
    [[nodiscard]] ExchangeStatus Status() const noexcept;
    [[nodiscard]] bool HasTransitions() const noexcept;
    [[nodiscard]] const std::string& GetSourceId() const noexcept { return source_id_; }
    [[nodiscard]] const HolderState& GetState() const noexcept { return state_; }
    [[nodiscard]] std::optional<std::string> GetThreadId() const;
    [[nodiscard]] std::optional<CredentialOffer> GetOffer() const;
    [[nodiscard]] proto::protocol::HolderState ToProtoState() const;
    [[nodiscard]] static Result<HolderStateMachine, ProtocolFailure> FromProtoState(
        const proto::protocol::HolderState& proto);
private:
    HolderStateMachine(std::string source_id, HolderState state);
    [[nodiscard]] HolderStateMachine WithState(HolderState state) const;
    [[nodiscard]] Result<HolderStateMachine, ProtocolFailure> OnOfferReceived(
        const holder_events::OfferReceived& event) const;
    [[nodiscard]] Result<HolderStateMachine, ProtocolFailure> OnSendRequest(
        const holder_events::SendRequest& event, const SendMessageFn* send) const;
    [[nodiscard]] Result<HolderStateMachine, ProtocolFailure> OnCredentialReceived(
        const holder_events::CredentialReceived& event) const;
    [[nodiscard]] Result<HolderStateMachine, ProtocolFailure> OnStoreCredential(
        const holder_events::StoreCredential& event) const;
    [[nodiscard]] Result<HolderStateMachine, ProtocolFailure> OnSendAck(const SendMessageFn* send) const;
    [[nodiscard]] Result<HolderStateMachine, ProtocolFailure> OnDeclineOffer(
        const holder_events::DeclineOffer& event, const SendMessageFn* send) const;
    [[nodiscard]] Result<HolderStateMachine, ProtocolFailure> OnProblemReport(
        const holder_events::ProblemReportReceived& event) const;
    std::string source_id_;
    HolderState state_;
};
[[nodiscard]] std::string_view StateName(const HolderState& state);
}
