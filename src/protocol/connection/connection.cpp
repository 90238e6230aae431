#include "aries/protocol/connection/connection.hpp"
#include "aries/core/constants.hpp"
#include "aries/envelope/encryption_envelope.hpp"
#include "aries/debug/protocol_trace.hpp"

#include <chrono>
#include <nlohmann/json.hpp>

namespace aries::protocol::connection {
    using ConnectionHandleResult = Result<Connection, ProtocolFailure>;
    using UnitResult = Result<Unit, ProtocolFailure>;

    namespace {
        constexpr std::string_view kBasicMessageType = "basicmessage/1.0/message";

        uint64_t NowSeconds() {
            return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        }

        UnitResult SendTo(const AgentContext& context,
                          const std::string& sender_verkey,
                          const did::DidDoc& did_doc,
                          const A2AMessage& message) {
            auto envelope = envelope::EncryptionEnvelope::Create(
                *context.crypto, message, sender_verkey, did_doc,
                context.config.GetMessageTypePrefix());
            if (envelope.IsErr()) {
                return UnitResult::Err(envelope.UnwrapErr());
            }
            auto posted = context.transport->Post(did_doc.GetServiceEndpoint(),
                                                  envelope.Unwrap().GetPayload());
            if (posted.IsErr()) {
                return UnitResult::Err(posted.UnwrapErr());
            }
            return UnitResult::Ok(unit);
        }
    }

    Result<PairwiseInfo, ProtocolFailure> Connection::CreatePairwise(const AgentContext& context) {
        auto valid = context.Validate();
        if (valid.IsErr()) {
            return Result<PairwiseInfo, ProtocolFailure>::Err(valid.UnwrapErr());
        }
        auto did_info = context.wallet->CreateAndStoreMyDid();
        if (did_info.IsErr()) {
            return Result<PairwiseInfo, ProtocolFailure>::Err(did_info.UnwrapErr());
        }
        const auto& info = did_info.Unwrap();
        auto mailbox = context.relay->CreateMailbox(info.did, info.verkey);
        if (mailbox.IsErr()) {
            return Result<PairwiseInfo, ProtocolFailure>::Err(mailbox.UnwrapErr());
        }
        PairwiseInfo pairwise;
        pairwise.pw_did = info.did;
        pairwise.pw_verkey = info.verkey;
        pairwise.endpoint = context.endpoint;
        pairwise.routing_keys = context.routing_keys;
        pairwise.label = context.config.GetLabel();
        return Result<PairwiseInfo, ProtocolFailure>::Ok(std::move(pairwise));
    }

    Result<Connection, ProtocolFailure> Connection::CreateInviter(const AgentContext& context,
                                                                  std::string source_id) {
        auto pairwise = CreatePairwise(context);
        if (pairwise.IsErr()) {
            return ConnectionHandleResult::Err(pairwise.UnwrapErr());
        }
        return ConnectionHandleResult::Ok(Connection(
            context, ConnectionStateMachine::CreateInviter(std::move(source_id), std::move(pairwise).Unwrap())));
    }

    Result<Connection, ProtocolFailure> Connection::CreateWithInvite(const AgentContext& context,
                                                                     std::string source_id,
                                                                     const ConnectionInvitation& invitation) {
        auto pairwise = CreatePairwise(context);
        if (pairwise.IsErr()) {
            return ConnectionHandleResult::Err(pairwise.UnwrapErr());
        }
        auto sm = ConnectionStateMachine::CreateInvitee(std::move(source_id), std::move(pairwise).Unwrap())
            .Step(events::InvitationReceived{invitation});
        if (sm.IsErr()) {
            return ConnectionHandleResult::Err(sm.UnwrapErr());
        }
        return ConnectionHandleResult::Ok(Connection(context, std::move(sm).Unwrap()));
    }

    SendMessageFn Connection::SenderFor(const ConnectionStateMachine& sm) const {
        auto did_doc = sm.GetRemoteDidDoc();
        return [context = context_, sender = GetPwVerkey(), did_doc = std::move(did_doc)](
            const A2AMessage& message) -> UnitResult {
            if (!did_doc.has_value()) {
                return UnitResult::Err(ProtocolFailure::Addressing(
                    "Connection has no document for the peer yet"));
            }
            return SendTo(context, sender, *did_doc, message);
        };
    }

    SendMessageFn Connection::SendMessageClosure() const {
        return SenderFor(sm_);
    }

    Result<Unit, ProtocolFailure> Connection::SendMessage(const A2AMessage& message) const {
        return SenderFor(sm_)(message);
    }

    Result<Unit, ProtocolFailure> Connection::Connect() {
        const SendMessageFn send = SenderFor(sm_);
        auto next = sm_.Step(events::Connect{}, &send);
        if (next.IsErr()) {
            return UnitResult::Err(next.UnwrapErr());
        }
        sm_ = std::move(next).Unwrap();
        return UnitResult::Ok(unit);
    }

    Result<Unit, ProtocolFailure> Connection::HandleMessage(const A2AMessage& message) {
        auto event = ConnectionStateMachine::EventFromMessage(message);
        if (!event.has_value()) {
            return UnitResult::Err(ProtocolFailure::ProtocolViolation(
                "Connection cannot handle " +
                std::string(messages::MessageKindName(messages::KindOf(message)))));
        }
        const SendMessageFn send = SenderFor(sm_);
        auto stepped = sm_.Step(*event, &send);
        if (stepped.IsErr()) {
            return UnitResult::Err(stepped.UnwrapErr());
        }
        auto next = std::move(stepped).Unwrap();

        std::optional<ConnectionEvent> reply;
        if (next.GetRole() == ConnectionRole::Inviter && next.StateCode() == ConnectionStateCode::Requested) {
            reply = events::SendResponse{context_.wallet.get(), NowSeconds()};
        } else if (next.GetRole() == ConnectionRole::Invitee &&
                   next.StateCode() == ConnectionStateCode::Responded) {
            reply = events::SendAck{};
        }
        if (reply.has_value()) {
            const SendMessageFn reply_send = SenderFor(next);
            auto replied = next.Step(*reply, &reply_send);
            if (replied.IsErr()) {
                return UnitResult::Err(replied.UnwrapErr());
            }
            next = std::move(replied).Unwrap();
        }
        sm_ = std::move(next);
        return UnitResult::Ok(unit);
    }

    Result<Unit, ProtocolFailure> Connection::UpdateState() {
        if (!sm_.HasTransitions()) {
            return UnitResult::Ok(unit);
        }
        auto inbox = GetMessages();
        if (inbox.IsErr()) {
            return UnitResult::Err(inbox.UnwrapErr());
        }
        const auto selected = sm_.FindMessageToHandle(inbox.Unwrap());
        if (!selected.has_value()) {
            return UnitResult::Ok(unit);
        }
        auto handled = HandleMessage(selected->message);
        if (handled.IsErr()) {
            return handled;
        }
        // The handshake has moved on; a later poll will not select this uid again.
        auto marked = UpdateMessageStatus(selected->uid);
        if (marked.IsErr()) {
            return UnitResult::Err(ProtocolFailure(
                marked.UnwrapErr().type,
                "Message " + selected->uid + " was applied but not marked reviewed: " + marked.UnwrapErr().message));
        }
        return UnitResult::Ok(unit);
    }

    Result<Inbox, ProtocolFailure> Connection::GetMessages() const {
        std::optional<std::string> status;
        if (context_.config.PollsOnlyUnreviewed()) {
            status = std::string(MessageStatusCodes::RECEIVED);
        }
        auto downloaded = context_.relay->DownloadMessages({GetPwDid()}, status);
        if (downloaded.IsErr()) {
            return Result<Inbox, ProtocolFailure>::Err(downloaded.UnwrapErr());
        }

        const auto their_verkey = sm_.GetTheirVerkey();
        Inbox inbox;
        for (const auto& item : downloaded.Unwrap()) {
            auto message = their_verkey.has_value()
                               ? envelope::EncryptionEnvelope::AuthUnpack(*context_.crypto, item.payload, *their_verkey)
                               : envelope::EncryptionEnvelope::AnonUnpack(*context_.crypto, item.payload);
            if (message.IsErr()) {
                return Result<Inbox, ProtocolFailure>::Err(message.UnwrapErr());
            }
            inbox.emplace(item.uid, std::move(message).Unwrap());
        }
        return Result<Inbox, ProtocolFailure>::Ok(std::move(inbox));
    }

    Result<Unit, ProtocolFailure> Connection::UpdateMessageStatus(std::string_view uid) const {
        return context_.relay->UpdateMessageStatus(GetPwDid(), uid, MessageStatusCodes::REVIEWED);
    }

    Result<ConnectionInvitation, ProtocolFailure> Connection::GetInviteDetails() const {
        auto invitation = sm_.GetInvitation();
        if (!invitation.has_value()) {
            return Result<ConnectionInvitation, ProtocolFailure>::Err(ProtocolFailure::InvalidState(
                "Connection has no invitation in state " + std::string(StateName(sm_.GetState()))));
        }
        return Result<ConnectionInvitation, ProtocolFailure>::Ok(std::move(*invitation));
    }

    Result<std::string, ProtocolFailure> Connection::GetTheirPwDid() const {
        return Result<std::string, ProtocolFailure>::FromOptional(
            sm_.GetTheirDid(),
            ProtocolFailure::InvalidState("Peer DID is not known yet"));
    }

    Result<std::string, ProtocolFailure> Connection::GetTheirVerkey() const {
        return Result<std::string, ProtocolFailure>::FromOptional(
            sm_.GetTheirVerkey(),
            ProtocolFailure::InvalidState("Peer verkey is not known yet"));
    }

    Result<Unit, ProtocolFailure> Connection::SendGenericMessage(std::string_view content) const {
        if (!IsCompleted()) {
            return UnitResult::Err(ProtocolFailure::InvalidState(
                "Generic messages need a completed connection"));
        }
        messages::Generic message;
        message.raw = nlohmann::json{
            {"@type", std::string(context_.config.GetMessageTypePrefixString()) + std::string(kBasicMessageType)},
            {"@id", messages::NewMessageId()},
            {"content", std::string(content)}
        };
        return SendMessage(message);
    }

    Result<std::string, ProtocolFailure> Connection::Serialize() const {
        std::string data;
        if (!sm_.ToProtoState().SerializeToString(&data)) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Encode("Failed to serialize connection state"));
        }
        return Result<std::string, ProtocolFailure>::Ok(std::move(data));
    }

    Result<Connection, ProtocolFailure> Connection::Deserialize(const AgentContext& context,
                                                                const std::string& data) {
        proto::protocol::ConnectionState proto;
        if (!proto.ParseFromString(data)) {
            return ConnectionHandleResult::Err(
                ProtocolFailure::Decode("Failed to parse connection state"));
        }
        auto sm = ConnectionStateMachine::FromProtoState(proto);
        if (sm.IsErr()) {
            return ConnectionHandleResult::Err(sm.UnwrapErr());
        }
        return ConnectionHandleResult::Ok(Connection(context, std::move(sm).Unwrap()));
    }
}
