#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/protocol/connection/connection.hpp"
#include <cstdint>
namespace aries::protocol {
/// Exchanges other than the connection itself run over a completed connection.
[[nodiscard]] inline Result<Unit, ProtocolFailure> RequireCompleted(const connection::Connection& connection) {
    if (!connection.IsCompleted()) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::InvalidState(
            "Connection " + connection.GetSourceId() + " is not completed"));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}
/// One poll for an exchange: read the connection's inbox, apply the message
/// the exchange expects, then mark it reviewed.
///
/// A message that was rejected without moving the exchange stays unreviewed so
/// the next poll selects it again. Once the exchange has moved, the message is
/// consumed: it is marked reviewed even when a follow-up send (an ack) failed,
/// and that send failure is what the poll returns. If only the marking fails,
/// the transition stays applied and the poll returns the marking failure with
/// its type kept, so Network stays retryable. The moved exchange no longer
/// selects the message, so polling again is safe.
template<typename Exchange>
[[nodiscard]] Result<Unit, ProtocolFailure> PollExchange(Exchange& exchange,
                                                         const connection::Connection& connection) {
    if (!exchange.HasTransitions()) {
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    auto inbox = connection.GetMessages();
    if (inbox.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(inbox.UnwrapErr());
    }
    const auto selected = exchange.GetStateMachine().FindMessageToHandle(inbox.Unwrap());
    if (!selected.has_value()) {
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
    const uint32_t before = exchange.State();
    auto handled = exchange.HandleMessage(selected->message, connection);
    if (handled.IsErr() && exchange.State() == before) {
        return handled;
    }
    auto marked = connection.UpdateMessageStatus(selected->uid);
    if (handled.IsErr()) {
        if (marked.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(ProtocolFailure(
                handled.UnwrapErr().type,
                handled.UnwrapErr().message + "; message " + selected->uid + " was not marked reviewed: " +
                marked.UnwrapErr().message));
        }
        return handled;
    }
    if (marked.IsErr()) {
        return Result<Unit, ProtocolFailure>::Err(ProtocolFailure(
            marked.UnwrapErr().type,
            "Message " + selected->uid + " was applied but not marked reviewed: " + marked.UnwrapErr().message));
    }
    return Result<Unit, ProtocolFailure>::Ok(unit);
}
/// Protobuf snapshot to bytes.
template<typename Proto>
[[nodiscard]] Result<std::string, ProtocolFailure> SerializeSnapshot(const Proto& proto, std::string_view what) {
    std::string data;
    if (!proto.SerializeToString(&data)) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::Encode("Failed to serialize " + std::string(what) + " state"));
    }
    return Result<std::string, ProtocolFailure>::Ok(std::move(data));
}
template<typename Proto>
[[nodiscard]] Result<Proto, ProtocolFailure> ParseSnapshot(const std::string& data, std::string_view what) {
    Proto proto;
    if (!proto.ParseFromString(data)) {
        return Result<Proto, ProtocolFailure>::Err(
            ProtocolFailure::Decode("Failed to parse " + std::string(what) + " state"));
    }
    return Result<Proto, ProtocolFailure>::Ok(std::move(proto));
}
}
