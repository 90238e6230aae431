#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/messages/a2a_message.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
namespace aries::protocol::snapshot {
using messages::A2AMessage;
/// Messages are stored in snapshots as their wire JSON.
template<typename T>
[[nodiscard]] std::string EncodeMessage(const T& message) {
    return messages::Serialize(A2AMessage(message));
}
template<typename T>
[[nodiscard]] std::string EncodeOptional(const std::optional<T>& message) {
    return message.has_value() ? EncodeMessage(*message) : std::string();
}
template<typename T>
[[nodiscard]] Result<T, ProtocolFailure> DecodeMessage(const std::string& text, std::string_view field) {
    auto parsed = messages::Parse(text);
    if (parsed.IsErr()) {
        return Result<T, ProtocolFailure>::Err(ProtocolFailure::Decode(
            "Snapshot field " + std::string(field) + ": " + parsed.UnwrapErr().message));
    }
    auto message = std::move(parsed).Unwrap();
    if (!std::holds_alternative<T>(message)) {
        return Result<T, ProtocolFailure>::Err(ProtocolFailure::Decode(
            "Snapshot field " + std::string(field) + " holds an unexpected message type"));
    }
    return Result<T, ProtocolFailure>::Ok(std::get<T>(std::move(message)));
}
/// Empty text decodes to nullopt.
template<typename T>
[[nodiscard]] Result<std::optional<T>, ProtocolFailure> DecodeOptional(const std::string& text,
                                                                       std::string_view field) {
    if (text.empty()) {
        return Result<std::optional<T>, ProtocolFailure>::Ok(std::nullopt);
    }
    auto decoded = DecodeMessage<T>(text, field);
    if (decoded.IsErr()) {
        return Result<std::optional<T>, ProtocolFailure>::Err(decoded.UnwrapErr());
    }
    return Result<std::optional<T>, ProtocolFailure>::Ok(std::move(decoded).Unwrap());
}
template<typename T>
[[nodiscard]] Result<T, ProtocolFailure> RequireField(const std::optional<T>& value, std::string_view field) {
    if (!value.has_value()) {
        return Result<T, ProtocolFailure>::Err(ProtocolFailure::Decode(
            "Snapshot is missing " + std::string(field)));
    }
    return Result<T, ProtocolFailure>::Ok(*value);
}
}
