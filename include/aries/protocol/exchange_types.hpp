#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/messages/a2a_message.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
namespace aries::protocol {
using messages::A2AMessage;
/// Delivers one protocol message to the counterparty of an exchange.
using SendMessageFn = std::function<Result<Unit, ProtocolFailure>(const A2AMessage&)>;
/// Terminal outcome of issuance and prover exchanges.
enum class ExchangeStatus : uint32_t {
    Undefined = 0,
    Success = 1,
    Failed = 2
};
/// Terminal outcome of a verifier exchange, independent of its state code.
enum class PresentationStatus : uint32_t {
    Undefined = 0,
    Verified = 1,
    Invalid = 2
};
[[nodiscard]] inline Result<Unit, ProtocolFailure> SendThrough(const SendMessageFn* send,
                                                               const A2AMessage& message) {
    if (send == nullptr || !*send) {
        return Result<Unit, ProtocolFailure>::Err(
            ProtocolFailure::InvalidInput("Transition sends a message but no send function was supplied"));
    }
    return (*send)(message);
}
/// Content of the first attachment; MalformedMessage when there is none.
[[nodiscard]] inline Result<std::string, ProtocolFailure> FirstAttachmentContent(
    const std::vector<messages::Attachment>& attachments,
    std::string_view what) {
    if (attachments.empty()) {
        return Result<std::string, ProtocolFailure>::Err(
            ProtocolFailure::MalformedMessage(std::string(what) + " carries no attachment"));
    }
    return attachments.front().Content();
}
[[nodiscard]] inline ProtocolFailure InvalidTransition(std::string_view machine,
                                                       std::string_view state,
                                                       std::string_view event) {
    return ProtocolFailure::ProtocolViolation(
        std::string(machine) + ": event " + std::string(event) +
        " is not valid in state " + std::string(state));
}
}
