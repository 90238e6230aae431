#pragma once
#include <string>
#include <string_view>

namespace aries::protocol {

enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};

enum class ProtocolFailureType {
    Generic,
    Addressing,
    Crypto,
    Authentication,
    MalformedMessage,
    ProtocolViolation,
    Timeout,
    Network,
    InvalidHandle,
    InvalidInput,
    InvalidState,
    Encode,
    Decode
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;

    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Typed failure returned by every engine operation.
///
/// Addressing, Crypto and Authentication failures abort the current call and
/// are surfaced to the caller verbatim. ProtocolViolation is non-fatal: the
/// state machine keeps its prior value and the offending message stays in the
/// inbox. Timeout and Network come from the transport and are retryable.
class ProtocolFailure {
public:
    ProtocolFailureType type;
    std::string message;

    ProtocolFailure(const ProtocolFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    static ProtocolFailure Generic(std::string msg) {
        return {ProtocolFailureType::Generic, std::move(msg)};
    }
    static ProtocolFailure Addressing(std::string msg) {
        return {ProtocolFailureType::Addressing, std::move(msg)};
    }
    static ProtocolFailure Crypto(std::string msg) {
        return {ProtocolFailureType::Crypto, std::move(msg)};
    }
    static ProtocolFailure Authentication(std::string msg) {
        return {ProtocolFailureType::Authentication, std::move(msg)};
    }
    static ProtocolFailure MalformedMessage(std::string msg) {
        return {ProtocolFailureType::MalformedMessage, std::move(msg)};
    }
    static ProtocolFailure ProtocolViolation(std::string msg) {
        return {ProtocolFailureType::ProtocolViolation, std::move(msg)};
    }
    static ProtocolFailure Timeout(std::string msg) {
        return {ProtocolFailureType::Timeout, std::move(msg)};
    }
    static ProtocolFailure Network(std::string msg) {
        return {ProtocolFailureType::Network, std::move(msg)};
    }
    static ProtocolFailure InvalidHandle(std::string msg) {
        return {ProtocolFailureType::InvalidHandle, std::move(msg)};
    }
    static ProtocolFailure InvalidInput(std::string msg) {
        return {ProtocolFailureType::InvalidInput, std::move(msg)};
    }
    static ProtocolFailure InvalidState(std::string msg) {
        return {ProtocolFailureType::InvalidState, std::move(msg)};
    }
    static ProtocolFailure Encode(std::string msg) {
        return {ProtocolFailureType::Encode, std::move(msg)};
    }
    static ProtocolFailure Decode(std::string msg) {
        return {ProtocolFailureType::Decode, std::move(msg)};
    }

    static ProtocolFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Crypto(sf.message);
    }

    [[nodiscard]] bool IsRetryable() const noexcept {
        return type == ProtocolFailureType::Timeout || type == ProtocolFailureType::Network;
    }
};

[[nodiscard]] inline std::string_view FailureTypeName(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "Generic";
        case ProtocolFailureType::Addressing: return "Addressing";
        case ProtocolFailureType::Crypto: return "Crypto";
        case ProtocolFailureType::Authentication: return "Authentication";
        case ProtocolFailureType::MalformedMessage: return "MalformedMessage";
        case ProtocolFailureType::ProtocolViolation: return "ProtocolViolation";
        case ProtocolFailureType::Timeout: return "Timeout";
        case ProtocolFailureType::Network: return "Network";
        case ProtocolFailureType::InvalidHandle: return "InvalidHandle";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
        case ProtocolFailureType::InvalidState: return "InvalidState";
        case ProtocolFailureType::Encode: return "Encode";
        case ProtocolFailureType::Decode: return "Decode";
    }
    return "Unknown";
}

}
