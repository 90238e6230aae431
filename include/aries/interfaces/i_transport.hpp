#pragma once
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace aries::protocol::interfaces {
using protocol::Result;
using protocol::ProtocolFailure;
/// Delivers packed bytes to an agent endpoint. Failures are Network or Timeout
/// and are retryable; the engine never retries on its own.
class ITransport {
public:
    virtual ~ITransport() = default;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ProtocolFailure> Post(
        std::string_view endpoint,
        std::span<const uint8_t> payload) = 0;
};
}
