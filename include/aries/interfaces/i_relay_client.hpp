#pragma once
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace aries::protocol::interfaces {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
struct DownloadedMessage {
    std::string uid;
    std::string status_code;
    std::string pairwise_did;
    std::vector<uint8_t> payload;
};
/// Mailbox side of the store-and-forward relay.
class IRelayClient {
public:
    virtual ~IRelayClient() = default;
    /// Provisions a mailbox collecting everything addressed to verkey.
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> CreateMailbox(
        std::string_view pairwise_did,
        std::string_view verkey) = 0;
    /// Messages for the given pairwise DIDs in ascending uid order; status
    /// filters on the relay-side status code when present.
    [[nodiscard]] virtual Result<std::vector<DownloadedMessage>, ProtocolFailure> DownloadMessages(
        const std::vector<std::string>& pairwise_dids,
        const std::optional<std::string>& status) = 0;
    [[nodiscard]] virtual Result<Unit, ProtocolFailure> UpdateMessageStatus(
        std::string_view pairwise_did,
        std::string_view uid,
        std::string_view status) = 0;
};
}
