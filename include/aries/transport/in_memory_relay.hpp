#pragma once
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include "aries/interfaces/i_crypto_service.hpp"
#include "aries/interfaces/i_relay_client.hpp"
#include "aries/interfaces/i_transport.hpp"
#include "aries/wallet/key_store.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
namespace aries::protocol::transport {
using protocol::Result;
using protocol::Unit;
using protocol::ProtocolFailure;
using interfaces::DownloadedMessage;
using interfaces::ICryptoService;
using interfaces::IRelayClient;
using interfaces::ITransport;
/// Store-and-forward relay living in process memory.
///
/// Owns routing keys in its own key store and strips every Forward layer
/// addressed to one of them. A payload addressed to a registered pairwise
/// verkey is stored in that pairwise DID's mailbox as MS-103. Uids are
/// zero-padded arrival counters, so ascending uid order is arrival order.
class InMemoryRelay final : public ITransport, public IRelayClient {
public:
    [[nodiscard]] static Result<std::shared_ptr<InMemoryRelay>, ProtocolFailure> Create(
        std::string endpoint,
        std::shared_ptr<wallet::KeyStore> routing_keys,
        std::shared_ptr<const ICryptoService> crypto);
    [[nodiscard]] const std::string& GetEndpoint() const noexcept { return endpoint_; }
    [[nodiscard]] Result<std::string, ProtocolFailure> CreateRoutingKey();
    [[nodiscard]] Result<Unit, ProtocolFailure> CreateMailbox(
        std::string_view pairwise_did,
        std::string_view verkey) override;
    /// Unreachable relays fail every call with Network.
    void SetReachable(bool reachable) noexcept;
    [[nodiscard]] size_t MessageCount() const;
    [[nodiscard]] Result<std::vector<uint8_t>, ProtocolFailure> Post(
        std::string_view endpoint,
        std::span<const uint8_t> payload) override;
    [[nodiscard]] Result<std::vector<DownloadedMessage>, ProtocolFailure> DownloadMessages(
        const std::vector<std::string>& pairwise_dids,
        const std::optional<std::string>& status) override;
    [[nodiscard]] Result<Unit, ProtocolFailure> UpdateMessageStatus(
        std::string_view pairwise_did,
        std::string_view uid,
        std::string_view status) override;
    InMemoryRelay(const InMemoryRelay&) = delete;
    InMemoryRelay& operator=(const InMemoryRelay&) = delete;
private:
    InMemoryRelay(std::string endpoint,
                  std::shared_ptr<wallet::KeyStore> routing_keys,
                  std::shared_ptr<const ICryptoService> crypto);
    [[nodiscard]] Result<Unit, ProtocolFailure> Deliver(std::vector<uint8_t> payload, size_t depth);
    [[nodiscard]] Result<Unit, ProtocolFailure> CheckReachable() const;
    struct StoredMessage {
        std::string pairwise_did;
        std::string status_code;
        std::vector<uint8_t> payload;
    };
    std::string endpoint_;
    std::shared_ptr<wallet::KeyStore> routing_keys_;
    std::shared_ptr<const ICryptoService> crypto_;
    std::atomic<bool> reachable_{true};
    mutable std::mutex lock_;
    std::unordered_map<std::string, std::string> mailbox_by_verkey_;
    std::map<std::string, StoredMessage> messages_;
    uint64_t next_uid_ = 0;
};
}
