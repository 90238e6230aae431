#include "aries/transport/in_memory_relay.hpp"
#include "aries/core/constants.hpp"
#include "aries/core/format.hpp"
#include "aries/debug/protocol_trace.hpp"
#include "aries/messages/a2a_message.hpp"

#include <algorithm>

namespace aries::protocol::transport {

    Result<std::shared_ptr<InMemoryRelay>, ProtocolFailure> InMemoryRelay::Create(
        std::string endpoint,
        std::shared_ptr<wallet::KeyStore> routing_keys,
        std::shared_ptr<const ICryptoService> crypto) {
        if (endpoint.empty()) {
            return Result<std::shared_ptr<InMemoryRelay>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Relay endpoint must not be empty"));
        }
        if (!routing_keys || !crypto) {
            return Result<std::shared_ptr<InMemoryRelay>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Relay requires a key store and a pack service"));
        }
        return Result<std::shared_ptr<InMemoryRelay>, ProtocolFailure>::Ok(
            std::shared_ptr<InMemoryRelay>(
                new InMemoryRelay(std::move(endpoint), std::move(routing_keys), std::move(crypto))));
    }

    InMemoryRelay::InMemoryRelay(std::string endpoint,
                                 std::shared_ptr<wallet::KeyStore> routing_keys,
                                 std::shared_ptr<const ICryptoService> crypto)
        : endpoint_(std::move(endpoint))
          , routing_keys_(std::move(routing_keys))
          , crypto_(std::move(crypto)) {
    }

    Result<std::string, ProtocolFailure> InMemoryRelay::CreateRoutingKey() {
        return routing_keys_->CreateKey();
    }

    Result<Unit, ProtocolFailure> InMemoryRelay::CreateMailbox(
        std::string_view pairwise_did,
        std::string_view verkey) {
        if (pairwise_did.empty() || verkey.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Mailbox requires a pairwise DID and verkey"));
        }
        std::lock_guard lock(lock_);
        mailbox_by_verkey_.insert_or_assign(std::string(verkey), std::string(pairwise_did));
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    void InMemoryRelay::SetReachable(const bool reachable) noexcept {
        reachable_.store(reachable, std::memory_order_release);
    }

    size_t InMemoryRelay::MessageCount() const {
        std::lock_guard lock(lock_);
        return messages_.size();
    }

    Result<Unit, ProtocolFailure> InMemoryRelay::CheckReachable() const {
        if (!reachable_.load(std::memory_order_acquire)) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Network("Relay " + endpoint_ + " is unreachable"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    Result<std::vector<uint8_t>, ProtocolFailure> InMemoryRelay::Post(
        std::string_view endpoint,
        std::span<const uint8_t> payload) {
        auto reachable = CheckReachable();
        if (reachable.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(reachable.UnwrapErr());
        }
        if (endpoint != endpoint_) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Network("No agent listening at " + std::string(endpoint)));
        }
        if (payload.size() > ProtocolConstants::MAX_MESSAGE_SIZE) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Payload exceeds maximum message size"));
        }

        auto delivered = Deliver(std::vector<uint8_t>(payload.begin(), payload.end()), 0);
        if (delivered.IsErr()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(delivered.UnwrapErr());
        }
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok({});
    }

    Result<Unit, ProtocolFailure> InMemoryRelay::Deliver(std::vector<uint8_t> payload, const size_t depth) {
        if (depth > ProtocolConstants::MAX_FORWARD_DEPTH) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Addressing("Forward chain exceeds maximum depth"));
        }

        auto recipients_result = crypto_->RecipientKeys(payload);
        if (recipients_result.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(recipients_result.UnwrapErr());
        }
        const auto& recipients = recipients_result.Unwrap();

        {
            std::lock_guard lock(lock_);
            for (const auto& kid : recipients) {
                const auto mailbox = mailbox_by_verkey_.find(kid);
                if (mailbox == mailbox_by_verkey_.end()) {
                    continue;
                }
                std::string uid = compat::format("{:010}", ++next_uid_);
                ARIES_TRACE(debug::Component::Relay, "stored {} for {}", uid, mailbox->second);
                messages_.emplace(std::move(uid), StoredMessage{
                    mailbox->second,
                    std::string(MessageStatusCodes::RECEIVED),
                    std::move(payload)
                });
                return Result<Unit, ProtocolFailure>::Ok(unit);
            }
        }

        const bool addressed_to_relay = std::any_of(recipients.begin(), recipients.end(),
            [this](const std::string& kid) { return routing_keys_->HasKey(kid); });
        if (!addressed_to_relay) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Addressing("Relay has no route for the envelope recipients"));
        }

        auto unpacked = crypto_->Unpack(payload);
        if (unpacked.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(unpacked.UnwrapErr());
        }
        auto message = messages::Parse(unpacked.Unwrap().message);
        if (message.IsErr()) {
            return Result<Unit, ProtocolFailure>::Err(message.UnwrapErr());
        }
        const auto* forward = std::get_if<messages::Forward>(&message.Unwrap());
        if (forward == nullptr) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::MalformedMessage("Message addressed to a routing key is not a Forward"));
        }

        debug::TraceRelayRouted(forward->to, depth + 1);
        const std::string inner = forward->msg.dump();
        return Deliver(std::vector<uint8_t>(inner.begin(), inner.end()), depth + 1);
    }

    Result<std::vector<DownloadedMessage>, ProtocolFailure> InMemoryRelay::DownloadMessages(
        const std::vector<std::string>& pairwise_dids,
        const std::optional<std::string>& status) {
        auto reachable = CheckReachable();
        if (reachable.IsErr()) {
            return Result<std::vector<DownloadedMessage>, ProtocolFailure>::Err(reachable.UnwrapErr());
        }

        std::lock_guard lock(lock_);
        std::vector<DownloadedMessage> result;
        for (const auto& [uid, stored] : messages_) {
            if (!pairwise_dids.empty() &&
                std::find(pairwise_dids.begin(), pairwise_dids.end(), stored.pairwise_did) == pairwise_dids.end()) {
                continue;
            }
            if (status.has_value() && stored.status_code != *status) {
                continue;
            }
            result.push_back(DownloadedMessage{uid, stored.status_code, stored.pairwise_did, stored.payload});
        }
        return Result<std::vector<DownloadedMessage>, ProtocolFailure>::Ok(std::move(result));
    }

    Result<Unit, ProtocolFailure> InMemoryRelay::UpdateMessageStatus(
        std::string_view pairwise_did,
        std::string_view uid,
        std::string_view status) {
        auto reachable = CheckReachable();
        if (reachable.IsErr()) {
            return reachable;
        }

        std::lock_guard lock(lock_);
        const auto it = messages_.find(std::string(uid));
        if (it == messages_.end() || it->second.pairwise_did != pairwise_did) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Unknown message " + std::string(uid) +
                                              " for " + std::string(pairwise_did)));
        }
        it->second.status_code = std::string(status);
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
}
