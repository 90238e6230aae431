#include <catch2/catch_test_macros.hpp>
#include "aries/transport/in_memory_relay.hpp"
#include "aries/envelope/encryption_envelope.hpp"
#include "aries/crypto/sodium_pack_service.hpp"
#include "aries/core/constants.hpp"
#include <memory>
using namespace aries::protocol;
using namespace aries::protocol::transport;
using namespace aries::protocol::messages;
namespace {
constexpr std::string_view kEndpoint = "https://relay.test/msg";

std::shared_ptr<wallet::KeyStore> NewStore() {
    auto store = wallet::KeyStore::Create();
    REQUIRE(store.IsOk());
    return std::shared_ptr<wallet::KeyStore>(std::move(store).Unwrap());
}

struct RelayFixture {
    RelayFixture() {
        relay_keys = NewStore();
        relay = InMemoryRelay::Create(std::string(kEndpoint), relay_keys,
                                      std::make_shared<crypto::SodiumPackService>(relay_keys)).Unwrap();
        routing_key = relay->CreateRoutingKey().Unwrap();

        agent_keys = NewStore();
        agent_crypto = std::make_shared<crypto::SodiumPackService>(agent_keys);
        auto info = agent_keys->CreateAndStoreMyDid().Unwrap();
        agent_did = info.did;
        agent_verkey = info.verkey;
        REQUIRE(relay->CreateMailbox(agent_did, agent_verkey).IsOk());
    }

    [[nodiscard]] std::vector<uint8_t> EnvelopeFor(const std::string& id, const bool routed = true) const {
        did::DidDoc doc(agent_did);
        doc.SetServiceEndpoint(std::string(kEndpoint));
        doc.SetKeys({agent_verkey}, routed ? std::vector<std::string>{routing_key} : std::vector<std::string>{});
        Ping ping;
        ping.id = id;
        auto envelope = envelope::EncryptionEnvelope::Create(*agent_crypto, ping, std::nullopt, doc);
        REQUIRE(envelope.IsOk());
        return envelope.Unwrap().GetPayload();
    }

    std::shared_ptr<wallet::KeyStore> relay_keys;
    std::shared_ptr<InMemoryRelay> relay;
    std::string routing_key;
    std::shared_ptr<wallet::KeyStore> agent_keys;
    std::shared_ptr<crypto::SodiumPackService> agent_crypto;
    std::string agent_did;
    std::string agent_verkey;
};
}
TEST_CASE("InMemoryRelay - Construction", "[transport][relay]") {
    auto keys = NewStore();
    auto crypto = std::make_shared<crypto::SodiumPackService>(keys);
    REQUIRE(InMemoryRelay::Create("", keys, crypto).UnwrapErr().type == ProtocolFailureType::InvalidInput);
    REQUIRE(InMemoryRelay::Create("https://relay", nullptr, crypto).IsErr());
    REQUIRE(InMemoryRelay::Create("https://relay", keys, nullptr).IsErr());
    REQUIRE(InMemoryRelay::Create("https://relay", keys, crypto).Unwrap()->GetEndpoint() == "https://relay");
}
TEST_CASE("InMemoryRelay - Routing into mailboxes", "[transport][relay]") {
    RelayFixture fixture;

    SECTION("Forward layer is stripped and the message stored") {
        REQUIRE(fixture.relay->Post(kEndpoint, fixture.EnvelopeFor("m-1")).IsOk());
        REQUIRE(fixture.relay->MessageCount() == 1);

        auto downloaded = fixture.relay->DownloadMessages({fixture.agent_did}, std::nullopt);
        REQUIRE(downloaded.IsOk());
        REQUIRE(downloaded.Unwrap().size() == 1);
        const auto& stored = downloaded.Unwrap().front();
        REQUIRE(stored.pairwise_did == fixture.agent_did);
        REQUIRE(stored.status_code == MessageStatusCodes::RECEIVED);

        auto message = envelope::EncryptionEnvelope::AnonUnpack(*fixture.agent_crypto, stored.payload);
        REQUIRE(message.IsOk());
        REQUIRE(MessageId(message.Unwrap()) == "m-1");
    }
    SECTION("Direct envelopes are stored without unwrapping") {
        REQUIRE(fixture.relay->Post(kEndpoint, fixture.EnvelopeFor("m-1", false)).IsOk());
        REQUIRE(fixture.relay->MessageCount() == 1);
    }
    SECTION("Uids are ordered by arrival") {
        REQUIRE(fixture.relay->Post(kEndpoint, fixture.EnvelopeFor("m-1")).IsOk());
        REQUIRE(fixture.relay->Post(kEndpoint, fixture.EnvelopeFor("m-2")).IsOk());
        auto downloaded = fixture.relay->DownloadMessages({}, std::nullopt).Unwrap();
        REQUIRE(downloaded.size() == 2);
        REQUIRE(downloaded[0].uid < downloaded[1].uid);
        REQUIRE(downloaded[0].uid.size() == 10);
    }
    SECTION("Unknown recipient is an addressing failure") {
        auto stranger_keys = NewStore();
        crypto::SodiumPackService stranger_crypto(stranger_keys);
        did::DidDoc doc("StrangerDid");
        doc.SetKeys({stranger_keys->CreateKey().Unwrap()}, {});
        Ping ping;
        ping.id = "lost";
        auto envelope = envelope::EncryptionEnvelope::Create(stranger_crypto, ping, std::nullopt, doc);
        auto posted = fixture.relay->Post(kEndpoint, envelope.Unwrap().GetPayload());
        REQUIRE(posted.IsErr());
        REQUIRE(posted.UnwrapErr().type == ProtocolFailureType::Addressing);
        REQUIRE(fixture.relay->MessageCount() == 0);
    }
}
TEST_CASE("InMemoryRelay - Status tracking", "[transport][relay]") {
    RelayFixture fixture;
    REQUIRE(fixture.relay->Post(kEndpoint, fixture.EnvelopeFor("m-1")).IsOk());
    REQUIRE(fixture.relay->Post(kEndpoint, fixture.EnvelopeFor("m-2")).IsOk());
    const auto first_uid = fixture.relay->DownloadMessages({}, std::nullopt).Unwrap().front().uid;

    REQUIRE(fixture.relay->UpdateMessageStatus(fixture.agent_did, first_uid, MessageStatusCodes::REVIEWED).IsOk());

    const std::optional<std::string> received(MessageStatusCodes::RECEIVED);
    const std::optional<std::string> reviewed(MessageStatusCodes::REVIEWED);
    REQUIRE(fixture.relay->DownloadMessages({fixture.agent_did}, received).Unwrap().size() == 1);
    REQUIRE(fixture.relay->DownloadMessages({fixture.agent_did}, reviewed).Unwrap().size() == 1);
    REQUIRE(fixture.relay->DownloadMessages({"OtherDid"}, std::nullopt).Unwrap().empty());

    SECTION("Unknown uid is an input error") {
        auto updated = fixture.relay->UpdateMessageStatus(fixture.agent_did, "9999999999", MessageStatusCodes::REVIEWED);
        REQUIRE(updated.UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
    SECTION("Uid owned by another mailbox is an input error") {
        REQUIRE(fixture.relay->UpdateMessageStatus("OtherDid", first_uid, MessageStatusCodes::REVIEWED).IsErr());
    }
}
TEST_CASE("InMemoryRelay - Network failures", "[transport][relay]") {
    RelayFixture fixture;
    const auto payload = fixture.EnvelopeFor("m-1");

    SECTION("Wrong endpoint") {
        auto posted = fixture.relay->Post("https://elsewhere.test/msg", payload);
        REQUIRE(posted.UnwrapErr().type == ProtocolFailureType::Network);
        REQUIRE(posted.UnwrapErr().IsRetryable());
    }
    SECTION("Unreachable relay") {
        fixture.relay->SetReachable(false);
        REQUIRE(fixture.relay->Post(kEndpoint, payload).UnwrapErr().type == ProtocolFailureType::Network);
        REQUIRE(fixture.relay->DownloadMessages({}, std::nullopt).IsErr());
        fixture.relay->SetReachable(true);
        REQUIRE(fixture.relay->Post(kEndpoint, payload).IsOk());
    }
    SECTION("Mailbox registration requires both values") {
        REQUIRE(fixture.relay->CreateMailbox("", "Verkey").IsErr());
        REQUIRE(fixture.relay->CreateMailbox("Did", "").IsErr());
    }
}
