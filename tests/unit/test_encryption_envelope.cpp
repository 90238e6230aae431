#include <catch2/catch_test_macros.hpp>
#include "aries/envelope/encryption_envelope.hpp"
#include "aries/crypto/sodium_pack_service.hpp"
#include "aries/crypto/encoding.hpp"
#include "aries/wallet/key_store.hpp"
#include <memory>
using namespace aries::protocol;
using namespace aries::protocol::envelope;
using namespace aries::protocol::messages;
namespace {
struct Party {
    std::shared_ptr<wallet::KeyStore> keys;
    std::shared_ptr<crypto::SodiumPackService> crypto;
    std::string verkey;
};

Party NewParty() {
    auto store = wallet::KeyStore::Create();
    REQUIRE(store.IsOk());
    Party party;
    party.keys = std::shared_ptr<wallet::KeyStore>(std::move(store).Unwrap());
    party.crypto = std::make_shared<crypto::SodiumPackService>(party.keys);
    party.verkey = party.keys->CreateKey().Unwrap();
    return party;
}

A2AMessage SamplePing() {
    Ping ping;
    ping.id = "ping-1";
    ping.comment = "are you there";
    ping.response_requested = true;
    return ping;
}

did::DidDoc DocFor(const std::string& verkey, const std::vector<std::string>& routing_keys = {}) {
    did::DidDoc doc("TheirDid1111111111");
    doc.SetServiceEndpoint("https://relay.example/msg");
    doc.SetKeys({verkey}, routing_keys);
    return doc;
}
}
TEST_CASE("EncryptionEnvelope - Direct delivery", "[envelope]") {
    auto alice = NewParty();
    auto bob = NewParty();

    SECTION("Authcrypt envelope opens for the expected sender") {
        auto envelope = EncryptionEnvelope::Create(*alice.crypto, SamplePing(), alice.verkey, DocFor(bob.verkey));
        REQUIRE(envelope.IsOk());
        REQUIRE(envelope.Unwrap().GetForwardLayers() == 0);

        auto message = EncryptionEnvelope::AuthUnpack(*bob.crypto, envelope.Unwrap().GetPayload(), alice.verkey);
        REQUIRE(message.IsOk());
        REQUIRE(std::get<Ping>(message.Unwrap()) == std::get<Ping>(SamplePing()));
    }
    SECTION("Unexpected sender is an authentication failure") {
        auto envelope = EncryptionEnvelope::Create(*alice.crypto, SamplePing(), alice.verkey, DocFor(bob.verkey));
        auto message = EncryptionEnvelope::AuthUnpack(*bob.crypto, envelope.Unwrap().GetPayload(), "SomeoneElse");
        REQUIRE(message.IsErr());
        REQUIRE(message.UnwrapErr().type == ProtocolFailureType::Authentication);
    }
    SECTION("Anoncrypt envelope rejected by AuthUnpack") {
        auto envelope = EncryptionEnvelope::Create(*alice.crypto, SamplePing(), std::nullopt, DocFor(bob.verkey));
        REQUIRE(envelope.IsOk());
        REQUIRE(EncryptionEnvelope::AnonUnpack(*bob.crypto, envelope.Unwrap().GetPayload()).IsOk());
        auto message = EncryptionEnvelope::AuthUnpack(*bob.crypto, envelope.Unwrap().GetPayload(), alice.verkey);
        REQUIRE(message.UnwrapErr().type == ProtocolFailureType::Authentication);
    }
    SECTION("Document without recipient keys is an addressing failure") {
        did::DidDoc empty("TheirDid1111111111");
        auto envelope = EncryptionEnvelope::Create(*alice.crypto, SamplePing(), alice.verkey, empty);
        REQUIRE(envelope.IsErr());
        REQUIRE(envelope.UnwrapErr().type == ProtocolFailureType::Addressing);
    }
}
TEST_CASE("EncryptionEnvelope - Forward wrapping", "[envelope][routing]") {
    auto alice = NewParty();
    auto bob = NewParty();
    auto mediator = NewParty();
    auto outer_mediator = NewParty();

    SECTION("One routing key adds one Forward layer") {
        auto envelope = EncryptionEnvelope::Create(*alice.crypto, SamplePing(), alice.verkey,
                                                   DocFor(bob.verkey, {mediator.verkey}));
        REQUIRE(envelope.IsOk());
        REQUIRE(envelope.Unwrap().GetForwardLayers() == 1);

        REQUIRE(EncryptionEnvelope::AnonUnpack(*bob.crypto, envelope.Unwrap().GetPayload()).IsErr());

        auto outer = EncryptionEnvelope::AnonUnpack(*mediator.crypto, envelope.Unwrap().GetPayload());
        REQUIRE(outer.IsOk());
        const auto& forward = std::get<Forward>(outer.Unwrap());
        REQUIRE(forward.to == bob.verkey);

        const std::string inner = forward.msg.dump();
        auto message = EncryptionEnvelope::AuthUnpack(
            *bob.crypto, crypto::Encoding::AsBytes(inner), alice.verkey);
        REQUIRE(message.IsOk());
        REQUIRE(MessageId(message.Unwrap()) == "ping-1");
    }
    SECTION("Routing keys nest from the recipient outwards") {
        auto envelope = EncryptionEnvelope::Create(*alice.crypto, SamplePing(), alice.verkey,
                                                   DocFor(bob.verkey, {mediator.verkey, outer_mediator.verkey}));
        REQUIRE(envelope.IsOk());
        REQUIRE(envelope.Unwrap().GetForwardLayers() == 2);

        auto outer = EncryptionEnvelope::AnonUnpack(*outer_mediator.crypto, envelope.Unwrap().GetPayload());
        REQUIRE(outer.IsOk());
        const auto& outer_forward = std::get<Forward>(outer.Unwrap());
        REQUIRE(outer_forward.to == mediator.verkey);

        const std::string middle_text = outer_forward.msg.dump();
        auto middle = EncryptionEnvelope::AnonUnpack(*mediator.crypto, crypto::Encoding::AsBytes(middle_text));
        REQUIRE(middle.IsOk());
        const auto& middle_forward = std::get<Forward>(middle.Unwrap());
        REQUIRE(middle_forward.to == bob.verkey);

        const std::string inner = middle_forward.msg.dump();
        REQUIRE(EncryptionEnvelope::AnonUnpack(*mediator.crypto, crypto::Encoding::AsBytes(inner)).IsErr());
        auto message = EncryptionEnvelope::AuthUnpack(*bob.crypto, crypto::Encoding::AsBytes(inner), alice.verkey);
        REQUIRE(message.IsOk());
        REQUIRE(std::get<Ping>(message.Unwrap()) == std::get<Ping>(SamplePing()));
    }
    SECTION("Modern prefix applies to Forward layers") {
        auto envelope = EncryptionEnvelope::Create(*alice.crypto, SamplePing(), alice.verkey,
                                                   DocFor(bob.verkey, {mediator.verkey}),
                                                   MessageTypePrefix::DidCommOrg);
        auto unpacked = mediator.crypto->Unpack(envelope.Unwrap().GetPayload());
        REQUIRE(unpacked.IsOk());
        REQUIRE(unpacked.Unwrap().message.find("https://didcomm.org/routing/1.0/forward") != std::string::npos);
    }
}
