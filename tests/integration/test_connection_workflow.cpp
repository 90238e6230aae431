#include <catch2/catch_test_macros.hpp>
#include "helpers/agent_fixture.hpp"

using namespace aries::protocol;
using namespace aries::protocol::test_helpers;
using connection::Connection;
using connection::ConnectionStateCode;

namespace {
    constexpr uint32_t Code(const ConnectionStateCode code) { return static_cast<uint32_t>(code); }

    void RequirePeers(const ConnectedPair& pair) {
        REQUIRE(pair.inviter.GetTheirPwDid().Unwrap() == pair.invitee.GetPwDid());
        REQUIRE(pair.invitee.GetTheirPwDid().Unwrap() == pair.inviter.GetPwDid());
        REQUIRE(pair.inviter.GetTheirVerkey().Unwrap() == pair.invitee.GetPwVerkey());
        REQUIRE(pair.invitee.GetTheirVerkey().Unwrap() == pair.inviter.GetPwVerkey());
    }
}

TEST_CASE("Connection workflow - Handshake through the relay", "[integration][connection]") {
    SECTION("Authcrypted with one forward hop") {
        TestNetwork network;
        const auto pair = EstablishConnection(network.CreateAgent("faber"), network.CreateAgent("alice"));
        RequirePeers(pair);
    }
    SECTION("Authcrypted without routing keys") {
        TestNetwork network(PackMode::Sodium, false);
        RequirePeers(EstablishConnection(network.CreateAgent("faber"), network.CreateAgent("alice")));
    }
    SECTION("Plaintext packing") {
        TestNetwork network(PackMode::Plaintext);
        RequirePeers(EstablishConnection(network.CreateAgent("faber"), network.CreateAgent("alice")));
    }
    SECTION("Agents on different type prefixes still agree") {
        TestNetwork network;
        const auto pair = EstablishConnection(network.CreateAgent("faber", configuration::AgentConfig::Modern()),
                                              network.CreateAgent("alice"));
        RequirePeers(pair);
    }
}

TEST_CASE("Connection workflow - Step by step", "[integration][connection]") {
    TestNetwork network;
    const auto faber = network.CreateAgent("faber");
    const auto alice = network.CreateAgent("alice");

    auto inviter = Connection::CreateInviter(faber.context, "faber-alice").Unwrap();
    REQUIRE(inviter.State() == Code(ConnectionStateCode::Initial));
    REQUIRE(inviter.GetInviteDetails().UnwrapErr().type == ProtocolFailureType::InvalidState);

    REQUIRE(inviter.Connect().IsOk());
    REQUIRE(inviter.State() == Code(ConnectionStateCode::Invited));
    const auto invitation = inviter.GetInviteDetails().Unwrap();
    REQUIRE(invitation.label == "faber");
    REQUIRE(invitation.recipient_keys == std::vector<std::string>{inviter.GetPwVerkey()});
    REQUIRE(invitation.routing_keys == std::vector<std::string>{network.RoutingKey()});
    REQUIRE(invitation.service_endpoint == kRelayEndpoint);

    auto invitee = Connection::CreateWithInvite(alice.context, "alice-faber", invitation).Unwrap();
    REQUIRE(invitee.State() == Code(ConnectionStateCode::Invited));
    REQUIRE(invitee.Connect().IsOk());
    REQUIRE(invitee.State() == Code(ConnectionStateCode::Requested));

    SECTION("Polling with nothing to handle changes nothing") {
        REQUIRE(invitee.UpdateState().IsOk());
        REQUIRE(invitee.State() == Code(ConnectionStateCode::Requested));
    }
    SECTION("Inviter answers, invitee acks") {
        REQUIRE(inviter.UpdateState().IsOk());
        REQUIRE(inviter.State() == Code(ConnectionStateCode::Responded));
        REQUIRE(invitee.UpdateState().IsOk());
        REQUIRE(invitee.IsCompleted());
        REQUIRE(inviter.UpdateState().IsOk());
        REQUIRE(inviter.IsCompleted());

        REQUIRE(inviter.UpdateState().IsOk());
        REQUIRE(inviter.GetMessages().Unwrap().empty());
    }
}

TEST_CASE("Connection workflow - Generic messages", "[integration][connection]") {
    TestNetwork network;
    const auto pair = EstablishConnection(network.CreateAgent("faber"), network.CreateAgent("alice"));

    REQUIRE(pair.invitee.SendGenericMessage("Hello Faber").IsOk());
    const auto inbox = pair.inviter.GetMessages();
    REQUIRE(inbox.IsOk());
    REQUIRE(inbox.Unwrap().size() == 1);
    const auto* generic = std::get_if<messages::Generic>(&inbox.Unwrap().begin()->second);
    REQUIRE(generic != nullptr);
    REQUIRE(generic->raw.at("content") == "Hello Faber");
    REQUIRE(generic->Type().find("basicmessage") != std::string::npos);

    SECTION("Generic messages need a completed connection") {
        auto fresh = Connection::CreateInviter(network.CreateAgent("carol").context, "carol").Unwrap();
        REQUIRE(fresh.SendGenericMessage("too early").UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
}

TEST_CASE("Connection workflow - Relay outages are retryable", "[integration][connection]") {
    TestNetwork network;
    const auto faber = network.CreateAgent("faber");
    const auto alice = network.CreateAgent("alice");
    auto inviter = Connection::CreateInviter(faber.context, "faber-alice").Unwrap();
    REQUIRE(inviter.Connect().IsOk());
    auto invitee = Connection::CreateWithInvite(alice.context, "alice-faber", inviter.GetInviteDetails().Unwrap())
        .Unwrap();

    network.Relay()->SetReachable(false);
    auto failed = invitee.Connect();
    REQUIRE(failed.IsErr());
    REQUIRE(failed.UnwrapErr().IsRetryable());
    REQUIRE(invitee.State() == Code(ConnectionStateCode::Invited));
    REQUIRE(inviter.UpdateState().UnwrapErr().type == ProtocolFailureType::Network);

    network.Relay()->SetReachable(true);
    REQUIRE(invitee.Connect().IsOk());
    REQUIRE(inviter.UpdateState().IsOk());
    REQUIRE(invitee.UpdateState().IsOk());
    REQUIRE(inviter.UpdateState().IsOk());
    REQUIRE(inviter.IsCompleted());
    REQUIRE(invitee.IsCompleted());
}

TEST_CASE("Connection workflow - Serialized connections resume", "[integration][connection]") {
    TestNetwork network;
    const auto faber = network.CreateAgent("faber");
    const auto alice = network.CreateAgent("alice");
    auto inviter = Connection::CreateInviter(faber.context, "faber-alice").Unwrap();
    REQUIRE(inviter.Connect().IsOk());
    auto invitee = Connection::CreateWithInvite(alice.context, "alice-faber", inviter.GetInviteDetails().Unwrap())
        .Unwrap();
    REQUIRE(invitee.Connect().IsOk());

    const auto saved = inviter.Serialize();
    REQUIRE(saved.IsOk());
    auto restored = Connection::Deserialize(faber.context, saved.Unwrap());
    REQUIRE(restored.IsOk());
    auto resumed = std::move(restored).Unwrap();
    REQUIRE(resumed.GetStateMachine() == inviter.GetStateMachine());

    REQUIRE(resumed.UpdateState().IsOk());
    REQUIRE(invitee.UpdateState().IsOk());
    REQUIRE(resumed.UpdateState().IsOk());
    REQUIRE(resumed.IsCompleted());
    REQUIRE(invitee.IsCompleted());

    const auto completed = Connection::Deserialize(alice.context, invitee.Serialize().Unwrap());
    REQUIRE(completed.Unwrap().IsCompleted());
    REQUIRE(completed.Unwrap().GetTheirPwDid().Unwrap() == resumed.GetPwDid());

    REQUIRE(Connection::Deserialize(faber.context, "not a snapshot").UnwrapErr().type ==
            ProtocolFailureType::Decode);
}
