#pragma once

#include <catch2/catch_test_macros.hpp>
#include "helpers/fake_anoncreds.hpp"
#include "aries/configuration/agent_config.hpp"
#include "aries/crypto/plaintext_pack_service.hpp"
#include "aries/crypto/sodium_interop.hpp"
#include "aries/crypto/sodium_pack_service.hpp"
#include "aries/protocol/agent_context.hpp"
#include "aries/protocol/connection/connection.hpp"
#include "aries/transport/in_memory_relay.hpp"
#include "aries/wallet/key_store.hpp"
#include <memory>
#include <string>
#include <utility>

namespace aries::protocol::test_helpers {

    inline constexpr std::string_view kRelayEndpoint = "https://relay.test/agency/msg";

    enum class PackMode {
        Sodium,
        Plaintext
    };

    struct TestAgent {
        std::shared_ptr<wallet::KeyStore> wallet;
        std::shared_ptr<FakeAnoncreds> anoncreds;
        AgentContext context;
    };

    inline std::shared_ptr<const interfaces::ICryptoService> MakePackService(
        const PackMode mode,
        const std::shared_ptr<wallet::KeyStore>& keys) {
        if (mode == PackMode::Plaintext) {
            return std::make_shared<crypto::PlaintextPackService>();
        }
        return std::make_shared<crypto::SodiumPackService>(keys);
    }

    inline std::shared_ptr<wallet::KeyStore> MakeKeyStore() {
        auto store = wallet::KeyStore::Create();
        REQUIRE(store.IsOk());
        return std::shared_ptr<wallet::KeyStore>(std::move(store).Unwrap());
    }

    /// One relay plus any number of agents using it as their mailbox. Every
    /// agent advertises the relay's routing key, so each message crosses one
    /// Forward hop.
    class TestNetwork {
    public:
        explicit TestNetwork(const PackMode mode = PackMode::Sodium, const bool routed = true)
            : mode_(mode) {
            REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
            relay_keys_ = MakeKeyStore();
            auto relay = transport::InMemoryRelay::Create(
                std::string(kRelayEndpoint), relay_keys_, MakePackService(mode, relay_keys_));
            REQUIRE(relay.IsOk());
            relay_ = std::move(relay).Unwrap();
            if (routed) {
                auto routing_key = relay_->CreateRoutingKey();
                REQUIRE(routing_key.IsOk());
                routing_key_ = routing_key.Unwrap();
            }
        }

        [[nodiscard]] TestAgent CreateAgent(
            const std::string& label,
            configuration::AgentConfig config = configuration::AgentConfig::Default()) const {
            TestAgent agent;
            agent.wallet = MakeKeyStore();
            agent.anoncreds = std::make_shared<FakeAnoncreds>();
            agent.context.wallet = agent.wallet;
            agent.context.crypto = MakePackService(mode_, agent.wallet);
            agent.context.transport = relay_;
            agent.context.relay = relay_;
            agent.context.anoncreds = agent.anoncreds;
            agent.context.config = config.WithLabel(label);
            agent.context.endpoint = std::string(kRelayEndpoint);
            if (!routing_key_.empty()) {
                agent.context.routing_keys = {routing_key_};
            }
            return agent;
        }

        [[nodiscard]] const std::shared_ptr<transport::InMemoryRelay>& Relay() const noexcept { return relay_; }
        [[nodiscard]] const std::string& RoutingKey() const noexcept { return routing_key_; }

    private:
        PackMode mode_;
        std::shared_ptr<wallet::KeyStore> relay_keys_;
        std::shared_ptr<transport::InMemoryRelay> relay_;
        std::string routing_key_;
    };

    struct ConnectedPair {
        connection::Connection inviter;
        connection::Connection invitee;
    };

    /// Runs the connections handshake to Completed on both sides.
    inline ConnectedPair EstablishConnection(const TestAgent& inviter_agent, const TestAgent& invitee_agent) {
        auto inviter_result = connection::Connection::CreateInviter(inviter_agent.context, "inviter-side");
        REQUIRE(inviter_result.IsOk());
        auto inviter = std::move(inviter_result).Unwrap();
        REQUIRE(inviter.Connect().IsOk());
        auto invitation = inviter.GetInviteDetails();
        REQUIRE(invitation.IsOk());

        auto invitee_result = connection::Connection::CreateWithInvite(
            invitee_agent.context, "invitee-side", invitation.Unwrap());
        REQUIRE(invitee_result.IsOk());
        auto invitee = std::move(invitee_result).Unwrap();
        REQUIRE(invitee.Connect().IsOk());

        REQUIRE(inviter.UpdateState().IsOk());
        REQUIRE(invitee.UpdateState().IsOk());
        REQUIRE(inviter.UpdateState().IsOk());
        REQUIRE(inviter.IsCompleted());
        REQUIRE(invitee.IsCompleted());
        return ConnectedPair{std::move(inviter), std::move(invitee)};
    }

}
