#pragma once
#include "aries/configuration/agent_config.hpp"
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/interfaces/i_anoncreds.hpp"
#include "aries/interfaces/i_crypto_service.hpp"
#include "aries/interfaces/i_relay_client.hpp"
#include "aries/interfaces/i_transport.hpp"
#include "aries/wallet/key_store.hpp"
#include <memory>
#include <string>
#include <vector>
namespace aries::protocol {
/// Collaborators and settings of one agent, injected into every exchange it
/// creates. Several agents can share a process, each with its own context.
struct AgentContext {
    std::shared_ptr<wallet::KeyStore> wallet;
    std::shared_ptr<const interfaces::ICryptoService> crypto;
    std::shared_ptr<interfaces::ITransport> transport;
    std::shared_ptr<interfaces::IRelayClient> relay;
    std::shared_ptr<interfaces::IAnoncreds> anoncreds;
    configuration::AgentConfig config = configuration::AgentConfig::Default();
    /// Endpoint peers post to, and the routing keys guarding it.
    std::string endpoint;
    std::vector<std::string> routing_keys;
    [[nodiscard]] Result<Unit, ProtocolFailure> Validate() const {
        if (!wallet || !crypto || !transport || !relay) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Agent context is missing a wallet, pack service, transport or relay"));
        }
        if (endpoint.empty()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::InvalidInput("Agent context has no endpoint"));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }
};
}
