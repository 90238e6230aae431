#pragma once

#include <catch2/catch_test_macros.hpp>
#include "aries/protocol/exchange_types.hpp"
#include <variant>
#include <vector>

namespace aries::protocol::test_helpers {

    /// Captures what a state machine sends; can be switched to fail like a dead relay.
    struct Outbox {
        std::vector<A2AMessage> sent;
        bool fail = false;

        [[nodiscard]] SendMessageFn Sender() {
            return [this](const A2AMessage& message) {
                if (fail) {
                    return Result<Unit, ProtocolFailure>::Err(ProtocolFailure::Network("relay down"));
                }
                sent.push_back(message);
                return Result<Unit, ProtocolFailure>::Ok(unit);
            };
        }

        template<typename T>
        [[nodiscard]] const T& Last() const {
            REQUIRE_FALSE(sent.empty());
            const auto* typed = std::get_if<T>(&sent.back());
            REQUIRE(typed != nullptr);
            return *typed;
        }
    };

}
