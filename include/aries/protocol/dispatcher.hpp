#pragma once
#include "aries/messages/a2a_message.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
namespace aries::protocol {
using messages::A2AMessage;
/// Decrypted relay messages keyed by relay uid.
using Inbox = std::map<std::string, A2AMessage>;
struct SelectedMessage {
    std::string uid;
    A2AMessage message;
};
/// Picks inbox messages for a state machine.
///
/// When several messages qualify the smallest uid in std::map order wins, so
/// an unchanged inbox always yields the same selection.
class Dispatcher {
public:
    using Predicate = std::function<bool(const A2AMessage&)>;
    [[nodiscard]] static std::optional<SelectedMessage> SelectFirst(
        const Inbox& inbox,
        const Predicate& predicate) {
        for (const auto& [uid, message] : inbox) {
            if (predicate(message)) {
                return SelectedMessage{uid, message};
            }
        }
        return std::nullopt;
    }
    /// Every message of alternative T, in ascending uid order.
    template<typename T>
    [[nodiscard]] static std::vector<std::pair<std::string, T>> CollectMessages(const Inbox& inbox) {
        std::vector<std::pair<std::string, T>> result;
        for (const auto& [uid, message] : inbox) {
            if (const auto* typed = std::get_if<T>(&message)) {
                result.emplace_back(uid, *typed);
            }
        }
        return result;
    }
private:
    Dispatcher() = delete;
};
}
