#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace aries::protocol::configuration {

/// Prefix used when emitting DIDComm message types.
///
/// Both prefixes are always accepted on receive; this only selects what the
/// agent writes into `@type`.
enum class MessageTypePrefix : uint8_t {
    /// `did:sov:BzCbsNYhMrjHiqZDTUASHg;spec/` - understood by every Aries 1.0 agent
    Legacy = 0,

    /// `https://didcomm.org/` - Aries RFC 0348 prefix
    DidCommOrg = 1
};

/// Agent-wide protocol settings.
///
/// A value type handed to every exchange at construction time. There is no
/// process-wide configuration: two agents in one process can run with
/// different settings.
///
/// @example
/// ```cpp
/// auto config = AgentConfig::Default().WithLabel("faber");
/// if (config.AcksPresentations()) {
///     // verifier answers every presentation with an ack or problem report
/// }
/// ```
class AgentConfig {
public:
    /// Legacy prefix, verifier acks presentations, polls only unreviewed messages.
    [[nodiscard]] static AgentConfig Default() {
        return AgentConfig(MessageTypePrefix::Legacy, true, true, "aries-agent");
    }

    /// RFC 0348 prefix, otherwise identical to Default().
    [[nodiscard]] static AgentConfig Modern() {
        return AgentConfig(MessageTypePrefix::DidCommOrg, true, true, "aries-agent");
    }

    [[nodiscard]] AgentConfig WithLabel(std::string label) const {
        AgentConfig copy = *this;
        copy.label_ = std::move(label);
        return copy;
    }

    [[nodiscard]] AgentConfig WithPresentationAcks(const bool enabled) const {
        AgentConfig copy = *this;
        copy.ack_presentations_ = enabled;
        return copy;
    }

    [[nodiscard]] AgentConfig WithReviewedMessages(const bool include_reviewed) const {
        AgentConfig copy = *this;
        copy.only_unreviewed_ = !include_reviewed;
        return copy;
    }

    [[nodiscard]] MessageTypePrefix GetMessageTypePrefix() const noexcept {
        return prefix_;
    }

    [[nodiscard]] std::string_view GetMessageTypePrefixString() const noexcept {
        return prefix_ == MessageTypePrefix::Legacy
                   ? std::string_view("did:sov:BzCbsNYhMrjHiqZDTUASHg;spec/")
                   : std::string_view("https://didcomm.org/");
    }

    /// Label put into connection invitations.
    [[nodiscard]] const std::string& GetLabel() const noexcept {
        return label_;
    }

    [[nodiscard]] bool AcksPresentations() const noexcept {
        return ack_presentations_;
    }

    /// When true the inbox is built only from messages the relay still has
    /// as received (MS-103); consumed messages are never re-delivered.
    [[nodiscard]] bool PollsOnlyUnreviewed() const noexcept {
        return only_unreviewed_;
    }

    [[nodiscard]] bool operator==(const AgentConfig& other) const noexcept {
        return prefix_ == other.prefix_ && ack_presentations_ == other.ack_presentations_ &&
               only_unreviewed_ == other.only_unreviewed_ && label_ == other.label_;
    }

private:
    AgentConfig(const MessageTypePrefix prefix, const bool ack_presentations,
                const bool only_unreviewed, std::string label)
        : prefix_(prefix)
        , ack_presentations_(ack_presentations)
        , only_unreviewed_(only_unreviewed)
        , label_(std::move(label)) {}

    MessageTypePrefix prefix_;
    bool ack_presentations_;
    bool only_unreviewed_;
    std::string label_;
};

}
