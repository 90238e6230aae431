#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include "aries/interfaces/i_key_provider.hpp"
#include "aries/messages/a2a_message.hpp"
#include <cstdint>
#include <string_view>
namespace aries::protocol::connection {
using messages::ConnectionData;
using messages::SignatureDecorator;
/// `connection~sig` of a connection response: Ed25519 over an 8-byte
/// big-endian timestamp followed by the connection JSON {"DID", "DIDDoc"}.
class ConnectionSignature {
public:
    static constexpr std::string_view SIGNATURE_TYPE =
        "did:sov:BzCbsNYhMrjHiqZDTUASHg;spec/signature/1.0/ed25519Sha512_single";
    [[nodiscard]] static Result<SignatureDecorator, ProtocolFailure> Sign(
        const interfaces::IKeyProvider& keys,
        std::string_view signer_verkey,
        const ConnectionData& data,
        uint64_t timestamp);
    /// Authentication failure when the signature does not verify against the
    /// decorator's signer; MalformedMessage when sig_data does not decode.
    [[nodiscard]] static Result<ConnectionData, ProtocolFailure> Verify(const SignatureDecorator& signature);
private:
    ConnectionSignature() = delete;
};
}
