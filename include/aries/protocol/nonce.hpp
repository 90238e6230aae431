#pragma once
#include "aries/core/failures.hpp"
#include "aries/core/result.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace aries::protocol {

/// Replay-protection nonces for presentation requests.
///
/// A nonce is PRESENTATION_NONCE_BYTES of libsodium randomness rendered as an
/// unsigned decimal string, the form anoncreds expects in `nonce`.
class NonceGenerator {
public:
    [[nodiscard]] static Result<std::string, ProtocolFailure> NextPresentationNonce();

    /// True for a non-empty decimal string of at most 80 bits.
    [[nodiscard]] static bool IsValidPresentationNonce(std::string_view nonce);

private:
    NonceGenerator() = delete;
};

}
