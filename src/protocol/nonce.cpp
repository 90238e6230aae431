#include "aries/protocol/nonce.hpp"
#include "aries/core/constants.hpp"
#include "aries/crypto/sodium_interop.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <memory>

namespace aries::protocol {
    using crypto::SodiumInterop;

    namespace {
        struct BignumDeleter {
            void operator()(BIGNUM* bn) const noexcept { BN_free(bn); }
        };

        struct OpenSslStringDeleter {
            void operator()(char* text) const noexcept { OPENSSL_free(text); }
        };

        using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;
        using OpenSslString = std::unique_ptr<char, OpenSslStringDeleter>;
    }

    Result<std::string, ProtocolFailure> NonceGenerator::NextPresentationNonce() {
        auto random = SodiumInterop::GetRandomBytes(Constants::PRESENTATION_NONCE_BYTES);
        BignumPtr value(BN_bin2bn(random.data(), static_cast<int>(random.size()), nullptr));
        (void)SodiumInterop::SecureWipe(random);
        if (!value) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("Failed to convert nonce to bignum"));
        }

        OpenSslString decimal(BN_bn2dec(value.get()));
        if (!decimal) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Crypto("Failed to render nonce as decimal"));
        }
        return Result<std::string, ProtocolFailure>::Ok(std::string(decimal.get()));
    }

    bool NonceGenerator::IsValidPresentationNonce(std::string_view nonce) {
        if (nonce.empty() || !std::all_of(nonce.begin(), nonce.end(),
                                          [](const char c) { return c >= '0' && c <= '9'; })) {
            return false;
        }
        BIGNUM* raw = nullptr;
        const std::string text(nonce);
        if (BN_dec2bn(&raw, text.c_str()) == 0) {
            return false;
        }
        BignumPtr value(raw);
        return BN_num_bits(value.get()) <= static_cast<int>(Constants::PRESENTATION_NONCE_BYTES * 8);
    }
}
