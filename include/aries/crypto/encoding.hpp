#pragma once

#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace aries::protocol::crypto {

/**
 * @brief Text encodings used on the DIDComm wire
 *
 * Base58 (Bitcoin alphabet) carries verkeys and DIDs. Base64 (standard,
 * padded) carries attachments; Base64Url (unpadded) carries the JWE fields.
 */
class Encoding {
public:
    [[nodiscard]] static std::string Base58Encode(std::span<const uint8_t> data);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Base58Decode(std::string_view text);

    [[nodiscard]] static std::string Base64Encode(std::span<const uint8_t> data);

    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Base64Decode(std::string_view text);

    [[nodiscard]] static std::string Base64UrlEncode(std::span<const uint8_t> data);

    /// Accepts both padded and unpadded input.
    [[nodiscard]] static Result<std::vector<uint8_t>, ProtocolFailure> Base64UrlDecode(std::string_view text);

    [[nodiscard]] static std::span<const uint8_t> AsBytes(std::string_view text) noexcept {
        return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
    }

    [[nodiscard]] static std::string AsString(std::span<const uint8_t> bytes) {
        return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    }

private:
    Encoding() = delete;
};

}
