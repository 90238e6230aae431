#include "aries/crypto/encoding.hpp"

#include <sodium.h>
#include <algorithm>
#include <array>
#include <cstring>

namespace aries::protocol::crypto {

namespace {

    constexpr std::string_view kBase58Alphabet =
        "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

    constexpr std::array<int8_t, 128> BuildBase58Map() {
        std::array<int8_t, 128> map{};
        for (auto& entry : map) {
            entry = -1;
        }
        for (size_t i = 0; i < kBase58Alphabet.size(); ++i) {
            map[static_cast<size_t>(kBase58Alphabet[i])] = static_cast<int8_t>(i);
        }
        return map;
    }

    constexpr auto kBase58Map = BuildBase58Map();

    std::string EncodeBase64Variant(std::span<const uint8_t> data, const int variant) {
        if (data.empty()) {
            return {};
        }
        std::string out(sodium_base64_encoded_len(data.size(), variant), '\0');
        sodium_bin2base64(out.data(), out.size(), data.data(), data.size(), variant);
        // encoded_len counts the terminating NUL
        out.resize(std::strlen(out.c_str()));
        return out;
    }

    Result<std::vector<uint8_t>, ProtocolFailure> DecodeBase64Variant(
        std::string_view text, const int variant, std::string_view ignore) {
        if (text.empty()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Ok({});
        }
        std::vector<uint8_t> out(text.size() / 4 * 3 + 3);
        size_t bin_len = 0;
        const char* end = nullptr;
        const std::string ignore_chars(ignore);
        if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                              ignore_chars.empty() ? nullptr : ignore_chars.c_str(),
                              &bin_len, &end, variant) != 0 ||
            end != text.data() + text.size()) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Invalid base64 input"));
        }
        out.resize(bin_len);
        return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(out));
    }

}

std::string Encoding::Base58Encode(std::span<const uint8_t> data) {
    size_t leading_zeros = 0;
    while (leading_zeros < data.size() && data[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // log(256) / log(58) ~ 1.37
    std::vector<uint8_t> digits((data.size() - leading_zeros) * 138 / 100 + 1, 0);
    size_t length = 0;
    for (size_t i = leading_zeros; i < data.size(); ++i) {
        uint32_t carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend(); ++it, ++j) {
            carry += 256U * *it;
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto first = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (first != digits.end() && *first == 0) {
        ++first;
    }
    std::string result(leading_zeros, '1');
    result.reserve(leading_zeros + length);
    for (auto it = first; it != digits.end(); ++it) {
        result.push_back(kBase58Alphabet[*it]);
    }
    return result;
}

Result<std::vector<uint8_t>, ProtocolFailure> Encoding::Base58Decode(std::string_view text) {
    size_t leading_ones = 0;
    while (leading_ones < text.size() && text[leading_ones] == '1') {
        ++leading_ones;
    }

    // log(58) / log(256) ~ 0.733
    std::vector<uint8_t> bytes((text.size() - leading_ones) * 733 / 1000 + 1, 0);
    size_t length = 0;
    for (size_t i = leading_ones; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c >= kBase58Map.size() || kBase58Map[c] < 0) {
            return Result<std::vector<uint8_t>, ProtocolFailure>::Err(
                ProtocolFailure::Decode("Invalid base58 character '" + std::string(1, text[i]) + "'"));
        }
        uint32_t carry = static_cast<uint32_t>(kBase58Map[c]);
        size_t j = 0;
        for (auto it = bytes.rbegin(); (carry != 0 || j < length) && it != bytes.rend(); ++it, ++j) {
            carry += 58U * *it;
            *it = static_cast<uint8_t>(carry % 256);
            carry /= 256;
        }
        length = j;
    }

    auto first = bytes.begin() + static_cast<std::ptrdiff_t>(bytes.size() - length);
    while (first != bytes.end() && *first == 0) {
        ++first;
    }
    std::vector<uint8_t> result(leading_ones, 0);
    result.insert(result.end(), first, bytes.end());
    return Result<std::vector<uint8_t>, ProtocolFailure>::Ok(std::move(result));
}

std::string Encoding::Base64Encode(std::span<const uint8_t> data) {
    return EncodeBase64Variant(data, sodium_base64_VARIANT_ORIGINAL);
}

Result<std::vector<uint8_t>, ProtocolFailure> Encoding::Base64Decode(std::string_view text) {
    return DecodeBase64Variant(text, sodium_base64_VARIANT_ORIGINAL, "\r\n");
}

std::string Encoding::Base64UrlEncode(std::span<const uint8_t> data) {
    return EncodeBase64Variant(data, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

Result<std::vector<uint8_t>, ProtocolFailure> Encoding::Base64UrlDecode(std::string_view text) {
    while (!text.empty() && text.back() == '=') {
        text.remove_suffix(1);
    }
    return DecodeBase64Variant(text, sodium_base64_VARIANT_URLSAFE_NO_PADDING, "");
}

}
