#include <catch2/catch_test_macros.hpp>
#include "aries/crypto/encoding.hpp"
#include "aries/crypto/sodium_interop.hpp"
#include <vector>
using namespace aries::protocol;
using namespace aries::protocol::crypto;
TEST_CASE("Encoding - Base58", "[crypto][encoding]") {
    SECTION("Known vector") {
        REQUIRE(Encoding::Base58Encode(Encoding::AsBytes("Hello World!")) == "2NEpo7TZRRrLZSi2U");
        auto decoded = Encoding::Base58Decode("2NEpo7TZRRrLZSi2U");
        REQUIRE(decoded.IsOk());
        REQUIRE(Encoding::AsString(decoded.Unwrap()) == "Hello World!");
    }
    SECTION("Leading zero bytes map to '1'") {
        const std::vector<uint8_t> data{0x00, 0x00, 0x01};
        REQUIRE(Encoding::Base58Encode(data) == "112");
        auto decoded = Encoding::Base58Decode("112");
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == data);
    }
    SECTION("Ed25519 verkey is 43 or 44 characters") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        const auto key = SodiumInterop::GetRandomBytes(32);
        const auto text = Encoding::Base58Encode(key);
        REQUIRE(text.size() >= 43);
        REQUIRE(text.size() <= 44);
        REQUIRE(Encoding::Base58Decode(text).Unwrap() == key);
    }
    SECTION("Characters outside the alphabet are rejected") {
        for (const char* bad : {"0abc", "Oabc", "Iabc", "labc", "ab+c"}) {
            auto decoded = Encoding::Base58Decode(bad);
            REQUIRE(decoded.IsErr());
            REQUIRE(decoded.UnwrapErr().type == ProtocolFailureType::Decode);
        }
    }
}
TEST_CASE("Encoding - Base64 variants", "[crypto][encoding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Standard alphabet with padding") {
        REQUIRE(Encoding::Base64Encode(Encoding::AsBytes("hello")) == "aGVsbG8=");
        REQUIRE(Encoding::AsString(Encoding::Base64Decode("aGVsbG8=").Unwrap()) == "hello");
    }
    SECTION("Url-safe alphabet without padding") {
        const std::vector<uint8_t> data{0xFB, 0xFF};
        REQUIRE(Encoding::Base64Encode(data) == "+/8=");
        REQUIRE(Encoding::Base64UrlEncode(data) == "-_8");
        REQUIRE(Encoding::Base64UrlDecode("-_8").Unwrap() == data);
    }
    SECTION("Url-safe decoding tolerates trailing padding") {
        REQUIRE(Encoding::AsString(Encoding::Base64UrlDecode("aGVsbG8=").Unwrap()) == "hello");
    }
    SECTION("Empty input") {
        REQUIRE(Encoding::Base64Encode({}).empty());
        REQUIRE(Encoding::Base64Decode("").Unwrap().empty());
    }
    SECTION("Invalid input is a decode failure") {
        auto decoded = Encoding::Base64Decode("not base64!");
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == ProtocolFailureType::Decode);
        REQUIRE(Encoding::Base64UrlDecode("a+b/").IsErr());
    }
}
