#include <catch2/catch_test_macros.hpp>
#include "aries/crypto/sodium_secure_memory_handle.hpp"
#include "aries/crypto/sodium_interop.hpp"
#include "aries/core/constants.hpp"
#include <numeric>
#include <vector>

using namespace aries::protocol;
using namespace aries::protocol::crypto;

namespace {
    std::vector<uint8_t> Pattern(const size_t size) {
        std::vector<uint8_t> bytes(size);
        std::iota(bytes.begin(), bytes.end(), static_cast<uint8_t>(1));
        return bytes;
    }

    std::vector<uint8_t> Contents(const SecureMemoryHandle& handle) {
        return handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            return std::vector<uint8_t>(bytes.begin(), bytes.end());
        }).Unwrap();
    }
}

TEST_CASE("SecureMemoryHandle - Sealing", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Sealed key reads back unchanged") {
        const auto secret = Pattern(Constants::ED_25519_SECRET_KEY_SIZE);
        auto sealed = SecureMemoryHandle::Seal(secret);
        REQUIRE(sealed.IsOk());
        const auto handle = std::move(sealed).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == Constants::ED_25519_SECRET_KEY_SIZE);
        REQUIRE(Contents(handle) == secret);
    }
    SECTION("Empty secrets are refused") {
        auto sealed = SecureMemoryHandle::Seal({});
        REQUIRE(sealed.IsErr());
        REQUIRE(sealed.UnwrapErr().type == SodiumFailureType::AllocationFailed);
    }
    SECTION("Default handle holds nothing") {
        const SecureMemoryHandle empty;
        REQUIRE(empty.IsInvalid());
        REQUIRE(empty.Size() == 0);
    }
}

TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto first_secret = Pattern(32);
    auto handle1 = SecureMemoryHandle::Seal(first_secret).Unwrap();
    SecureMemoryHandle handle2(std::move(handle1));
    REQUIRE(handle1.IsInvalid());
    REQUIRE(Contents(handle2) == first_secret);

    auto handle3 = SecureMemoryHandle::Seal(Pattern(64)).Unwrap();
    handle3 = std::move(handle2);
    REQUIRE(handle2.IsInvalid());
    REQUIRE(handle3.Size() == 32);
    REQUIRE(Contents(handle3) == first_secret);
}

TEST_CASE("SecureMemoryHandle - Read access", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle = SecureMemoryHandle::Seal(std::vector<uint8_t>(32, 0x7F)).Unwrap();

    SECTION("WithReadAccess lends the bytes") {
        auto sum = handle.WithReadAccess([](std::span<const uint8_t> bytes) {
            return std::accumulate(bytes.begin(), bytes.end(), size_t{0});
        });
        REQUIRE(sum.IsOk());
        REQUIRE(sum.Unwrap() == 32u * 0x7F);
    }
    SECTION("Disposed handle refuses access") {
        SecureMemoryHandle moved(std::move(handle));
        auto access = handle.WithReadAccess([](std::span<const uint8_t>) { return 0; });
        REQUIRE(access.IsErr());
        REQUIRE(access.UnwrapErr().type == SodiumFailureType::InvalidOperation);
    }
}
