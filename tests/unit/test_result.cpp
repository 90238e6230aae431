#include <catch2/catch_test_macros.hpp>
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include <optional>
#include <string>
using namespace aries::protocol;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, ProtocolFailure>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, ProtocolFailure>::Err(ProtocolFailure::Addressing("no keys"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ProtocolFailureType::Addressing);
        REQUIRE(result.UnwrapErr().message == "no keys");
    }
    SECTION("Unwrap on Err throws logic_error") {
        auto result = Result<int, ProtocolFailure>::Err(ProtocolFailure::Generic("x"));
        REQUIRE_THROWS_AS(result.Unwrap(), std::logic_error);
    }
    SECTION("Unit results compare equal") {
        auto result = Result<Unit, ProtocolFailure>::Ok(unit);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == Unit{});
    }
}
TEST_CASE("Result<T, E> - Monadic Operations", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("Map preserves Err") {
        auto mapped = Result<int, std::string>::Err("error").Map([](int x) { return x * 2; });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr() == "error");
    }
    SECTION("MapErr converts a sodium failure into a protocol failure") {
        auto sodium = Result<int, SodiumFailure>::Err(SodiumFailure::AllocationFailed("oom"));
        auto converted = std::move(sodium).MapErr([](const SodiumFailure& failure) {
            return ProtocolFailure::FromSodiumFailure(failure);
        });
        REQUIRE(converted.IsErr());
        REQUIRE(converted.UnwrapErr().type == ProtocolFailureType::Crypto);
        REQUIRE(converted.UnwrapErr().message == "oom");
    }
    SECTION("Bind short-circuits on Err") {
        int calls = 0;
        auto bound = Result<int, std::string>::Err("first").Bind([&calls](int x) {
            ++calls;
            return Result<int, std::string>::Ok(x);
        });
        REQUIRE(bound.IsErr());
        REQUIRE(calls == 0);
    }
    SECTION("UnwrapOr falls back on Err") {
        REQUIRE(Result<int, std::string>::Err("e").UnwrapOr(7) == 7);
        REQUIRE(Result<int, std::string>::Ok(3).UnwrapOr(7) == 3);
    }
}
TEST_CASE("Result<T, E> - Factories", "[result][core]") {
    SECTION("FromOptional") {
        auto some = Result<std::string, ProtocolFailure>::FromOptional(
            std::optional<std::string>("did"), ProtocolFailure::InvalidState("none"));
        REQUIRE(some.Unwrap() == "did");
        auto none = Result<std::string, ProtocolFailure>::FromOptional(
            std::nullopt, ProtocolFailure::InvalidState("none"));
        REQUIRE(none.UnwrapErr().type == ProtocolFailureType::InvalidState);
    }
    SECTION("Try captures exceptions") {
        auto result = Result<int, std::string>::Try(
            []() -> int { throw std::runtime_error("oops"); },
            [](const std::exception& ex) { return std::string(ex.what()); }
        );
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr() == "oops");
    }
}
TEST_CASE("ProtocolFailure - Retryability", "[result][core]") {
    REQUIRE(ProtocolFailure::Network("down").IsRetryable());
    REQUIRE(ProtocolFailure::Timeout("slow").IsRetryable());
    REQUIRE_FALSE(ProtocolFailure::Authentication("bad sender").IsRetryable());
    REQUIRE(FailureTypeName(ProtocolFailureType::ProtocolViolation) == "ProtocolViolation");
}
