#include <catch2/catch_test_macros.hpp>
#include "aries/protocol/presentation/presentation_request_data.hpp"
#include "aries/protocol/nonce.hpp"
#include "aries/crypto/sodium_interop.hpp"
using namespace aries::protocol;
using namespace aries::protocol::presentation;
using json = nlohmann::json;
namespace {
PresentationRequestData CreateData(std::string_view attributes, std::string_view predicates,
                                   std::string_view revocation = "") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto data = PresentationRequestData::Create("employment", attributes, predicates, revocation);
    REQUIRE(data.IsOk());
    return std::move(data).Unwrap();
}
}
TEST_CASE("PresentationRequestData - Creation", "[presentation][request]") {
    SECTION("Array input is keyed by position") {
        const auto data = CreateData(R"([{"name":"name"},{"names":["degree","year"]}])",
                                     R"([{"name":"age","p_type":">=","p_value":18}])");
        REQUIRE(data.GetName() == "employment");
        REQUIRE(data.GetVersion() == "1.0");
        REQUIRE(data.GetRequestedAttributes().contains("attribute_0"));
        REQUIRE(data.GetRequestedAttributes().contains("attribute_1"));
        REQUIRE(data.GetRequestedPredicates().at("predicate_0").at("p_value") == 18);
        REQUIRE(NonceGenerator::IsValidPresentationNonce(data.GetNonce()));
        REQUIRE_FALSE(data.GetNonRevoked().has_value());
    }
    SECTION("Object input keeps its referents") {
        const auto data = CreateData(R"({"employer":{"name":"company"}})", "");
        REQUIRE(data.GetRequestedAttributes().contains("employer"));
        REQUIRE(data.GetRequestedPredicates().empty());
    }
    SECTION("Each request gets a fresh nonce") {
        REQUIRE(CreateData("[]", "[]").GetNonce() != CreateData("[]", "[]").GetNonce());
    }
    SECTION("Empty name falls back to the default") {
        auto data = PresentationRequestData::Create("", "", "", "");
        REQUIRE(data.Unwrap().GetName() == "proof");
    }
    SECTION("Revocation interval") {
        const auto data = CreateData(R"([{"name":"name"}])", "", R"({"from":100,"to":200})");
        REQUIRE(data.GetNonRevoked() == NonRevokedInterval{100, 200});
        REQUIRE(data.ToJson().at("non_revoked").at("to") == 200);
        REQUIRE_FALSE(CreateData("", "", R"({"support_revocation":false})").GetNonRevoked().has_value());
    }
}
TEST_CASE("PresentationRequestData - Invalid input", "[presentation][request]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto failure = [](std::string_view attributes, std::string_view predicates, std::string_view revocation) {
        auto data = PresentationRequestData::Create("proof", attributes, predicates, revocation);
        REQUIRE(data.IsErr());
        return data.UnwrapErr().type;
    };
    REQUIRE(failure("not json", "", "") == ProtocolFailureType::InvalidInput);
    REQUIRE(failure(R"([{"restrictions":[]}])", "", "") == ProtocolFailureType::InvalidInput);
    REQUIRE(failure(R"("name")", "", "") == ProtocolFailureType::InvalidInput);
    REQUIRE(failure("", R"([{"name":"age","p_type":">="}])", "") == ProtocolFailureType::InvalidInput);
    REQUIRE(failure("", R"([{"name":"age","p_type":">=","p_value":"18"}])", "") == ProtocolFailureType::InvalidInput);
    REQUIRE(failure("", "", R"({"from":300,"to":200})") == ProtocolFailureType::InvalidInput);
    REQUIRE(failure("", "", R"({"from":-1})") == ProtocolFailureType::InvalidInput);
}
TEST_CASE("PresentationRequestData - Wire form", "[presentation][request]") {
    const auto data = CreateData(R"([{"name":"name"}])", R"([{"name":"age","p_type":">=","p_value":18}])");

    SECTION("Serialized request parses back unchanged") {
        auto parsed = PresentationRequestData::Parse(data.Serialize());
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap() == data);
    }
    SECTION("Nonce must be a decimal of at most 80 bits") {
        json value = data.ToJson();
        value["nonce"] = "1208925819614629174706176";
        REQUIRE(PresentationRequestData::FromJson(value).IsErr());
        value["nonce"] = 42;
        REQUIRE(PresentationRequestData::FromJson(value).IsErr());
        value.erase("nonce");
        REQUIRE(PresentationRequestData::FromJson(value).IsErr());
    }
    SECTION("Unparsable text") {
        REQUIRE(PresentationRequestData::Parse("{").UnwrapErr().type == ProtocolFailureType::InvalidInput);
        REQUIRE(PresentationRequestData::Parse("[]").UnwrapErr().type == ProtocolFailureType::InvalidInput);
    }
}
TEST_CASE("PresentationRequestData - Answer coverage", "[presentation][request]") {
    const auto data = CreateData(R"([{"name":"name"},{"name":"phone"}])",
                                 R"([{"name":"age","p_type":">=","p_value":18}])");
    json proof = {
        {"requested_proof", {
            {"revealed_attrs", {{"attribute_0", {{"raw", "Alex"}}}}},
            {"self_attested_attrs", {{"attribute_1", "555"}}},
            {"predicates", {{"predicate_0", {{"sub_proof_index", 0}}}}}
        }}
    };

    SECTION("Revealed and self-attested answers both count") {
        REQUIRE(data.CheckAnswered(proof).IsOk());
    }
    SECTION("Missing attribute") {
        proof["requested_proof"]["self_attested_attrs"] = json::object();
        REQUIRE(data.CheckAnswered(proof).UnwrapErr().type == ProtocolFailureType::ProtocolViolation);
    }
    SECTION("Missing predicate") {
        proof["requested_proof"].erase("predicates");
        REQUIRE(data.CheckAnswered(proof).UnwrapErr().type == ProtocolFailureType::ProtocolViolation);
    }
    SECTION("No requested_proof at all") {
        REQUIRE(data.CheckAnswered(json::object()).UnwrapErr().type == ProtocolFailureType::MalformedMessage);
    }
}
