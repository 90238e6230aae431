#include <catch2/catch_test_macros.hpp>
#include "aries/did/did_doc.hpp"
#include "aries/messages/a2a_message.hpp"
using namespace aries::protocol;
using namespace aries::protocol::did;
TEST_CASE("DidDoc - Defaults", "[did]") {
    const DidDoc doc;
    REQUIRE(doc.GetServices().size() == 1);
    REQUIRE(doc.GetServices().front().type == "IndyAgent");
    REQUIRE(doc.GetServiceEndpoint().empty());
    REQUIRE(doc.ResolveKeys().recipient_keys.empty());

    auto validation = doc.Validate();
    REQUIRE(validation.IsErr());
    REQUIRE(validation.UnwrapErr().type == ProtocolFailureType::Addressing);
}
TEST_CASE("DidDoc - Keys resolve through references", "[did]") {
    DidDoc doc("Did1111111111111111");
    doc.SetServiceEndpoint("https://agent.example/endpoint");
    doc.SetKeys({"RecipientVerkey1", "RecipientVerkey2"}, {"RoutingVerkey"});

    SECTION("Service stores references to public keys") {
        const auto& service = doc.GetServices().front();
        REQUIRE(service.id == "Did1111111111111111;indy");
        REQUIRE(service.recipient_keys == std::vector<std::string>{
            "Did1111111111111111#1", "Did1111111111111111#2"});
        REQUIRE(doc.GetPublicKeys().size() == 2);
        REQUIRE(doc.GetPublicKeys()[0].public_key_base58 == "RecipientVerkey1");
        REQUIRE(doc.GetAuthentication().size() == 2);
        REQUIRE(doc.GetAuthentication()[1].public_key == "Did1111111111111111#2");
    }
    SECTION("ResolveKeys replaces references with verkeys") {
        const auto keys = doc.ResolveKeys();
        REQUIRE(keys.recipient_keys == std::vector<std::string>{"RecipientVerkey1", "RecipientVerkey2"});
        REQUIRE(keys.routing_keys == std::vector<std::string>{"RoutingVerkey"});
        REQUIRE(doc.GetServiceEndpoint() == "https://agent.example/endpoint");
    }
    SECTION("Document validates") {
        REQUIRE(doc.Validate().IsOk());
    }
}
TEST_CASE("DidDoc - From invitation", "[did]") {
    messages::ConnectionInvitation invitation;
    invitation.id = "invitation-id";
    invitation.label = "faber";
    invitation.recipient_keys = {"InviterVerkey"};
    invitation.routing_keys = {"RelayVerkey"};
    invitation.service_endpoint = "https://relay.example/msg";

    const DidDoc doc = DidDoc::FromInvitation(invitation);
    REQUIRE(doc.GetId() == "invitation-id");
    REQUIRE(doc.ResolveKeys().recipient_keys == std::vector<std::string>{"InviterVerkey"});
    REQUIRE(doc.ResolveKeys().routing_keys == std::vector<std::string>{"RelayVerkey"});
    REQUIRE(doc.GetServiceEndpoint() == "https://relay.example/msg");
    REQUIRE(doc.Validate().IsOk());
}
TEST_CASE("DidDoc - JSON form", "[did][json]") {
    DidDoc doc("Did2222222222222222");
    doc.SetServiceEndpoint("https://agent.example/endpoint");
    doc.SetKeys({"Verkey"}, {});

    SECTION("Uses the wire field names") {
        const auto json = doc.ToJson();
        REQUIRE(json.at("@context") == "https://w3id.org/did/v1");
        REQUIRE(json.at("publicKey").at(0).at("type") == "Ed25519VerificationKey2018");
        REQUIRE(json.at("publicKey").at(0).at("publicKeyBase58") == "Verkey");
        REQUIRE(json.at("authentication").at(0).at("type") == "Ed25519SignatureAuthentication2018");
        REQUIRE(json.at("service").at(0).at("serviceEndpoint") == "https://agent.example/endpoint");
    }
    SECTION("Parses back to an equal document") {
        auto parsed = DidDoc::FromJson(doc.ToJson());
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap() == doc);
    }
    SECTION("Missing required fields are malformed") {
        auto json = doc.ToJson();
        json.erase("id");
        auto parsed = DidDoc::FromJson(json);
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == ProtocolFailureType::MalformedMessage);
    }
    SECTION("Dangling authentication reference fails validation") {
        auto json = doc.ToJson();
        json["authentication"][0]["publicKey"] = "Did2222222222222222#9";
        auto parsed = DidDoc::FromJson(json);
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().Validate().IsErr());
    }
    SECTION("Unsupported key type fails validation") {
        auto json = doc.ToJson();
        json["publicKey"][0]["type"] = "RsaVerificationKey2018";
        REQUIRE(DidDoc::FromJson(json).Unwrap().Validate().UnwrapErr().type ==
                ProtocolFailureType::MalformedMessage);
    }
}
