#include <catch2/catch_test_macros.hpp>
#include "helpers/agent_fixture.hpp"
#include "aries/protocol/exchange_registry.hpp"
#include <nlohmann/json.hpp>

using namespace aries::protocol;
using namespace aries::protocol::test_helpers;
using connection::ConnectionStateCode;
using issuance::HolderStateCode;
using issuance::IssuerStateCode;
using presentation::ProverStateCode;
using presentation::VerifierStateCode;
using json = nlohmann::json;

namespace {
    template<typename Code>
    constexpr uint32_t Value(const Code code) { return static_cast<uint32_t>(code); }

    std::unique_ptr<ExchangeRegistry> MakeRegistry(const TestAgent& agent) {
        auto registry = ExchangeRegistry::Create(agent.context);
        REQUIRE(registry.IsOk());
        return std::move(registry).Unwrap();
    }

    struct RegistryFixture {
        TestNetwork network;
        TestAgent faber = network.CreateAgent("faber");
        TestAgent alice = network.CreateAgent("alice");
        std::unique_ptr<ExchangeRegistry> faber_registry = MakeRegistry(faber);
        std::unique_ptr<ExchangeRegistry> alice_registry = MakeRegistry(alice);
        uint32_t faber_connection = 0;
        uint32_t alice_connection = 0;

        void Connect() {
            faber_connection = faber_registry->CreateConnection("alice").Unwrap();
            REQUIRE(faber_registry->GetConnectionState(faber_connection).Unwrap() ==
                    Value(ConnectionStateCode::Initial));
            REQUIRE(faber_registry->Connect(faber_connection).IsOk());
            const std::string invitation = faber_registry->GetInviteDetails(faber_connection).Unwrap();
            REQUIRE(json::parse(invitation).at("label") == "faber");

            alice_connection = alice_registry->CreateConnectionWithInvite("faber", invitation).Unwrap();
            REQUIRE(alice_registry->Connect(alice_connection).IsOk());
            REQUIRE(alice_registry->GetConnectionState(alice_connection).Unwrap() ==
                    Value(ConnectionStateCode::Requested));

            REQUIRE(faber_registry->UpdateConnectionState(faber_connection).Unwrap() ==
                    Value(ConnectionStateCode::Responded));
            REQUIRE(alice_registry->UpdateConnectionState(alice_connection).Unwrap() ==
                    Value(ConnectionStateCode::Completed));
            REQUIRE(faber_registry->UpdateConnectionState(faber_connection).Unwrap() ==
                    Value(ConnectionStateCode::Completed));
        }
    };
}

TEST_CASE("Exchange registry - Context validation", "[integration][registry]") {
    AgentContext empty;
    REQUIRE(ExchangeRegistry::Create(empty).UnwrapErr().type == ProtocolFailureType::InvalidInput);
}

TEST_CASE("Exchange registry - Connection handles", "[integration][registry]") {
    RegistryFixture f;
    f.Connect();

    SECTION("Generic messages flow over handles") {
        REQUIRE(f.alice_registry->SendGenericMessage(f.alice_connection, "hello faber").IsOk());
    }
    SECTION("Serialized connection gets a fresh handle") {
        const auto data = f.faber_registry->SerializeConnection(f.faber_connection).Unwrap();
        const uint32_t restored = f.faber_registry->DeserializeConnection(data).Unwrap();
        REQUIRE(restored != f.faber_connection);
        REQUIRE(f.faber_registry->GetConnectionState(restored).Unwrap() == Value(ConnectionStateCode::Completed));
    }
    SECTION("Invite details must be an invitation") {
        REQUIRE(f.alice_registry->CreateConnectionWithInvite("x", R"({"@type":"nope"})").IsErr());
        REQUIRE(f.alice_registry->CreateConnectionWithInvite("x", "not json").IsErr());
    }
    SECTION("Released handles are rejected") {
        REQUIRE(f.faber_registry->ReleaseConnection(f.faber_connection).IsOk());
        REQUIRE(f.faber_registry->GetConnectionState(f.faber_connection).UnwrapErr().type ==
                ProtocolFailureType::InvalidHandle);
        REQUIRE(f.faber_registry->ReleaseConnection(f.faber_connection).UnwrapErr().type ==
                ProtocolFailureType::InvalidHandle);
    }
}

TEST_CASE("Exchange registry - Issue then prove over handles", "[integration][registry]") {
    RegistryFixture f;
    f.Connect();
    auto& faber = *f.faber_registry;
    auto& alice = *f.alice_registry;

    const uint32_t issuer = faber.CreateIssuerCredential(
        "degree", "cd:1", R"({"name":"Alice","age":"28"})", "Degree").Unwrap();
    REQUIRE(faber.GetIssuerState(issuer).Unwrap() == Value(IssuerStateCode::Initial));
    REQUIRE(faber.IssuerSendOffer(issuer, f.faber_connection).IsOk());

    const auto offers = alice.GetCredentialOffers(f.alice_connection).Unwrap();
    REQUIRE(offers.size() == 1);
    const uint32_t holder = alice.CreateHolderCredential(f.alice_connection, "degree", offers.front().first).Unwrap();
    REQUIRE(alice.GetCredentialOffers(f.alice_connection).Unwrap().empty());
    REQUIRE(alice.GetHolderState(holder).Unwrap() == Value(HolderStateCode::OfferReceived));
    REQUIRE(alice.HolderSendRequest(holder, f.alice_connection).IsOk());

    REQUIRE(faber.IssuerUpdateState(issuer, f.faber_connection).Unwrap() == Value(IssuerStateCode::RequestReceived));
    REQUIRE(faber.IssuerSendCredential(issuer, f.faber_connection).IsOk());
    REQUIRE(alice.HolderUpdateState(holder, f.alice_connection).Unwrap() == Value(HolderStateCode::Completed));
    REQUIRE(faber.IssuerUpdateState(issuer, f.faber_connection).Unwrap() == Value(IssuerStateCode::Completed));
    REQUIRE(json::parse(alice.GetCredential(holder).Unwrap()).at("values").at("name").at("raw") == "Alice");

    f.faber.anoncreds->ExpectRevealed("name", "Alice");
    const uint32_t verifier = faber.CreateVerifier(
        "kyc", R"([{"name":"name"}])", R"([{"name":"age","p_type":">=","p_value":21}])", "", "KYC").Unwrap();
    REQUIRE(faber.VerifierSendRequest(verifier, f.faber_connection).IsOk());
    REQUIRE(faber.GetVerifierState(verifier).Unwrap() == Value(VerifierStateCode::RequestSent));

    const auto requests = alice.GetPresentationRequests(f.alice_connection).Unwrap();
    REQUIRE(requests.size() == 1);
    const uint32_t prover = alice.CreateProver(f.alice_connection, "kyc", requests.front().first).Unwrap();
    const auto matches = json::parse(alice.ProverRetrieveCredentials(prover).Unwrap());
    const json cred_id = matches.at("attrs").at("attribute_0").front().at("cred_info").at("referent");
    const json selected = {
        {"attrs", {{"attribute_0", {{"cred_id", cred_id}}}}},
        {"predicates", {{"predicate_0", {{"cred_id", cred_id}}}}}
    };
    REQUIRE(alice.ProverGeneratePresentation(prover, selected.dump(), "{}").IsOk());
    REQUIRE(alice.GetProverState(prover).Unwrap() == Value(ProverStateCode::PresentationBuilt));
    REQUIRE(alice.ProverSendPresentation(prover, f.alice_connection).IsOk());

    REQUIRE(faber.VerifierUpdateState(verifier, f.faber_connection).Unwrap() == Value(VerifierStateCode::Completed));
    REQUIRE(faber.GetPresentationStatus(verifier).Unwrap() == PresentationStatus::Verified);
    REQUIRE(json::parse(faber.GetVerifiedPresentation(verifier).Unwrap())
                .at("requested_proof").at("revealed_attrs").at("attribute_0").at("raw") == "Alice");
    REQUIRE(alice.ProverUpdateState(prover, f.alice_connection).Unwrap() == Value(ProverStateCode::Completed));

    SECTION("Snapshots restore under new handles") {
        const uint32_t restored_verifier = faber.DeserializeVerifier(faber.SerializeVerifier(verifier).Unwrap()).Unwrap();
        REQUIRE(faber.GetPresentationStatus(restored_verifier).Unwrap() == PresentationStatus::Verified);
        const uint32_t restored_holder =
            alice.DeserializeHolderCredential(alice.SerializeHolderCredential(holder).Unwrap()).Unwrap();
        REQUIRE(alice.GetCredential(restored_holder).Unwrap() == alice.GetCredential(holder).Unwrap());
        const uint32_t restored_issuer =
            faber.DeserializeIssuerCredential(faber.SerializeIssuerCredential(issuer).Unwrap()).Unwrap();
        REQUIRE(faber.GetIssuerState(restored_issuer).Unwrap() == Value(IssuerStateCode::Completed));
        const uint32_t restored_prover = alice.DeserializeProver(alice.SerializeProver(prover).Unwrap()).Unwrap();
        REQUIRE(alice.GetProverState(restored_prover).Unwrap() == Value(ProverStateCode::Completed));
    }
    SECTION("Released exchanges are rejected") {
        REQUIRE(faber.ReleaseIssuerCredential(issuer).IsOk());
        REQUIRE(alice.ReleaseHolderCredential(holder).IsOk());
        REQUIRE(faber.ReleaseVerifier(verifier).IsOk());
        REQUIRE(alice.ReleaseProver(prover).IsOk());
        REQUIRE(faber.GetIssuerState(issuer).UnwrapErr().type == ProtocolFailureType::InvalidHandle);
        REQUIRE(alice.GetCredential(holder).UnwrapErr().type == ProtocolFailureType::InvalidHandle);
        REQUIRE(faber.VerifierUpdateState(verifier, f.faber_connection).UnwrapErr().type ==
                ProtocolFailureType::InvalidHandle);
        REQUIRE(alice.ProverUpdateState(prover, f.alice_connection).UnwrapErr().type ==
                ProtocolFailureType::InvalidHandle);
    }
    SECTION("Exchange handles are not connection handles") {
        REQUIRE(faber.IssuerUpdateState(issuer, issuer).UnwrapErr().type == ProtocolFailureType::InvalidHandle);
        REQUIRE(faber.GetVerifierState(issuer).UnwrapErr().type == ProtocolFailureType::InvalidHandle);
    }
}

TEST_CASE("Exchange registry - Declines over handles", "[integration][registry]") {
    RegistryFixture f;
    f.Connect();
    auto& faber = *f.faber_registry;
    auto& alice = *f.alice_registry;

    SECTION("Holder declines an offer") {
        const uint32_t issuer = faber.CreateIssuerCredential("d", "cd:1", R"({"name":"Alice"})", "").Unwrap();
        REQUIRE(faber.IssuerSendOffer(issuer, f.faber_connection).IsOk());
        const auto uid = alice.GetCredentialOffers(f.alice_connection).Unwrap().front().first;
        const uint32_t holder = alice.CreateHolderCredential(f.alice_connection, "d", uid).Unwrap();
        REQUIRE(alice.HolderDeclineOffer(holder, f.alice_connection, "No thanks").IsOk());
        REQUIRE(alice.GetHolderState(holder).Unwrap() == Value(HolderStateCode::Failed));
        REQUIRE(faber.IssuerUpdateState(issuer, f.faber_connection).Unwrap() == Value(IssuerStateCode::Failed));
    }
    SECTION("Prover proposes instead") {
        const uint32_t verifier = faber.CreateVerifier("kyc", R"([{"name":"name"}])", "", "", "KYC").Unwrap();
        REQUIRE(faber.VerifierSendRequest(verifier, f.faber_connection).IsOk());
        const auto uid = alice.GetPresentationRequests(f.alice_connection).Unwrap().front().first;
        const uint32_t prover = alice.CreateProver(f.alice_connection, "kyc", uid).Unwrap();

        messages::PresentationPreview preview;
        preview.attributes.push_back(
            messages::PresentationPreviewAttribute{"nickname", std::nullopt, std::string("Ally"), std::nullopt});
        REQUIRE(alice.ProverProposePresentation(prover, f.alice_connection, preview, "Nickname only").IsOk());
        REQUIRE(alice.GetProverState(prover).Unwrap() == Value(ProverStateCode::ProposalSent));
        REQUIRE(faber.VerifierUpdateState(verifier, f.faber_connection).Unwrap() ==
                Value(VerifierStateCode::RequestSent));
        REQUIRE(alice.ProverDeclineRequest(prover, f.alice_connection, "Too late").UnwrapErr().type ==
                ProtocolFailureType::ProtocolViolation);
    }
    SECTION("Prover declines") {
        const uint32_t verifier = faber.CreateVerifier("kyc", R"([{"name":"name"}])", "", "", "KYC").Unwrap();
        REQUIRE(faber.VerifierSendRequest(verifier, f.faber_connection).IsOk());
        const auto uid = alice.GetPresentationRequests(f.alice_connection).Unwrap().front().first;
        const uint32_t prover = alice.CreateProver(f.alice_connection, "kyc", uid).Unwrap();

        REQUIRE(alice.ProverDeclineRequest(prover, f.alice_connection, "Changed my mind").IsOk());
        REQUIRE(alice.GetProverState(prover).Unwrap() == Value(ProverStateCode::Declined));
        REQUIRE(faber.VerifierUpdateState(verifier, f.faber_connection).Unwrap() == Value(VerifierStateCode::Failed));
        REQUIRE(faber.GetPresentationStatus(verifier).Unwrap() == PresentationStatus::Invalid);
    }
    SECTION("Unknown message uid") {
        REQUIRE(alice.CreateHolderCredential(f.alice_connection, "d", "no-such-uid").UnwrapErr().type ==
                ProtocolFailureType::InvalidInput);
        REQUIRE(alice.CreateProver(f.alice_connection, "p", "no-such-uid").UnwrapErr().type ==
                ProtocolFailureType::InvalidInput);
    }
}
