#include <catch2/catch_test_macros.hpp>
#include "aries/protocol/exchange_driver.hpp"
#include "aries/protocol/issuance/holder_state_machine.hpp"
#include "aries/protocol/issuance/issuer_state_machine.hpp"
#include "aries/protocol/presentation/prover_state_machine.hpp"
#include "aries/protocol/presentation/verifier_state_machine.hpp"
#include "aries/crypto/sodium_interop.hpp"
#include "helpers/fake_anoncreds.hpp"
#include "helpers/outbox.hpp"
using namespace aries::protocol;
using namespace aries::protocol::issuance;
using namespace aries::protocol::presentation;
using namespace aries::protocol::messages;
using aries::protocol::test_helpers::FakeAnoncreds;
using aries::protocol::test_helpers::Outbox;
namespace {
/// Snapshot to bytes and back, as a handle's Serialize/Deserialize would.
template<typename Machine, typename Proto>
Machine Reload(const Machine& machine) {
    auto bytes = SerializeSnapshot(machine.ToProtoState(), "test");
    REQUIRE(bytes.IsOk());
    auto proto = ParseSnapshot<Proto>(bytes.Unwrap(), "test");
    REQUIRE(proto.IsOk());
    auto restored = Machine::FromProtoState(proto.Unwrap());
    REQUIRE(restored.IsOk());
    return std::move(restored).Unwrap();
}
}
TEST_CASE("State persistence - Issuance machines survive a reload", "[snapshot][issuance]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    FakeAnoncreds anoncreds;
    Outbox issuer_out;
    Outbox holder_out;
    const SendMessageFn issuer_send = issuer_out.Sender();
    const SendMessageFn holder_send = holder_out.Sender();

    auto issuer = IssuerStateMachine::Create(
        "issuer-1", "cd:1", CredentialValues::Parse(R"({"name":"Alex"})").Unwrap(), "Transcript");
    auto holder = HolderStateMachine::Create("holder-1");
    const auto check = [&] {
        const auto issuer_copy = Reload<IssuerStateMachine, aries::proto::protocol::IssuerState>(issuer);
        REQUIRE(issuer_copy.GetState() == issuer.GetState());
        REQUIRE(issuer_copy.GetSourceId() == "issuer-1");
        REQUIRE(issuer_copy.GetCredDefId() == "cd:1");
        REQUIRE(issuer_copy.GetCredentialValues().GetRaw() == issuer.GetCredentialValues().GetRaw());
        const auto holder_copy = Reload<HolderStateMachine, aries::proto::protocol::HolderState>(holder);
        REQUIRE(holder_copy.GetState() == holder.GetState());
        REQUIRE(holder_copy.GetThreadId() == holder.GetThreadId());
    };

    check();
    issuer = issuer.Step(issuer_events::SendOffer{&anoncreds}, &issuer_send).Unwrap();
    holder = holder.Step(holder_events::OfferReceived{issuer_out.Last<CredentialOffer>()}).Unwrap();
    check();
    holder = holder.Step(holder_events::SendRequest{&anoncreds, "ProverDid"}, &holder_send).Unwrap();
    issuer = issuer.Step(issuer_events::RequestReceived{holder_out.Last<CredentialRequest>()}).Unwrap();
    check();
    issuer = issuer.Step(issuer_events::SendCredential{&anoncreds}, &issuer_send).Unwrap();
    holder = holder.Step(holder_events::CredentialReceived{issuer_out.Last<Credential>()}).Unwrap();
    check();
    holder = holder.Step(holder_events::StoreCredential{&anoncreds}).Unwrap();
    check();
    holder = holder.Step(holder_events::SendAck{}, &holder_send).Unwrap();
    issuer = issuer.Step(issuer_events::AckReceived{holder_out.Last<CredentialAck>()}).Unwrap();
    check();
    REQUIRE(issuer.StateCode() == IssuerStateCode::Completed);
    REQUIRE(holder.StateCode() == HolderStateCode::Completed);
}
TEST_CASE("State persistence - A restored machine continues the exchange", "[snapshot][issuance]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    FakeAnoncreds anoncreds;
    Outbox outbox;
    const SendMessageFn send = outbox.Sender();
    auto issuer = IssuerStateMachine::Create(
        "issuer-1", "cd:1", CredentialValues::Parse(R"({"name":"Alex"})").Unwrap(), "");
    issuer = issuer.Step(issuer_events::SendOffer{&anoncreds}, &send).Unwrap();
    const auto offer = outbox.Last<CredentialOffer>();

    auto holder = HolderStateMachine::Create("holder-1").Step(holder_events::OfferReceived{offer}).Unwrap();
    const auto restored = Reload<HolderStateMachine, aries::proto::protocol::HolderState>(holder);
    auto requested = restored.Step(holder_events::SendRequest{&anoncreds, "ProverDid"}, &send);
    REQUIRE(requested.IsOk());

    const auto reloaded_issuer = Reload<IssuerStateMachine, aries::proto::protocol::IssuerState>(issuer);
    auto received = reloaded_issuer.Step(issuer_events::RequestReceived{outbox.Last<CredentialRequest>()});
    REQUIRE(received.IsOk());
    REQUIRE(received.Unwrap().StateCode() == IssuerStateCode::RequestReceived);
}
TEST_CASE("State persistence - Presentation machines survive a reload", "[snapshot][presentation]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    FakeAnoncreds anoncreds;
    Outbox verifier_out;
    Outbox prover_out;
    const SendMessageFn verifier_send = verifier_out.Sender();
    const SendMessageFn prover_send = prover_out.Sender();
    REQUIRE(anoncreds.ProverStoreCredential("{}", R"({"values":{"name":{"raw":"Alex","encoded":"1"}}})").IsOk());

    auto data = PresentationRequestData::Create("kyc", R"([{"name":"name"}])", "", R"({"to":1700000000})");
    auto verifier = VerifierStateMachine::Create("verifier-1", data.Unwrap());
    auto prover = ProverStateMachine::Create("prover-1");
    const auto check = [&] {
        const auto verifier_copy = Reload<VerifierStateMachine, aries::proto::protocol::VerifierState>(verifier);
        REQUIRE(verifier_copy.GetState() == verifier.GetState());
        REQUIRE(verifier_copy.GetRequestData() == verifier.GetRequestData());
        REQUIRE(verifier_copy.Status() == verifier.Status());
        const auto prover_copy = Reload<ProverStateMachine, aries::proto::protocol::ProverState>(prover);
        REQUIRE(prover_copy.GetState() == prover.GetState());
    };

    check();
    verifier = verifier.Step(verifier_events::SendRequest{}, &verifier_send).Unwrap();
    prover = prover.Step(prover_events::RequestReceived{verifier_out.Last<PresentationRequest>()}).Unwrap();
    check();
    prover = prover.Step(prover_events::GeneratePresentation{&anoncreds, R"({"attrs":{"attribute_0":{"cred_id":"cred-1"}}})", ""}).Unwrap();
    check();
    prover = prover.Step(prover_events::SendPresentation{}, &prover_send).Unwrap();
    verifier = verifier.Step(verifier_events::PresentationReceived{prover_out.Last<Presentation>()}).Unwrap();
    check();
    verifier = verifier.Step(verifier_events::VerifyPresentation{&anoncreds}, &verifier_send).Unwrap();
    prover = prover.Step(prover_events::AckReceived{verifier_out.Last<PresentationAck>()}).Unwrap();
    check();
    REQUIRE(verifier.Status() == PresentationStatus::Verified);
    REQUIRE(prover.Status() == ExchangeStatus::Success);
}
TEST_CASE("State persistence - Declined and proposed prover states", "[snapshot][presentation]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    Outbox outbox;
    const SendMessageFn send = outbox.Sender();
    auto data = PresentationRequestData::Create("kyc", R"([{"name":"name"}])", "", "");
    PresentationRequest request;
    request.id = NewMessageId();
    request.request_presentations_attach.push_back(
        Attachment::FromContent("libindy-request-presentation-0", data.Unwrap().Serialize()));
    const auto received = ProverStateMachine::Create("prover-1").Step(prover_events::RequestReceived{request}).Unwrap();

    const auto declined = received.Step(prover_events::DeclineRequest{"no"}, &send).Unwrap();
    REQUIRE(Reload<ProverStateMachine, aries::proto::protocol::ProverState>(declined).GetState() == declined.GetState());

    PresentationPreview preview;
    preview.predicates.push_back(PresentationPreviewPredicate{"age", std::nullopt, ">=", 18});
    const auto proposed = received.Step(prover_events::ProposePresentation{preview, "age only"}, &send).Unwrap();
    const auto restored = Reload<ProverStateMachine, aries::proto::protocol::ProverState>(proposed);
    REQUIRE(restored.GetState() == proposed.GetState());
    REQUIRE(restored.StateCode() == ProverStateCode::ProposalSent);
}
TEST_CASE("State persistence - Corrupt snapshots are rejected", "[snapshot]") {
    SECTION("Bytes that are not a snapshot") {
        auto parsed = ParseSnapshot<aries::proto::protocol::IssuerState>(std::string("\xff\xff\xff", 3), "issuer");
        REQUIRE(parsed.UnwrapErr().type == ProtocolFailureType::Decode);
    }
    SECTION("Unknown state codes") {
        aries::proto::protocol::HolderState holder;
        holder.set_state(42);
        REQUIRE(HolderStateMachine::FromProtoState(holder).UnwrapErr().type == ProtocolFailureType::Decode);
        aries::proto::protocol::ProverState prover;
        prover.set_state(0);
        REQUIRE(ProverStateMachine::FromProtoState(prover).UnwrapErr().type == ProtocolFailureType::Decode);
    }
    SECTION("Missing embedded messages") {
        aries::proto::protocol::HolderState holder;
        holder.set_state(static_cast<uint32_t>(HolderStateCode::OfferReceived));
        REQUIRE(HolderStateMachine::FromProtoState(holder).UnwrapErr().type == ProtocolFailureType::Decode);
    }
    SECTION("Embedded message of the wrong kind") {
        aries::proto::protocol::HolderState holder;
        holder.set_state(static_cast<uint32_t>(HolderStateCode::OfferReceived));
        holder.set_offer_message_json(snapshot::EncodeMessage(CredentialAck{"a", Thread::ReplyTo("t"), "OK"}));
        REQUIRE(HolderStateMachine::FromProtoState(holder).UnwrapErr().type == ProtocolFailureType::Decode);
    }
    SECTION("Issuer snapshot with invalid values") {
        aries::proto::protocol::IssuerState issuer;
        issuer.set_state(1);
        issuer.set_credential_values_json("[]");
        REQUIRE(IssuerStateMachine::FromProtoState(issuer).UnwrapErr().type == ProtocolFailureType::Decode);
    }
    SECTION("Completed verifier without a status") {
        REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
        auto data = PresentationRequestData::Create("kyc", "", "", "");
        aries::proto::protocol::VerifierState verifier;
        verifier.set_state(static_cast<uint32_t>(VerifierStateCode::Completed));
        verifier.set_presentation_request_json(data.Unwrap().Serialize());
        Presentation presentation;
        presentation.id = "p";
        presentation.thread = Thread::ReplyTo("t");
        verifier.set_presentation_json(snapshot::EncodeMessage(presentation));
        REQUIRE(VerifierStateMachine::FromProtoState(verifier).UnwrapErr().type == ProtocolFailureType::Decode);
    }
}
