#include <catch2/catch_test_macros.hpp>
#include "aries/protocol/issuance/issuer_state_machine.hpp"
#include "aries/crypto/sodium_interop.hpp"
#include "helpers/fake_anoncreds.hpp"
#include "helpers/outbox.hpp"
#include <nlohmann/json.hpp>
using namespace aries::protocol;
using namespace aries::protocol::issuance;
using namespace aries::protocol::messages;
using aries::protocol::test_helpers::FakeAnoncreds;
using aries::protocol::test_helpers::Outbox;
namespace {
constexpr std::string_view kCredDefId = "NcYxiDXkpYi6ov5FcYDi1e:3:CL:1:tag";

IssuerStateMachine NewIssuer() {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto values = CredentialValues::Parse(R"({"name":"Alex","age":"28"})");
    REQUIRE(values.IsOk());
    return IssuerStateMachine::Create("issuer-1", std::string(kCredDefId), values.Unwrap(), "Transcript");
}

CredentialRequest RequestFor(const std::string& thread_id, const std::string& cred_def_id) {
    CredentialRequest request;
    request.id = NewMessageId();
    request.thread = Thread::ReplyTo(thread_id);
    const nlohmann::json body = {{"prover_did", "ProverDid"}, {"cred_def_id", cred_def_id}, {"nonce", "1"}};
    request.requests_attach.push_back(Attachment::FromContent("libindy-cred-request-0", body.dump()));
    return request;
}

IssuerStateMachine Advance(const IssuerStateMachine& sm, const IssuerEvent& event, const SendMessageFn* send = nullptr) {
    auto next = sm.Step(event, send);
    REQUIRE(next.IsOk());
    return std::move(next).Unwrap();
}
}
TEST_CASE("IssuerStateMachine - Happy path", "[issuance][issuer][state]") {
    FakeAnoncreds anoncreds;
    Outbox outbox;
    const SendMessageFn send = outbox.Sender();

    auto issuer = NewIssuer();
    REQUIRE(issuer.StateCode() == IssuerStateCode::Initial);
    REQUIRE_FALSE(issuer.GetThreadId().has_value());

    issuer = Advance(issuer, issuer_events::SendOffer{&anoncreds}, &send);
    REQUIRE(issuer.StateCode() == IssuerStateCode::OfferSent);
    const CredentialOffer offer = outbox.Last<CredentialOffer>();
    REQUIRE(issuer.GetThreadId() == offer.id);
    REQUIRE(offer.comment == "Transcript");
    REQUIRE(offer.credential_preview.attributes.size() == 2);
    REQUIRE(offer.offers_attach.front().id == "libindy-cred-offer-0");
    const auto offer_body = nlohmann::json::parse(offer.offers_attach.front().Content().Unwrap());
    REQUIRE(offer_body.at("cred_def_id") == kCredDefId);

    issuer = Advance(issuer, issuer_events::RequestReceived{RequestFor(offer.id, std::string(kCredDefId))}, &send);
    REQUIRE(issuer.StateCode() == IssuerStateCode::RequestReceived);

    issuer = Advance(issuer, issuer_events::SendCredential{&anoncreds}, &send);
    REQUIRE(issuer.StateCode() == IssuerStateCode::CredentialSent);
    const Credential credential = outbox.Last<Credential>();
    REQUIRE(credential.please_ack);
    REQUIRE(credential.thread->IsReplyTo(offer.id));
    const auto credential_body = nlohmann::json::parse(credential.credentials_attach.front().Content().Unwrap());
    REQUIRE(credential_body.at("values").at("name").at("raw") == "Alex");
    REQUIRE(credential_body.at("values").at("age").at("encoded") == "28");
    REQUIRE(credential_body.at("prover_did") == "ProverDid");

    CredentialAck ack;
    ack.id = "ack-1";
    ack.thread = Thread::ReplyTo(offer.id);
    issuer = Advance(issuer, issuer_events::AckReceived{ack});
    REQUIRE(issuer.StateCode() == IssuerStateCode::Completed);
    REQUIRE(issuer.Status() == ExchangeStatus::Success);
    REQUIRE_FALSE(issuer.HasTransitions());
    REQUIRE(outbox.sent.size() == 2);
}
TEST_CASE("IssuerStateMachine - Request validation", "[issuance][issuer][state]") {
    FakeAnoncreds anoncreds;
    Outbox outbox;
    const SendMessageFn send = outbox.Sender();
    const auto offered = Advance(NewIssuer(), issuer_events::SendOffer{&anoncreds}, &send);
    const std::string thread_id = *offered.GetThreadId();

    SECTION("Mismatched credential definition fails with a problem report") {
        auto next = Advance(offered, issuer_events::RequestReceived{RequestFor(thread_id, "other:cred:def")}, &send);
        REQUIRE(next.StateCode() == IssuerStateCode::Failed);
        REQUIRE(next.Status() == ExchangeStatus::Failed);
        const auto& report = outbox.Last<CredentialProblemReport>();
        REQUIRE(report.problem_code == "request-not-accepted");
        REQUIRE(report.thread->IsReplyTo(thread_id));
    }
    SECTION("Request without attachment fails with a problem report") {
        CredentialRequest request;
        request.id = "r";
        request.thread = Thread::ReplyTo(thread_id);
        auto next = Advance(offered, issuer_events::RequestReceived{request}, &send);
        REQUIRE(next.StateCode() == IssuerStateCode::Failed);
    }
    SECTION("Request on another thread is a violation") {
        auto next = offered.Step(issuer_events::RequestReceived{RequestFor("other", std::string(kCredDefId))}, &send);
        REQUIRE(next.UnwrapErr().type == ProtocolFailureType::ProtocolViolation);
    }
    SECTION("Ack on another thread is a violation") {
        auto received = Advance(offered, issuer_events::RequestReceived{RequestFor(thread_id, std::string(kCredDefId))});
        auto sent = Advance(received, issuer_events::SendCredential{&anoncreds}, &send);
        CredentialAck ack;
        ack.thread = Thread::ReplyTo("elsewhere");
        REQUIRE(sent.Step(issuer_events::AckReceived{ack}).UnwrapErr().type == ProtocolFailureType::ProtocolViolation);
    }
}
TEST_CASE("IssuerStateMachine - Failures keep the previous state", "[issuance][issuer][state]") {
    FakeAnoncreds anoncreds;
    Outbox outbox;
    const SendMessageFn send = outbox.Sender();
    const auto issuer = NewIssuer();

    SECTION("Anoncreds failure") {
        anoncreds.FailOffers(true);
        REQUIRE(issuer.Step(issuer_events::SendOffer{&anoncreds}, &send).IsErr());
        REQUIRE(outbox.sent.empty());
    }
    SECTION("Missing anoncreds") {
        REQUIRE(issuer.Step(issuer_events::SendOffer{nullptr}, &send).UnwrapErr().type ==
                ProtocolFailureType::InvalidInput);
    }
    SECTION("Transport failure") {
        outbox.fail = true;
        auto next = issuer.Step(issuer_events::SendOffer{&anoncreds}, &send);
        REQUIRE(next.UnwrapErr().IsRetryable());
        REQUIRE(issuer.StateCode() == IssuerStateCode::Initial);
    }
    SECTION("Out-of-order events") {
        REQUIRE(issuer.Step(issuer_events::SendCredential{&anoncreds}, &send).UnwrapErr().type ==
                ProtocolFailureType::ProtocolViolation);
        REQUIRE(issuer.Step(issuer_events::ProblemReportReceived{}).IsErr());
    }
}
TEST_CASE("IssuerStateMachine - Problem reports and selection", "[issuance][issuer][state]") {
    FakeAnoncreds anoncreds;
    Outbox outbox;
    const SendMessageFn send = outbox.Sender();
    const auto offered = Advance(NewIssuer(), issuer_events::SendOffer{&anoncreds}, &send);
    const std::string thread_id = *offered.GetThreadId();

    CredentialProblemReport report;
    report.id = "pr";
    report.thread = Thread::ReplyTo(thread_id);
    report.problem_code = "offer-declined";

    SECTION("Report fails the exchange and ends it") {
        auto failed = Advance(offered, issuer_events::ProblemReportReceived{report});
        REQUIRE(failed.StateCode() == IssuerStateCode::Failed);
        REQUIRE(failed.GetThreadId() == thread_id);
        REQUIRE(failed.Step(issuer_events::SendCredential{&anoncreds}, &send).IsErr());
        REQUIRE_FALSE(failed.FindMessageToHandle(Inbox{{"0000000001", report}}).has_value());
    }
    SECTION("Only threaded requests and reports are selected") {
        Inbox inbox;
        inbox.emplace("0000000001", RequestFor("another-thread", std::string(kCredDefId)));
        inbox.emplace("0000000002", CredentialAck{"ack", Thread::ReplyTo(thread_id), "OK"});
        inbox.emplace("0000000003", RequestFor(thread_id, std::string(kCredDefId)));
        auto selected = offered.FindMessageToHandle(inbox);
        REQUIRE(selected.has_value());
        REQUIRE(selected->uid == "0000000003");
        auto event = IssuerStateMachine::EventFromMessage(selected->message);
        REQUIRE(std::holds_alternative<issuer_events::RequestReceived>(*event));
    }
    SECTION("Inbound kinds the issuer never consumes") {
        REQUIRE_FALSE(IssuerStateMachine::EventFromMessage(CredentialOffer{}).has_value());
        REQUIRE_FALSE(IssuerStateMachine::EventFromMessage(PresentationAck{}).has_value());
    }
}
