#include <catch2/catch_test_macros.hpp>
#include "helpers/agent_fixture.hpp"
#include "aries/protocol/exchange_registry.hpp"
#include "aries/protocol/nonce.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace aries::protocol;
using namespace aries::protocol::test_helpers;
using issuance::HolderStateCode;
using issuance::IssuerStateCode;

namespace {
    constexpr uint32_t Value(const IssuerStateCode code) { return static_cast<uint32_t>(code); }
    constexpr uint32_t Value(const HolderStateCode code) { return static_cast<uint32_t>(code); }

    struct HandlePair {
        uint32_t faber = 0;
        uint32_t alice = 0;
    };

    /// Runs the connection handshake between two registries on the calling thread.
    HandlePair ConnectRegistries(ExchangeRegistry& faber, ExchangeRegistry& alice, const std::string& label) {
        HandlePair pair;
        pair.faber = faber.CreateConnection(label).Unwrap();
        REQUIRE(faber.Connect(pair.faber).IsOk());
        const std::string invitation = faber.GetInviteDetails(pair.faber).Unwrap();
        pair.alice = alice.CreateConnectionWithInvite(label, invitation).Unwrap();
        REQUIRE(alice.Connect(pair.alice).IsOk());
        REQUIRE(faber.UpdateConnectionState(pair.faber).IsOk());
        REQUIRE(alice.UpdateConnectionState(pair.alice).IsOk());
        REQUIRE(faber.UpdateConnectionState(pair.faber).IsOk());
        return pair;
    }

    /// One issuance over an established pair; false on the first failed step.
    bool IssueOnce(ExchangeRegistry& faber, ExchangeRegistry& alice, const HandlePair& pair, const int index) {
        const std::string values = R"({"name":"Alice","serial":")" + std::to_string(index) + R"("})";
        auto issuer = faber.CreateIssuerCredential("serial-" + std::to_string(index), "cd:1", values, "");
        if (issuer.IsErr() || faber.IssuerSendOffer(issuer.Unwrap(), pair.faber).IsErr()) {
            return false;
        }
        auto offers = alice.GetCredentialOffers(pair.alice);
        if (offers.IsErr() || offers.Unwrap().size() != 1) {
            return false;
        }
        auto holder = alice.CreateHolderCredential(pair.alice, "serial", offers.Unwrap().front().first);
        if (holder.IsErr() || alice.HolderSendRequest(holder.Unwrap(), pair.alice).IsErr()) {
            return false;
        }
        auto received = faber.IssuerUpdateState(issuer.Unwrap(), pair.faber);
        if (received.IsErr() || received.Unwrap() != Value(IssuerStateCode::RequestReceived)) {
            return false;
        }
        if (faber.IssuerSendCredential(issuer.Unwrap(), pair.faber).IsErr()) {
            return false;
        }
        auto stored = alice.HolderUpdateState(holder.Unwrap(), pair.alice);
        if (stored.IsErr() || stored.Unwrap() != Value(HolderStateCode::Completed)) {
            return false;
        }
        auto acked = faber.IssuerUpdateState(issuer.Unwrap(), pair.faber);
        return acked.IsOk() && acked.Unwrap() == Value(IssuerStateCode::Completed);
    }
}

TEST_CASE("Concurrency - Parallel nonce generation", "[concurrency][nonce]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    constexpr int THREAD_COUNT = 16;
    constexpr int NONCES_PER_THREAD = 500;

    std::unordered_set<std::string> nonces;
    std::mutex nonces_mutex;
    std::atomic<int> failures{0};
    std::atomic<int> invalid{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < NONCES_PER_THREAD; ++i) {
                auto nonce = NonceGenerator::NextPresentationNonce();
                if (nonce.IsErr()) {
                    failures.fetch_add(1);
                    continue;
                }
                if (!NonceGenerator::IsValidPresentationNonce(nonce.Unwrap())) {
                    invalid.fetch_add(1);
                }
                std::lock_guard lock(nonces_mutex);
                nonces.insert(nonce.Unwrap());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(invalid.load() == 0);
    REQUIRE(nonces.size() == static_cast<size_t>(THREAD_COUNT * NONCES_PER_THREAD));
}

TEST_CASE("Concurrency - Independent issuances share one registry", "[concurrency][registry][issuance]") {
    constexpr int PAIR_COUNT = 8;
    TestNetwork network;
    const auto faber_agent = network.CreateAgent("faber");
    const auto alice_agent = network.CreateAgent("alice");
    auto faber = ExchangeRegistry::Create(faber_agent.context).Unwrap();
    auto alice = ExchangeRegistry::Create(alice_agent.context).Unwrap();

    std::vector<HandlePair> pairs;
    pairs.reserve(PAIR_COUNT);
    for (int i = 0; i < PAIR_COUNT; ++i) {
        pairs.push_back(ConnectRegistries(*faber, *alice, "pair-" + std::to_string(i)));
    }

    std::atomic<int> completed{0};
    std::vector<std::thread> threads;
    threads.reserve(PAIR_COUNT);
    for (int i = 0; i < PAIR_COUNT; ++i) {
        threads.emplace_back([&, i]() {
            if (IssueOnce(*faber, *alice, pairs[static_cast<size_t>(i)], i)) {
                completed.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(completed.load() == PAIR_COUNT);
    REQUIRE(alice_agent.anoncreds->StoredCredentialCount() == static_cast<size_t>(PAIR_COUNT));
}

TEST_CASE("Concurrency - Contended handle", "[concurrency][registry]") {
    TestNetwork network;
    const auto faber_agent = network.CreateAgent("faber");
    const auto alice_agent = network.CreateAgent("alice");
    auto faber = ExchangeRegistry::Create(faber_agent.context).Unwrap();
    auto alice = ExchangeRegistry::Create(alice_agent.context).Unwrap();
    const auto pair = ConnectRegistries(*faber, *alice, "contended");

    const uint32_t issuer = faber->CreateIssuerCredential("contended", "cd:1", R"({"name":"Alice"})", "").Unwrap();
    REQUIRE(faber->IssuerSendOffer(issuer, pair.faber).IsOk());
    const auto uid = alice->GetCredentialOffers(pair.alice).Unwrap().front().first;
    const uint32_t holder = alice->CreateHolderCredential(pair.alice, "contended", uid).Unwrap();
    REQUIRE(alice->HolderSendRequest(holder, pair.alice).IsOk());

    SECTION("Many pollers handle the request exactly once") {
        constexpr int THREAD_COUNT = 12;
        std::atomic<int> errors{0};
        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                auto state = faber->IssuerUpdateState(issuer, pair.faber);
                if (state.IsErr() || state.Unwrap() != Value(IssuerStateCode::RequestReceived)) {
                    errors.fetch_add(1);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        REQUIRE(errors.load() == 0);
        REQUIRE(faber->IssuerSendCredential(issuer, pair.faber).IsOk());
        REQUIRE(alice->HolderUpdateState(holder, pair.alice).Unwrap() == Value(HolderStateCode::Completed));
        REQUIRE(alice_agent.anoncreds->StoredCredentialCount() == 1);
    }
    SECTION("Release races with readers") {
        constexpr int READER_COUNT = 8;
        std::atomic<bool> released{false};
        std::atomic<int> unexpected{0};
        std::vector<std::thread> readers;
        readers.reserve(READER_COUNT);
        for (int t = 0; t < READER_COUNT; ++t) {
            readers.emplace_back([&]() {
                for (int i = 0; i < 200; ++i) {
                    auto state = faber->GetIssuerState(issuer);
                    if (state.IsOk()) {
                        continue;
                    }
                    if (state.UnwrapErr().type != ProtocolFailureType::InvalidHandle || !released.load()) {
                        unexpected.fetch_add(1);
                    }
                }
            });
        }
        released.store(true);
        const auto release = faber->ReleaseIssuerCredential(issuer);
        for (auto& reader : readers) {
            reader.join();
        }
        REQUIRE(release.IsOk());
        REQUIRE(unexpected.load() == 0);
        REQUIRE(faber->GetIssuerState(issuer).UnwrapErr().type == ProtocolFailureType::InvalidHandle);
    }
}
