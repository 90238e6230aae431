#pragma once
#include "aries/core/result.hpp"
#include "aries/core/failures.hpp"
#include <string>
namespace aries::protocol::interfaces {
using protocol::Result;
using protocol::ProtocolFailure;
struct CredentialRequestBundle {
    std::string request_json;
    std::string request_metadata_json;
};
/// Anonymous-credential collaborator. Every payload is opaque JSON owned by
/// the implementation; the state machines only carry it between parties.
///
/// VerifierVerifyProof must check the proof against the full presentation
/// request, including its nonce. Ok(false) means the proof is well formed but
/// does not verify.
class IAnoncreds {
public:
    virtual ~IAnoncreds() = default;
    [[nodiscard]] virtual Result<std::string, ProtocolFailure> IssuerCreateCredentialOffer(
        const std::string& cred_def_id) = 0;
    [[nodiscard]] virtual Result<std::string, ProtocolFailure> IssuerCreateCredential(
        const std::string& offer_json,
        const std::string& request_json,
        const std::string& credential_values_json) = 0;
    [[nodiscard]] virtual Result<CredentialRequestBundle, ProtocolFailure> ProverCreateCredentialRequest(
        const std::string& prover_did,
        const std::string& offer_json) = 0;
    /// Returns the wallet id of the stored credential.
    [[nodiscard]] virtual Result<std::string, ProtocolFailure> ProverStoreCredential(
        const std::string& request_metadata_json,
        const std::string& credential_json) = 0;
    /// Credentials per referent that could satisfy the request:
    /// {"attrs": {"<referent>": [{"cred_info": {...}}]}, "predicates": {...}}
    [[nodiscard]] virtual Result<std::string, ProtocolFailure> ProverRetrieveCredentials(
        const std::string& presentation_request_json) = 0;
    [[nodiscard]] virtual Result<std::string, ProtocolFailure> ProverCreateProof(
        const std::string& presentation_request_json,
        const std::string& selected_credentials_json,
        const std::string& self_attested_attrs_json) = 0;
    [[nodiscard]] virtual Result<bool, ProtocolFailure> VerifierVerifyProof(
        const std::string& presentation_request_json,
        const std::string& proof_json) = 0;
};
}
