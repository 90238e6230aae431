#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>

namespace aries::protocol {

struct Constants {
    static constexpr size_t ED_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t ED_25519_SECRET_KEY_SIZE = 64;
    static constexpr size_t ED_25519_SEED_SIZE = 32;
    static constexpr size_t ED_25519_SIGNATURE_SIZE = 64;
    static constexpr size_t X_25519_PUBLIC_KEY_SIZE = 32;
    static constexpr size_t X_25519_PRIVATE_KEY_SIZE = 32;
    static constexpr size_t CONTENT_KEY_SIZE = 32;
    static constexpr size_t XCHACHA_NONCE_SIZE = 24;
    static constexpr size_t BOX_NONCE_SIZE = 24;
    static constexpr size_t AEAD_TAG_SIZE = 16;
    static constexpr size_t DID_SIZE = 16;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t PRESENTATION_NONCE_BYTES = 10;
    static constexpr size_t SIG_DATA_TIMESTAMP_SIZE = 8;
};

struct PackConstants {
    static constexpr std::string_view ENC_XCHACHA = "xchacha20poly1305_ietf";
    static constexpr std::string_view TYP_JWM = "JWM/1.0";
    static constexpr std::string_view ALG_AUTHCRYPT = "Authcrypt";
    static constexpr std::string_view ALG_ANONCRYPT = "Anoncrypt";
};

struct DidDocConstants {
    static constexpr std::string_view CONTEXT = "https://w3id.org/did/v1";
    static constexpr std::string_view KEY_TYPE = "Ed25519VerificationKey2018";
    static constexpr std::string_view KEY_AUTHENTICATION_TYPE = "Ed25519SignatureAuthentication2018";
    static constexpr std::string_view SERVICE_SUFFIX = "indy";
    static constexpr std::string_view SERVICE_TYPE = "IndyAgent";
};

/// Relay-side message status codes.
struct MessageStatusCodes {
    static constexpr std::string_view RECEIVED = "MS-103";
    static constexpr std::string_view REVIEWED = "MS-106";
};

struct ProtocolConstants {
    static constexpr std::chrono::seconds DEFAULT_RELAY_TIMEOUT{30};
    static constexpr uint32_t MAX_HANDLE_ALLOCATION_ATTEMPTS = 16;
    static constexpr size_t MAX_MESSAGE_SIZE = 10 * 1024 * 1024;
    static constexpr size_t MAX_FORWARD_DEPTH = 16;
    static constexpr std::string_view PRESENTATION_REQUEST_VERSION = "1.0";
    static constexpr std::string_view DEFAULT_PRESENTATION_NAME = "proof";
    static constexpr std::string_view ATTRIBUTE_REFERENT_PREFIX = "attribute_";
    static constexpr std::string_view PREDICATE_REFERENT_PREFIX = "predicate_";
    static constexpr std::string_view OFFER_ATTACHMENT_ID = "libindy-cred-offer-0";
    static constexpr std::string_view REQUEST_ATTACHMENT_ID = "libindy-cred-request-0";
    static constexpr std::string_view CREDENTIAL_ATTACHMENT_ID = "libindy-cred-0";
    static constexpr std::string_view PRESENTATION_REQUEST_ATTACHMENT_ID = "libindy-request-presentation-0";
    static constexpr std::string_view PRESENTATION_ATTACHMENT_ID = "libindy-presentation-0";
};

struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view NO_RECIPIENT_KEYS = "Relationship document resolves to no recipient keys";
    static constexpr std::string_view UNKNOWN_HANDLE = "Handle does not reference a live object";
};

}
