#include "mintgate/core/errors.hpp"

namespace mintgate::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "ok";
            case StatusCode::Unknown: return "unknown";
            case StatusCode::Invalid: return "invalid_input";
            case StatusCode::NotFound: return "not_found";
            case StatusCode::Conflict: return "conflict";
            case StatusCode::AccessDenied: return "access_denied";
            case StatusCode::HardcapReached: return "hardcap_reached";
            case StatusCode::FeatureDisabled: return "feature_disabled";
            case StatusCode::SignatureWindowInvalid: return "signature_window_invalid";
            case StatusCode::InvalidSignature: return "invalid_signature";
            case StatusCode::AuthorizationMismatch: return "authorization_mismatch";
            case StatusCode::NonceAlreadyUsed: return "nonce_already_used";
            case StatusCode::Crypto: return "crypto";
            case StatusCode::Io: return "io";
            case StatusCode::Unavailable: return "unavailable";
        }
        return "unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "core";
            case StatusDomain::Crypto: return "crypto";
            case StatusDomain::Digest: return "digest";
            case StatusDomain::Auth: return "auth";
            case StatusDomain::Ledger: return "ledger";
            case StatusDomain::Gate: return "gate";
            case StatusDomain::Gateway: return "gateway";
            case StatusDomain::Access: return "access";
            case StatusDomain::Token: return "token";
            case StatusDomain::Db: return "db";
            case StatusDomain::Cli: return "cli";
            case StatusDomain::External: return "external";
        }
        return "unknown";
    }
} // namespace mintgate::core
