#include "mintgate/auth/recover.hpp"

namespace mintgate::auth {
    namespace {
        [[nodiscard]] mintgate::core::Status invalid_signature(mintgate::core::u32 aux = 0) noexcept {
            return mintgate::core::make_status(mintgate::core::StatusDomain::Auth,
                mintgate::core::StatusCode::InvalidSignature, aux);
        }
    } // namespace

    mintgate::core::Status recover_signer(const mintgate::core::Hash256& digest,
        const Signature& sig,
        mintgate::core::Address* out) noexcept {
        if (out == nullptr) {
            return mintgate::core::make_status(mintgate::core::StatusDomain::Auth, mintgate::core::StatusCode::Invalid);
        }
        if (sig.v != kRecoveryIdBase && sig.v != kRecoveryIdBase + 1) {
            return invalid_signature(1);
        }
        if (!mintgate::crypto::scalar_is_low_s(sig.s)) {
            return invalid_signature(2);
        }

        mintgate::core::Address signer{};
        const mintgate::core::Status s = mintgate::crypto::ecdsa_recover_address(
            digest, static_cast<mintgate::core::u8>(sig.v - kRecoveryIdBase), sig.r, sig.s, &signer);
        if (s.code == mintgate::core::StatusCode::Unavailable) {
            return s;
        }
        if (!mintgate::core::is_ok(s)) {
            return invalid_signature(3);
        }
        if (mintgate::core::address_is_zero(signer)) {
            return invalid_signature(4);
        }

        *out = signer;
        return mintgate::core::ok_status();
    }
} // namespace mintgate::auth
