#pragma once

#include "mintgate/core/errors.hpp"
#include "mintgate/core/types.hpp"
#include "mintgate/crypto/secp256k1.hpp"

namespace mintgate::auth {
    using Signature = mintgate::crypto::Signature;

    inline constexpr mintgate::core::u8 kRecoveryIdBase = 27;

    // Recovers the address that produced `sig` over `digest`.
    //
    // Fails with Auth/InvalidSignature when v is not 27 or 28, when s is above
    // the secp256k1 half order (rejected, never normalised), when recovery
    // fails, or when it yields the zero address. Says nothing about whether
    // the signer is entitled to anything; that is the caller's check.
    mintgate::core::Status recover_signer(const mintgate::core::Hash256& digest,
        const Signature& sig,
        mintgate::core::Address* out) noexcept;

} // namespace mintgate::auth
