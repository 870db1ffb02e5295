#pragma once

#include "mintgate/core/errors.hpp"
#include "mintgate/core/types.hpp"

namespace mintgate::crypto {
    using u8 = mintgate::core::u8;
    using u32 = mintgate::core::u32;
    using u64 = mintgate::core::u64;

    // Pre-standard Keccak padding (0x01), as used by Ethereum; not FIPS-202 SHA3-256.
    // Backed by the OpenSSL "KECCAK-256" digest (default provider, 3.2+).
    inline constexpr u32 kKeccak256Rate = 136;

    // Fails with Unavailable when the loaded OpenSSL providers lack KECCAK-256.
    mintgate::core::Status keccak256(mintgate::core::BufferView data, mintgate::core::Hash256* out) noexcept;

    // keccak256(parts[0] || ... || parts[count-1])
    mintgate::core::Status keccak256_parts(const mintgate::core::BufferView* parts,
        u32 count,
        mintgate::core::Hash256* out) noexcept;

} // namespace mintgate::crypto
