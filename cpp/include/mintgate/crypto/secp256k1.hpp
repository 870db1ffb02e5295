#pragma once

#include <array>
#include <type_traits>

#include "mintgate/core/errors.hpp"
#include "mintgate/core/types.hpp"

namespace mintgate::crypto {
    using u8 = mintgate::core::u8;

    struct PrivateKey {
        std::array<u8, 32> b{};
    };

    // Ethereum-style recoverable signature: v is 27 or 28.
    struct Signature {
        u8 v{0};
        mintgate::core::Hash256 r{};
        mintgate::core::Hash256 s{};
    };

    // floor(n / 2) for the secp256k1 group order n.
    inline constexpr mintgate::core::Hash256 kSecp256k1HalfOrder{{
        0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0x5d, 0x57, 0x6e, 0x73, 0x57, 0xa4, 0x50, 0x1d,
        0xdf, 0xe9, 0x2f, 0x46, 0x68, 0x1b, 0x20, 0xa0,
    }};

    [[nodiscard]] constexpr bool scalar_is_low_s(const mintgate::core::Hash256& s) noexcept {
        return s <= kSecp256k1HalfOrder;
    }

    // Raw public-key recovery. recid is the y parity (0 or 1). Fails with
    // Crypto when r or s is zero or not below n, when r is not the x
    // coordinate of a curve point, or when the result is the point at infinity.
    // Does not apply the low-s rule.
    mintgate::core::Status ecdsa_recover_address(const mintgate::core::Hash256& digest,
        u8 recid,
        const mintgate::core::Hash256& r,
        const mintgate::core::Hash256& s,
        mintgate::core::Address* out) noexcept;

    // keccak256(X || Y)[12:] of the public key d*G.
    mintgate::core::Status derive_address(const PrivateKey& key,
        mintgate::core::Address* out) noexcept;

    // Deterministic signing for tooling and tests: RFC 6979 nonce with
    // HMAC-SHA256 (OpenSSL 3.2+), s normalized to the low half, v from the
    // recovery id that reproduces the signer.
    mintgate::core::Status ecdsa_sign_recoverable(const PrivateKey& key,
        const mintgate::core::Hash256& digest,
        Signature* out) noexcept;

    static_assert(std::is_trivially_copyable_v<PrivateKey>);
    static_assert(std::is_trivially_copyable_v<Signature>);

} // namespace mintgate::crypto
