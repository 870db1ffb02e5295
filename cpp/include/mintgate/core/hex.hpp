#pragma once

#include "mintgate/core/errors.hpp"
#include "mintgate/core/types.hpp"

namespace mintgate::core {

    inline constexpr u32 kAddressHexChars = 2 + 2 * 20;
    inline constexpr u32 kWordHexChars = 2 + 2 * 32;

    // Decodes exactly `out_len` bytes. An optional "0x"/"0X" prefix is accepted.
    [[nodiscard]] Status hex_decode(const char* s, u8* out, u32 out_len) noexcept;

    // Writes 2*len lowercase hex digits plus a terminating NUL; no prefix.
    void hex_encode(const u8* data, u32 len, char* out) noexcept;

    [[nodiscard]] Status parse_address(const char* s, Address* out) noexcept;
    [[nodiscard]] Status parse_hash256(const char* s, Hash256* out) noexcept;

    // "0x" prefixed hex (up to 64 digits, left-padded) or plain decimal.
    [[nodiscard]] Status parse_u256(const char* s, U256* out) noexcept;

    // Writes "0x" + hex; out must hold kAddressHexChars + 1 bytes.
    void format_address(const Address& a, char* out) noexcept;

    // Writes "0x" + hex; out must hold kWordHexChars + 1 bytes.
    void format_hash256(const Hash256& h, char* out) noexcept;
    void format_u256(const U256& x, char* out) noexcept;

} // namespace mintgate::core
