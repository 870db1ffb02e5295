#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <compare>

namespace mintgate::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Seconds since the unix epoch, as seen by the execution environment.
    using UnixTime = u64;

    struct Hash256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(const Hash256&, const Hash256&) noexcept = default;
        friend constexpr auto operator<=>(const Hash256&, const Hash256&) noexcept = default;
    };
    static_assert(sizeof(Hash256) == 32);

    // Opaque single-use value chosen by the authorizer (bytes32).
    using Nonce = Hash256;

    // 256-bit unsigned integer, big-endian.
    struct U256 {
        std::array<u8, 32> b{};
        friend constexpr bool operator==(const U256&, const U256&) noexcept = default;
        friend constexpr auto operator<=>(const U256&, const U256&) noexcept = default;
    };
    static_assert(sizeof(U256) == 32);

    struct Address {
        std::array<u8, 20> b{};
        friend constexpr bool operator==(const Address&, const Address&) noexcept = default;
        friend constexpr auto operator<=>(const Address&, const Address&) noexcept = default;
    };
    static_assert(sizeof(Address) == 20);

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] constexpr bool address_is_zero(const Address& a) noexcept {
        for (u8 v : a.b) {
            if (v != 0) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] constexpr bool u256_is_zero(const U256& x) noexcept {
        for (u8 v : x.b) {
            if (v != 0) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] constexpr U256 u256_from_u64(u64 v) noexcept {
        U256 out{};
        for (size_t i = 0; i < 8; ++i) {
            out.b[31 - i] = static_cast<u8>((v >> (8 * i)) & 0xffu);
        }
        return out;
    }

    // Block context of one call. The host authenticates `sender`; `now` and
    // `chain_id` are read live on every call.
    struct ExecContext {
        Address sender{};
        UnixTime now{0};
        u64 chain_id{0};
    };

    static_assert(std::is_trivially_copyable_v<Hash256>);
    static_assert(std::is_trivially_copyable_v<U256>);
    static_assert(std::is_trivially_copyable_v<Address>);
    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<ExecContext>);
    static_assert(std::is_standard_layout_v<ExecContext>);

} // namespace mintgate::core
