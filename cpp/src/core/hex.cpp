#include "mintgate/core/hex.hpp"

#include <cstddef>
#include <cstring>

namespace mintgate::core {
    namespace {
        [[nodiscard]] int hexval(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
            if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        [[nodiscard]] const char* skip_prefix(const char* s) noexcept {
            if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
                return s + 2;
            }
            return s;
        }

        [[nodiscard]] bool has_prefix(const char* s) noexcept {
            return s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
        }

        [[nodiscard]] Status parse_u256_hex(const char* digits, U256* out) noexcept {
            const size_t n = std::strlen(digits);
            if (n == 0 || n > 64) {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            U256 v{};
            // Walk from the least significant nibble.
            for (size_t i = 0; i < n; ++i) {
                const int d = hexval(digits[n - 1 - i]);
                if (d < 0) {
                    return make_status(StatusDomain::Core, StatusCode::Invalid);
                }
                const size_t byte = 31 - (i / 2);
                if (i % 2 == 0) {
                    v.b[byte] = static_cast<u8>(d);
                } else {
                    v.b[byte] = static_cast<u8>(v.b[byte] | static_cast<u8>(d << 4));
                }
            }
            *out = v;
            return ok_status();
        }

        [[nodiscard]] Status parse_u256_dec(const char* digits, U256* out) noexcept {
            if (digits[0] == '\0') {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            U256 v{};
            for (const char* p = digits; *p != '\0'; ++p) {
                if (*p < '0' || *p > '9') {
                    return make_status(StatusDomain::Core, StatusCode::Invalid);
                }
                u32 carry = static_cast<u32>(*p - '0');
                for (size_t i = 32; i-- > 0;) {
                    const u32 x = static_cast<u32>(v.b[i]) * 10u + carry;
                    v.b[i] = static_cast<u8>(x & 0xffu);
                    carry = x >> 8;
                }
                if (carry != 0) {
                    return make_status(StatusDomain::Core, StatusCode::Invalid);
                }
            }
            *out = v;
            return ok_status();
        }
    } // namespace

    Status hex_decode(const char* s, u8* out, u32 out_len) noexcept {
        if (s == nullptr || (out == nullptr && out_len > 0)) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        const char* digits = skip_prefix(s);
        if (std::strlen(digits) != static_cast<size_t>(out_len) * 2) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        for (u32 i = 0; i < out_len; ++i) {
            const int hi = hexval(digits[2 * i]);
            const int lo = hexval(digits[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                return make_status(StatusDomain::Core, StatusCode::Invalid);
            }
            out[i] = static_cast<u8>((hi << 4) | lo);
        }
        return ok_status();
    }

    void hex_encode(const u8* data, u32 len, char* out) noexcept {
        static constexpr char kDigits[] = "0123456789abcdef";
        for (u32 i = 0; i < len; ++i) {
            out[2 * i] = kDigits[(data[i] >> 4) & 0xf];
            out[2 * i + 1] = kDigits[data[i] & 0xf];
        }
        out[2 * len] = '\0';
    }

    Status parse_address(const char* s, Address* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        Address a{};
        const Status st = hex_decode(s, a.b.data(), static_cast<u32>(a.b.size()));
        if (!is_ok(st)) {
            return st;
        }
        *out = a;
        return ok_status();
    }

    Status parse_hash256(const char* s, Hash256* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        Hash256 h{};
        const Status st = hex_decode(s, h.b.data(), static_cast<u32>(h.b.size()));
        if (!is_ok(st)) {
            return st;
        }
        *out = h;
        return ok_status();
    }

    Status parse_u256(const char* s, U256* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        if (has_prefix(s)) {
            return parse_u256_hex(s + 2, out);
        }
        return parse_u256_dec(s, out);
    }

    void format_address(const Address& a, char* out) noexcept {
        out[0] = '0';
        out[1] = 'x';
        hex_encode(a.b.data(), static_cast<u32>(a.b.size()), out + 2);
    }

    void format_hash256(const Hash256& h, char* out) noexcept {
        out[0] = '0';
        out[1] = 'x';
        hex_encode(h.b.data(), static_cast<u32>(h.b.size()), out + 2);
    }

    void format_u256(const U256& x, char* out) noexcept {
        out[0] = '0';
        out[1] = 'x';
        hex_encode(x.b.data(), static_cast<u32>(x.b.size()), out + 2);
    }
} // namespace mintgate::core
