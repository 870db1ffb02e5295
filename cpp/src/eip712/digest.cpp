#include "mintgate/eip712/digest.hpp"

#include <cstddef>
#include <cstring>

#include "mintgate/crypto/keccak.hpp"

namespace mintgate::eip712 {
    namespace {
        using mintgate::core::Hash256;
        using mintgate::core::Status;
        using mintgate::core::StatusCode;
        using mintgate::core::StatusDomain;

        [[nodiscard]] Status keccak_of_literal(const char* s, Hash256* out) noexcept {
            return mintgate::crypto::keccak256(
                {reinterpret_cast<const mintgate::core::u8*>(s), static_cast<u32>(std::strlen(s))}, out);
        }
    } // namespace

    Status domain_typehash(Hash256* out) noexcept {
        if (out == nullptr) {
            return mintgate::core::make_status(StatusDomain::Digest, StatusCode::Invalid);
        }
        return keccak_of_literal(kDomainType, out);
    }

    Status mint_authorization_typehash(Hash256* out) noexcept {
        if (out == nullptr) {
            return mintgate::core::make_status(StatusDomain::Digest, StatusCode::Invalid);
        }
        return keccak_of_literal(kMintWithAuthorizationType, out);
    }

    Status cancel_authorization_typehash(Hash256* out) noexcept {
        if (out == nullptr) {
            return mintgate::core::make_status(StatusDomain::Digest, StatusCode::Invalid);
        }
        return keccak_of_literal(kCancelAuthorizationType, out);
    }

    Word encode_address(const mintgate::core::Address& a) noexcept {
        Word w{};
        std::memcpy(w.b.data() + 12, a.b.data(), a.b.size());
        return w;
    }

    Word encode_u64(u64 v) noexcept {
        Word w{};
        for (size_t i = 0; i < 8; ++i) {
            w.b[31 - i] = static_cast<mintgate::core::u8>((v >> (8 * i)) & 0xffu);
        }
        return w;
    }

    Word encode_u256(const mintgate::core::U256& v) noexcept {
        Word w{};
        w.b = v.b;
        return w;
    }

    Status encode_string(const char* s, Word* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return mintgate::core::make_status(StatusDomain::Digest, StatusCode::Invalid);
        }
        return keccak_of_literal(s, out);
    }

    Status hash_struct(const Hash256& typehash, const Word* fields, u32 count, Hash256* out) noexcept {
        if (out == nullptr || (count > 0 && fields == nullptr)) {
            return mintgate::core::make_status(StatusDomain::Digest, StatusCode::Invalid);
        }

        // Fixed-width structs only; the widest has six members.
        if (count > kMaxStructFields) {
            return mintgate::core::make_status(StatusDomain::Digest, StatusCode::Invalid, count);
        }

        mintgate::core::BufferView parts[kMaxStructFields + 1]{};
        parts[0] = {typehash.b.data(), static_cast<u32>(typehash.b.size())};
        for (u32 i = 0; i < count; ++i) {
            parts[i + 1] = {fields[i].b.data(), static_cast<u32>(fields[i].b.size())};
        }
        return mintgate::crypto::keccak256_parts(parts, count + 1, out);
    }

    Status domain_separator(const Domain& domain, Hash256* out) noexcept {
        if (out == nullptr || domain.name == nullptr) {
            return mintgate::core::make_status(StatusDomain::Digest, StatusCode::Invalid);
        }

        Word fields[3]{};
        const Status s = encode_string(domain.name, &fields[0]);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }
        fields[1] = encode_u64(domain.chain_id);
        fields[2] = encode_address(domain.verifying_contract);

        Hash256 typehash{};
        const Status ts = domain_typehash(&typehash);
        if (!mintgate::core::is_ok(ts)) {
            return ts;
        }
        return hash_struct(typehash, fields, 3, out);
    }

    Status hash_mint_authorization(const MintAuthorization& m, Hash256* out) noexcept {
        const Word fields[6] = {
            encode_address(m.target),
            encode_address(m.recipient),
            encode_u256(m.token_id),
            encode_u256(m.valid_after),
            encode_u256(m.valid_before),
            m.nonce,
        };
        Hash256 typehash{};
        const Status s = mint_authorization_typehash(&typehash);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }
        return hash_struct(typehash, fields, 6, out);
    }

    Status hash_cancel_authorization(const CancelAuthorization& c, Hash256* out) noexcept {
        const Word fields[2] = {
            encode_address(c.authorizer),
            c.nonce,
        };
        Hash256 typehash{};
        const Status s = cancel_authorization_typehash(&typehash);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }
        return hash_struct(typehash, fields, 2, out);
    }

    Status typed_data_digest(const Hash256& domain_separator, const Hash256& struct_hash, Hash256* out) noexcept {
        if (out == nullptr) {
            return mintgate::core::make_status(StatusDomain::Digest, StatusCode::Invalid);
        }

        static constexpr mintgate::core::u8 kPrefix[2] = {0x19, 0x01};
        const mintgate::core::BufferView parts[3] = {
            {kPrefix, static_cast<u32>(sizeof(kPrefix))},
            {domain_separator.b.data(), static_cast<u32>(domain_separator.b.size())},
            {struct_hash.b.data(), static_cast<u32>(struct_hash.b.size())},
        };
        return mintgate::crypto::keccak256_parts(parts, 3, out);
    }

    Status mint_authorization_digest(const Domain& domain, const MintAuthorization& m, Hash256* out) noexcept {
        Hash256 ds{};
        Status s = domain_separator(domain, &ds);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }
        Hash256 sh{};
        s = hash_mint_authorization(m, &sh);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }
        return typed_data_digest(ds, sh, out);
    }

    Status cancel_authorization_digest(const Domain& domain, const CancelAuthorization& c, Hash256* out) noexcept {
        Hash256 ds{};
        Status s = domain_separator(domain, &ds);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }
        Hash256 sh{};
        s = hash_cancel_authorization(c, &sh);
        if (!mintgate::core::is_ok(s)) {
            return s;
        }
        return typed_data_digest(ds, sh, out);
    }
} // namespace mintgate::eip712
