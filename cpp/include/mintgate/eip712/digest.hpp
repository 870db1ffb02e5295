#pragma once

#include <type_traits>

#include "mintgate/core/errors.hpp"
#include "mintgate/core/types.hpp"

namespace mintgate::eip712 {
    using u32 = mintgate::core::u32;
    using u64 = mintgate::core::u64;

    // One ABI-encoded 32-byte slot of a struct encoding.
    using Word = mintgate::core::Hash256;

    // Canonical type strings. Every signature already handed out depends on
    // these bytes; they must never change.
    inline constexpr char kDomainType[] =
        "EIP712Domain(string name,uint256 chainId,address verifyingContract)";
    inline constexpr char kMintWithAuthorizationType[] =
        "MintWithAuthorization(address contract,address to,uint256 id,"
        "uint256 validAfter,uint256 validBefore,bytes32 nonce)";
    inline constexpr char kCancelAuthorizationType[] =
        "CancelAuthorization(address authorizer,bytes32 nonce)";

    struct Domain {
        const char* name{nullptr};
        u64 chain_id{0};
        mintgate::core::Address verifying_contract{};
    };

    struct MintAuthorization {
        mintgate::core::Address target{};
        mintgate::core::Address recipient{};
        mintgate::core::U256 token_id{};
        // uint256 seconds; compared against the block time in full width.
        mintgate::core::U256 valid_after{};
        mintgate::core::U256 valid_before{};
        mintgate::core::Nonce nonce{};
    };

    struct CancelAuthorization {
        mintgate::core::Address authorizer{};
        mintgate::core::Nonce nonce{};
    };

    // Upper bound on the fields passed to hash_struct.
    inline constexpr u32 kMaxStructFields = 8;

    // keccak256 of the type strings above.
    mintgate::core::Status domain_typehash(mintgate::core::Hash256* out) noexcept;
    mintgate::core::Status mint_authorization_typehash(mintgate::core::Hash256* out) noexcept;
    mintgate::core::Status cancel_authorization_typehash(mintgate::core::Hash256* out) noexcept;

    [[nodiscard]] Word encode_address(const mintgate::core::Address& a) noexcept;
    [[nodiscard]] Word encode_u64(u64 v) noexcept;
    [[nodiscard]] Word encode_u256(const mintgate::core::U256& v) noexcept;

    // Dynamic `string`/`bytes` members are encoded as the keccak256 of their content.
    mintgate::core::Status encode_string(const char* s, Word* out) noexcept;

    // keccak256(typehash || fields[0] || ... || fields[count-1])
    mintgate::core::Status hash_struct(const mintgate::core::Hash256& typehash,
        const Word* fields,
        u32 count,
        mintgate::core::Hash256* out) noexcept;

    mintgate::core::Status domain_separator(const Domain& domain, mintgate::core::Hash256* out) noexcept;

    mintgate::core::Status hash_mint_authorization(const MintAuthorization& m, mintgate::core::Hash256* out) noexcept;
    mintgate::core::Status hash_cancel_authorization(const CancelAuthorization& c, mintgate::core::Hash256* out) noexcept;

    // keccak256(0x19 0x01 || domain_separator || struct_hash)
    mintgate::core::Status typed_data_digest(const mintgate::core::Hash256& domain_separator,
        const mintgate::core::Hash256& struct_hash,
        mintgate::core::Hash256* out) noexcept;

    mintgate::core::Status mint_authorization_digest(const Domain& domain,
        const MintAuthorization& m,
        mintgate::core::Hash256* out) noexcept;

    mintgate::core::Status cancel_authorization_digest(const Domain& domain,
        const CancelAuthorization& c,
        mintgate::core::Hash256* out) noexcept;

    static_assert(std::is_trivially_copyable_v<Domain>);
    static_assert(std::is_trivially_copyable_v<MintAuthorization>);
    static_assert(std::is_trivially_copyable_v<CancelAuthorization>);

} // namespace mintgate::eip712
