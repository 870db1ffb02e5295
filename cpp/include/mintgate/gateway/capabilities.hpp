#pragma once

#include "mintgate/core/errors.hpp"
#include "mintgate/core/types.hpp"

namespace mintgate::gateway {
    using u32 = mintgate::core::u32;

    // Feature and role identifiers share one 32-bit mask space.
    inline constexpr u32 kFeatureMintingWithAuth = 0x0000'0001u;
    inline constexpr u32 kRoleFactoryMinter = 0x0001'0000u;
    inline constexpr u32 kRoleHardcapManager = 0x0002'0000u;
    // Held on a collection's access list by the address allowed to mint into it.
    inline constexpr u32 kRoleTokenCreator = 0x0004'0000u;
    inline constexpr u32 kRoleAccessManager = 0x8000'0000u;
    inline constexpr u32 kFullPrivilegesMask = 0xffff'ffffu;

    class RoleStore {
    public:
        virtual ~RoleStore() = default;
        // True when `who` holds every bit of `role`.
        [[nodiscard]] virtual bool has_role(const mintgate::core::Address& who, u32 role) const noexcept = 0;
    };

    class FeatureStore {
    public:
        virtual ~FeatureStore() = default;
        [[nodiscard]] virtual bool is_enabled(u32 feature) const noexcept = 0;
    };

    // Mint primitive of the token contract at `target`. Either fully succeeds
    // or leaves no trace and returns the reason.
    class MintCapability {
    public:
        virtual ~MintCapability() = default;
        [[nodiscard]] virtual mintgate::core::Status mint(const mintgate::core::Address& target,
            const mintgate::core::Address& to,
            const mintgate::core::U256& token_id) noexcept = 0;
    };

} // namespace mintgate::gateway
