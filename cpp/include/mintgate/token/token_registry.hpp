#pragma once

#include <map>
#include <mutex>

#include "mintgate/core/errors.hpp"
#include "mintgate/core/types.hpp"
#include "mintgate/gateway/capabilities.hpp"

namespace mintgate::token {
    using u64 = mintgate::core::u64;

    // In-process non-fungible collections keyed by contract address. mint()
    // is called as `minter` (the gateway contract), which must hold
    // kRoleTokenCreator on the target collection's access list.
    class TokenRegistry final : public mintgate::gateway::MintCapability {
    public:
        explicit TokenRegistry(const mintgate::core::Address& minter) noexcept;

        // `roles` is the collection's access list and must outlive the registry.
        // Token/Invalid if `contract` is zero, Token/Conflict if a collection
        // already lives there.
        [[nodiscard]] mintgate::core::Status register_token(const mintgate::core::Address& contract,
            const mintgate::gateway::RoleStore& roles) noexcept;

        // Token/NotFound       unknown collection
        // Token/AccessDenied   minter lacks kRoleTokenCreator on the collection
        // Token/Invalid        zero recipient
        // Token/Conflict       token id already minted
        [[nodiscard]] mintgate::core::Status mint(const mintgate::core::Address& target,
            const mintgate::core::Address& to,
            const mintgate::core::U256& token_id) noexcept override;

        [[nodiscard]] mintgate::core::Status owner_of(const mintgate::core::Address& contract,
            const mintgate::core::U256& token_id,
            mintgate::core::Address* out) const noexcept;

        [[nodiscard]] mintgate::core::Status total_supply(const mintgate::core::Address& contract,
            u64* out) const noexcept;

        [[nodiscard]] bool is_registered(const mintgate::core::Address& contract) const noexcept;

    private:
        struct Collection {
            const mintgate::gateway::RoleStore* roles{nullptr};
            std::map<mintgate::core::U256, mintgate::core::Address> owners;
        };

        const mintgate::core::Address minter_;
        mutable std::mutex mutex_;
        std::map<mintgate::core::Address, Collection> collections_;
    };

} // namespace mintgate::token
