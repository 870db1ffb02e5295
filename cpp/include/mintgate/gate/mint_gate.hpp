#pragma once

#include <type_traits>

#include "mintgate/core/errors.hpp"
#include "mintgate/core/events.hpp"
#include "mintgate/core/types.hpp"
#include "mintgate/gateway/capabilities.hpp"

namespace mintgate::gate {
    using u64 = mintgate::core::u64;

    // u64, not uint256; a hardcap of 2^64 - 1 never binds.
    struct MintCounterState {
        u64 total_minted{0};
        u64 total_mint_hardcap{0};
    };

    // Not synchronised; the owner serialises access.
    class MintGate {
    public:
        MintGate(const mintgate::gateway::RoleStore& roles,
            mintgate::gateway::MintCapability& minter,
            mintgate::core::EventSink& events,
            u64 hardcap) noexcept;

        // TRUST BOUNDARY: `executor` is taken as already authenticated. The
        // direct path passes the transaction sender, the authorized path the
        // recovered signer. Passing anything else (for instance a relayer, or
        // an address copied from untrusted input) grants that address's
        // minting role to whoever made the call.
        //
        // Checks in order, first failure wins:
        //   executor has kRoleFactoryMinter        Gate/AccessDenied
        //   target is not the zero address         Gate/Invalid
        //   recipient is not the zero address      Gate/Invalid
        //   token_id is nonzero                    Gate/Invalid
        //   total_minted < total_mint_hardcap      Gate/HardcapReached
        // Then counts the mint, calls the mint capability and emits Minted.
        // A failing capability call undoes the count and its status is returned.
        [[nodiscard]] mintgate::core::Status execute_mint(const mintgate::core::Address& executor,
            const mintgate::core::Address& target,
            const mintgate::core::Address& recipient,
            const mintgate::core::U256& token_id) noexcept;

        // Overwrites the hardcap without bounds checks; returns the old value.
        // A value at or below total_minted stops further minting.
        u64 replace_hardcap(u64 new_hardcap) noexcept;

        [[nodiscard]] MintCounterState counters() const noexcept;

    private:
        const mintgate::gateway::RoleStore& roles_;
        mintgate::gateway::MintCapability& minter_;
        mintgate::core::EventSink& events_;
        MintCounterState state_{};
    };

    static_assert(std::is_trivially_copyable_v<MintCounterState>);

} // namespace mintgate::gate
