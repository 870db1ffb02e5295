#include "mintgate/gate/mint_gate.hpp"

namespace mintgate::gate {
    using mintgate::core::Status;
    using mintgate::core::StatusCode;
    using mintgate::core::StatusDomain;

    MintGate::MintGate(const mintgate::gateway::RoleStore& roles,
        mintgate::gateway::MintCapability& minter,
        mintgate::core::EventSink& events,
        u64 hardcap) noexcept
        : roles_(roles), minter_(minter), events_(events) {
        state_.total_mint_hardcap = hardcap;
    }

    Status MintGate::execute_mint(const mintgate::core::Address& executor,
        const mintgate::core::Address& target,
        const mintgate::core::Address& recipient,
        const mintgate::core::U256& token_id) noexcept {
        if (!roles_.has_role(executor, mintgate::gateway::kRoleFactoryMinter)) {
            return mintgate::core::make_status(StatusDomain::Gate, StatusCode::AccessDenied);
        }
        if (mintgate::core::address_is_zero(target)) {
            return mintgate::core::make_status(StatusDomain::Gate, StatusCode::Invalid, 1);
        }
        if (mintgate::core::address_is_zero(recipient)) {
            return mintgate::core::make_status(StatusDomain::Gate, StatusCode::Invalid, 2);
        }
        if (mintgate::core::u256_is_zero(token_id)) {
            return mintgate::core::make_status(StatusDomain::Gate, StatusCode::Invalid, 3);
        }
        if (state_.total_minted >= state_.total_mint_hardcap) {
            return mintgate::core::make_status(StatusDomain::Gate, StatusCode::HardcapReached);
        }

        ++state_.total_minted;
        const Status s = minter_.mint(target, recipient, token_id);
        if (!mintgate::core::is_ok(s)) {
            --state_.total_minted;
            return s;
        }

        mintgate::core::Event e{};
        e.kind = mintgate::core::EventKind::Minted;
        e.actor = executor;
        e.target = target;
        e.recipient = recipient;
        e.token_id = token_id;
        events_.emit(e);
        return mintgate::core::ok_status();
    }

    u64 MintGate::replace_hardcap(u64 new_hardcap) noexcept {
        const u64 old = state_.total_mint_hardcap;
        state_.total_mint_hardcap = new_hardcap;
        return old;
    }

    MintCounterState MintGate::counters() const noexcept {
        return state_;
    }
} // namespace mintgate::gate
