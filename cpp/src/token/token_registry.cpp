#include "mintgate/token/token_registry.hpp"

#include <new>

namespace mintgate::token {
    using mintgate::core::Status;
    using mintgate::core::StatusCode;
    using mintgate::core::StatusDomain;

    TokenRegistry::TokenRegistry(const mintgate::core::Address& minter) noexcept : minter_(minter) {}

    Status TokenRegistry::register_token(const mintgate::core::Address& contract,
        const mintgate::gateway::RoleStore& roles) noexcept {
        if (mintgate::core::address_is_zero(contract)) {
            return mintgate::core::make_status(StatusDomain::Token, StatusCode::Invalid);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            if (!collections_.emplace(contract, Collection{&roles, {}}).second) {
                return mintgate::core::make_status(StatusDomain::Token, StatusCode::Conflict);
            }
        } catch (const std::bad_alloc&) {
            return mintgate::core::make_status(StatusDomain::Token, StatusCode::Unavailable);
        }
        return mintgate::core::ok_status();
    }

    Status TokenRegistry::mint(const mintgate::core::Address& target,
        const mintgate::core::Address& to,
        const mintgate::core::U256& token_id) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = collections_.find(target);
        if (it == collections_.end()) {
            return mintgate::core::make_status(StatusDomain::Token, StatusCode::NotFound);
        }
        if (!it->second.roles->has_role(minter_, mintgate::gateway::kRoleTokenCreator)) {
            return mintgate::core::make_status(StatusDomain::Token, StatusCode::AccessDenied);
        }
        if (mintgate::core::address_is_zero(to)) {
            return mintgate::core::make_status(StatusDomain::Token, StatusCode::Invalid);
        }
        try {
            if (!it->second.owners.emplace(token_id, to).second) {
                return mintgate::core::make_status(StatusDomain::Token, StatusCode::Conflict);
            }
        } catch (const std::bad_alloc&) {
            return mintgate::core::make_status(StatusDomain::Token, StatusCode::Unavailable);
        }
        return mintgate::core::ok_status();
    }

    Status TokenRegistry::owner_of(const mintgate::core::Address& contract,
        const mintgate::core::U256& token_id,
        mintgate::core::Address* out) const noexcept {
        if (out == nullptr) {
            return mintgate::core::make_status(StatusDomain::Token, StatusCode::Invalid);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = collections_.find(contract);
        if (it == collections_.end()) {
            return mintgate::core::make_status(StatusDomain::Token, StatusCode::NotFound);
        }
        const auto owner = it->second.owners.find(token_id);
        if (owner == it->second.owners.end()) {
            return mintgate::core::make_status(StatusDomain::Token, StatusCode::NotFound);
        }
        *out = owner->second;
        return mintgate::core::ok_status();
    }

    Status TokenRegistry::total_supply(const mintgate::core::Address& contract, u64* out) const noexcept {
        if (out == nullptr) {
            return mintgate::core::make_status(StatusDomain::Token, StatusCode::Invalid);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = collections_.find(contract);
        if (it == collections_.end()) {
            return mintgate::core::make_status(StatusDomain::Token, StatusCode::NotFound);
        }
        *out = static_cast<u64>(it->second.owners.size());
        return mintgate::core::ok_status();
    }

    bool TokenRegistry::is_registered(const mintgate::core::Address& contract) const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return collections_.find(contract) != collections_.end();
    }
} // namespace mintgate::token
