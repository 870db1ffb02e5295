#include "mintgate/access/access_registry.hpp"

#include <new>

namespace mintgate::access {
    using mintgate::core::Status;
    using mintgate::core::StatusCode;
    using mintgate::core::StatusDomain;

    AccessRegistry::AccessRegistry(const mintgate::core::Address& self,
        const mintgate::core::Address& owner,
        mintgate::core::EventSink* events)
        : self_(self), events_(events) {
        roles_[owner] = mintgate::gateway::kFullPrivilegesMask;
    }

    u32 AccessRegistry::role_locked(const mintgate::core::Address& who) const noexcept {
        const auto it = roles_.find(who);
        return it == roles_.end() ? 0u : it->second;
    }

    Status AccessRegistry::update_role(const mintgate::core::Address& sender,
        const mintgate::core::Address& op,
        u32 desired,
        u32* actual_out) noexcept {
        u32 actual = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const u32 manager = role_locked(sender);
            if ((manager & mintgate::gateway::kRoleAccessManager) != mintgate::gateway::kRoleAccessManager) {
                return mintgate::core::make_status(StatusDomain::Access, StatusCode::AccessDenied);
            }

            actual = evaluate_by(manager, role_locked(op), desired);
            try {
                roles_[op] = actual;
            } catch (const std::bad_alloc&) {
                return mintgate::core::make_status(StatusDomain::Access, StatusCode::Unavailable);
            }
        }

        if (events_ != nullptr) {
            mintgate::core::Event e{};
            e.kind = mintgate::core::EventKind::RoleUpdated;
            e.actor = sender;
            e.target = op;
            e.old_value = desired;
            e.new_value = actual;
            events_->emit(e);
        }
        if (actual_out != nullptr) {
            *actual_out = actual;
        }
        return mintgate::core::ok_status();
    }

    Status AccessRegistry::update_features(const mintgate::core::Address& sender, u32 desired, u32* actual_out) noexcept {
        return update_role(sender, self_, desired, actual_out);
    }

    u32 AccessRegistry::user_role(const mintgate::core::Address& who) const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return role_locked(who);
    }

    u32 AccessRegistry::features() const noexcept {
        return user_role(self_);
    }

    bool AccessRegistry::has_role(const mintgate::core::Address& who, u32 role) const noexcept {
        return (user_role(who) & role) == role;
    }

    bool AccessRegistry::is_enabled(u32 feature) const noexcept {
        return (features() & feature) == feature;
    }
} // namespace mintgate::access
