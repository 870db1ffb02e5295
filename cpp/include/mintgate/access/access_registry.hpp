#pragma once

#include <map>
#include <mutex>

#include "mintgate/core/errors.hpp"
#include "mintgate/core/events.hpp"
#include "mintgate/core/types.hpp"
#include "mintgate/gateway/capabilities.hpp"

namespace mintgate::access {
    using u32 = mintgate::core::u32;

    // Bitmask role store. Features are the role mask held by `self` (the
    // gateway's own address), so enabling a feature is a role update on it.
    class AccessRegistry final : public mintgate::gateway::RoleStore, public mintgate::gateway::FeatureStore {
    public:
        // `owner` starts with every bit; `events` may be null.
        AccessRegistry(const mintgate::core::Address& self,
            const mintgate::core::Address& owner,
            mintgate::core::EventSink* events);

        // Requires kRoleAccessManager on `sender`. The result is
        // evaluate_by(role(sender), role(op), desired); `actual_out` may be null.
        [[nodiscard]] mintgate::core::Status update_role(const mintgate::core::Address& sender,
            const mintgate::core::Address& op,
            u32 desired,
            u32* actual_out) noexcept;

        [[nodiscard]] mintgate::core::Status update_features(const mintgate::core::Address& sender,
            u32 desired,
            u32* actual_out) noexcept;

        [[nodiscard]] u32 user_role(const mintgate::core::Address& who) const noexcept;
        [[nodiscard]] u32 features() const noexcept;

        [[nodiscard]] bool has_role(const mintgate::core::Address& who, u32 role) const noexcept override;
        [[nodiscard]] bool is_enabled(u32 feature) const noexcept override;

        // Bits of `desired` that `manager` holds are set or cleared in `target`;
        // all other bits of `target` are kept as they are.
        [[nodiscard]] static constexpr u32 evaluate_by(u32 manager, u32 target, u32 desired) noexcept {
            target |= manager & desired;
            target &= mintgate::gateway::kFullPrivilegesMask ^ (manager & (mintgate::gateway::kFullPrivilegesMask ^ desired));
            return target;
        }

    private:
        [[nodiscard]] u32 role_locked(const mintgate::core::Address& who) const noexcept;

        const mintgate::core::Address self_;
        mintgate::core::EventSink* events_;
        mutable std::mutex mutex_;
        std::map<mintgate::core::Address, u32> roles_;
    };

} // namespace mintgate::access
