#pragma once

#include <mutex>
#include <type_traits>
#include <vector>

#include "mintgate/core/types.hpp"

namespace mintgate::core {

    enum class EventKind : u8 {
        HardcapUpdated = 1,
        Minted = 2,
        NonceUsed = 3,
        NonceCancelled = 4,
        RoleUpdated = 5,
    };

    // Flat record; fields not carried by a kind stay zero.
    //   HardcapUpdated: actor, old_value, new_value
    //   Minted:         actor (executor), target, recipient, token_id
    //   NonceUsed:      authorizer, nonce
    //   NonceCancelled: authorizer, nonce
    //   RoleUpdated:    actor, target (operator), old_value (requested), new_value (actual)
    struct Event {
        EventKind kind{EventKind::Minted};
        Address actor{};
        Address target{};
        Address recipient{};
        Address authorizer{};
        U256 token_id{};
        Nonce nonce{};
        u64 old_value{0};
        u64 new_value{0};
    };

    [[nodiscard]] const char* event_kind_name(EventKind kind) noexcept;

    class EventSink {
    public:
        virtual ~EventSink() = default;
        virtual void emit(const Event& e) noexcept = 0;
    };

    // In-memory sink; keeps every event in emission order.
    class EventLog final : public EventSink {
    public:
        void emit(const Event& e) noexcept override;

        [[nodiscard]] std::vector<Event> snapshot() const;
        [[nodiscard]] size_t size() const noexcept;
        [[nodiscard]] u64 dropped() const noexcept;
        void clear() noexcept;

    private:
        mutable std::mutex mutex_;
        std::vector<Event> events_;
        u64 dropped_{0};
    };

    static_assert(std::is_trivially_copyable_v<Event>);

} // namespace mintgate::core
