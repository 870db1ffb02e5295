#pragma once

#include <cstddef>
#include <unordered_set>

#include "mintgate/core/errors.hpp"
#include "mintgate/core/events.hpp"
#include "mintgate/core/types.hpp"

namespace mintgate::ledger {
    using u64 = mintgate::core::u64;

    struct NonceKey {
        mintgate::core::Address authorizer{};
        mintgate::core::Nonce nonce{};
        friend constexpr bool operator==(const NonceKey&, const NonceKey&) noexcept = default;
    };

    struct NonceKeyHash {
        [[nodiscard]] size_t operator()(const NonceKey& k) const noexcept;
    };

    // Consumed (authorizer, nonce) pairs. Entries are only ever added.
    // Not synchronised; the owner serialises access.
    class NonceLedger {
    public:
        explicit NonceLedger(mintgate::core::EventSink& events) noexcept;

        // Marks the pair consumed and emits NonceUsed or NonceCancelled.
        // Ledger/NonceAlreadyUsed if it was consumed before; nothing changes then.
        [[nodiscard]] mintgate::core::Status use_or_cancel(const mintgate::core::Address& authorizer,
            const mintgate::core::Nonce& nonce,
            bool is_cancellation) noexcept;

        [[nodiscard]] bool query_state(const mintgate::core::Address& authorizer,
            const mintgate::core::Nonce& nonce) const noexcept;

        [[nodiscard]] u64 consumed_count() const noexcept;

    private:
        mintgate::core::EventSink& events_;
        std::unordered_set<NonceKey, NonceKeyHash> consumed_;
    };

} // namespace mintgate::ledger
