#include "mintgate/ledger/nonce_ledger.hpp"

#include <new>

namespace mintgate::ledger {
    using mintgate::core::Status;
    using mintgate::core::StatusCode;
    using mintgate::core::StatusDomain;

    size_t NonceKeyHash::operator()(const NonceKey& k) const noexcept {
        // FNV-1a over the authorizer, then the nonce.
        u64 h = 0xcbf29ce484222325ull;
        for (mintgate::core::u8 v : k.authorizer.b) {
            h = (h ^ v) * 0x100000001b3ull;
        }
        for (mintgate::core::u8 v : k.nonce.b) {
            h = (h ^ v) * 0x100000001b3ull;
        }
        return static_cast<size_t>(h);
    }

    NonceLedger::NonceLedger(mintgate::core::EventSink& events) noexcept
        : events_(events) {}

    Status NonceLedger::use_or_cancel(const mintgate::core::Address& authorizer,
        const mintgate::core::Nonce& nonce,
        bool is_cancellation) noexcept {
        const NonceKey key{authorizer, nonce};
        try {
            if (!consumed_.insert(key).second) {
                return mintgate::core::make_status(StatusDomain::Ledger, StatusCode::NonceAlreadyUsed);
            }
        } catch (const std::bad_alloc&) {
            return mintgate::core::make_status(StatusDomain::Ledger, StatusCode::Unavailable);
        }

        mintgate::core::Event e{};
        e.kind = is_cancellation ? mintgate::core::EventKind::NonceCancelled : mintgate::core::EventKind::NonceUsed;
        e.authorizer = authorizer;
        e.nonce = nonce;
        events_.emit(e);
        return mintgate::core::ok_status();
    }

    bool NonceLedger::query_state(const mintgate::core::Address& authorizer,
        const mintgate::core::Nonce& nonce) const noexcept {
        return consumed_.find(NonceKey{authorizer, nonce}) != consumed_.end();
    }

    u64 NonceLedger::consumed_count() const noexcept {
        return static_cast<u64>(consumed_.size());
    }
} // namespace mintgate::ledger
