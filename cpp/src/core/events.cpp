#include "mintgate/core/events.hpp"

#include <new>

namespace mintgate::core {
    const char* event_kind_name(EventKind kind) noexcept {
        switch (kind) {
            case EventKind::HardcapUpdated: return "HardcapUpdated";
            case EventKind::Minted: return "Minted";
            case EventKind::NonceUsed: return "NonceUsed";
            case EventKind::NonceCancelled: return "NonceCancelled";
            case EventKind::RoleUpdated: return "RoleUpdated";
        }
        return "Unknown";
    }

    void EventLog::emit(const Event& e) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            events_.push_back(e);
        } catch (const std::bad_alloc&) {
            ++dropped_;
        }
    }

    std::vector<Event> EventLog::snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t EventLog::size() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    u64 EventLog::dropped() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    void EventLog::clear() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }
} // namespace mintgate::core
