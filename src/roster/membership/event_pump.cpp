/**
 * @file event_pump.cpp
 * @brief EventPump and single-event dispatch.
 */
#include "roster/membership/event_pump.hpp"

#include <utility>

namespace roster::membership {

    Result dispatch(MembershipRegistry& registry, const MembershipEvent& ev) {
        switch (ev.kind) {
            case EventKind::Discovered:
                return registry.onNodeDiscovered(ev.address, ev.capabilities, ev.version);
            case EventKind::Lost:
                return registry.onNodeLost(ev.address);
            case EventKind::HealthCheckFailed:
                return registry.onHealthCheckFailed(ev.address);
        }
        return {};
    }

    roster_detail::expected<EventPump, roster::mem::SpscError>
    EventPump::with_capacity(std::size_t capacity_pow2) noexcept {
        auto q = Queue::with_capacity(capacity_pow2);
        if (!q) return roster_detail::unexpected(q.error());
        return EventPump(std::move(*q));
    }

    bool EventPump::submit(MembershipEvent&& ev) noexcept {
        return queue_.push(std::move(ev));
    }

    bool EventPump::submit(const MembershipEvent& ev) {
        return queue_.push(ev);
    }

    roster_detail::expected<std::size_t, MembershipErr>
    EventPump::drain(MembershipRegistry& registry, std::size_t max) {
        std::size_t handled = 0;
        MembershipEvent ev;
        while (handled < max && queue_.pop(ev)) {
            ++handled;
            if (auto r = dispatch(registry, ev); !r) {
                return roster_detail::unexpected(r.error());
            }
        }
        return handled;
    }

} // namespace roster::membership
