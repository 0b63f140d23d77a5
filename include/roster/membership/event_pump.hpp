#pragma once
/**
 * @file event_pump.hpp
 * @brief Hand-off of transport events to the single dispatch context.
 * @details The transport's delivery thread is the only producer (submit);
 *          the dispatch context is the only consumer (drain). Events reach the
 *          registry one at a time, in arrival order.
 */

#include <cstddef>
#include <limits>

#include "roster/compat/expected.hpp"
#include "roster/mem/spsc_queue.hpp"
#include "roster/membership/event.hpp"
#include "roster/membership/membership_registry.hpp"

namespace roster::membership {

/// Route one event to the matching registry entry point.
Result dispatch(MembershipRegistry& registry, const MembershipEvent& ev);

/** @class EventPump
 *  @brief SPSC ring of MembershipEvent between transport and registry.
 */
class EventPump final {
public:
    using Queue = roster::mem::SpscQueue<MembershipEvent>;

    /// Build a pump around a ring of @p capacity_pow2 slots.
    static roster_detail::expected<EventPump, roster::mem::SpscError>
    with_capacity(std::size_t capacity_pow2) noexcept;

    /**
     * @brief Enqueue an event (producer thread only).
     * @return false if the ring is full; @p ev is left intact so the caller
     *         can decide whether to retry.
     */
    bool submit(MembershipEvent&& ev) noexcept;
    bool submit(const MembershipEvent& ev);

    /**
     * @brief Dispatch up to @p max queued events (consumer thread only).
     * @return Number of events dispatched, or the first registry error. The
     *         failing event is consumed; later events stay queued.
     */
    roster_detail::expected<std::size_t, MembershipErr>
    drain(MembershipRegistry& registry,
          std::size_t max = std::numeric_limits<std::size_t>::max());

    [[nodiscard]] bool empty() const noexcept { return queue_.empty(); }
    [[nodiscard]] std::size_t pending() const noexcept { return queue_.approx_size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return queue_.capacity(); }

private:
    explicit EventPump(Queue q) noexcept : queue_(std::move(q)) {}

    Queue queue_;
};

} // namespace roster::membership
