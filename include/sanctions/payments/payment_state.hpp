#pragma once

#include "sanctions/core/types.hpp"
#include "sanctions/events/event_types.hpp"

namespace sn::payments {

// received -> screening -> {cleared, review, blocked, error}
class PaymentStateMachine final {
public:
    PaymentStateMachine() = default;

    events::PaymentStatus state() const noexcept { return state_; }
    bool isTerminal() const noexcept { return events::isTerminal(state_); }

    // Throws std::logic_error on a transition the lifecycle does not allow
    void advance(events::PaymentStatus next);

    static bool canTransition(events::PaymentStatus from, events::PaymentStatus to) noexcept;
    static events::PaymentStatus terminalFor(core::Decision decision) noexcept;

private:
    events::PaymentStatus state_{events::PaymentStatus::Received};
};

} // namespace sn::payments
