#include "sanctions/payments/payment_state.hpp"

#include <stdexcept>
#include <string>

namespace sn::payments {

bool PaymentStateMachine::canTransition(events::PaymentStatus from, events::PaymentStatus to) noexcept {
    using S = events::PaymentStatus;
    switch (from) {
        case S::Received:
            return to == S::Screening;
        case S::Screening:
            return events::isTerminal(to);
        default:
            return false;
    }
}

events::PaymentStatus PaymentStateMachine::terminalFor(core::Decision decision) noexcept {
    switch (decision) {
        case core::Decision::Clear:  return events::PaymentStatus::Cleared;
        case core::Decision::Review: return events::PaymentStatus::Review;
        case core::Decision::Block:  return events::PaymentStatus::Blocked;
    }
    return events::PaymentStatus::Error;
}

void PaymentStateMachine::advance(events::PaymentStatus next) {
    if (!canTransition(state_, next)) {
        throw std::logic_error(std::string("illegal payment transition ") +
                               events::toString(state_) + " -> " + events::toString(next));
    }
    state_ = next;
}

} // namespace sn::payments
