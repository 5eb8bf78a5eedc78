#include <hnmd/subscription/SubscriptionState.hpp>

namespace HN {

auto subscriptionStateToString(SubscriptionState state) -> std::string_view {
    switch (state) {
        case SubscriptionState::Opening:
            return "Opening";
        case SubscriptionState::Active:
            return "Active";
        case SubscriptionState::Closing:
            return "Closing";
        case SubscriptionState::Closed:
            return "Closed";
        case SubscriptionState::Failed:
            return "Failed";
    }
    return "Unknown";
}

bool SubscriptionStateAtomic::activate() {
    return this->state.advance(SubscriptionState::Opening, SubscriptionState::Active);
}

bool SubscriptionStateAtomic::beginClose() {
    return this->state.advanceFrom({SubscriptionState::Opening, SubscriptionState::Active}, SubscriptionState::Closing);
}

bool SubscriptionStateAtomic::markClosed() {
    return this->state.advance(SubscriptionState::Closing, SubscriptionState::Closed);
}

bool SubscriptionStateAtomic::markFailed() {
    return this->state.advanceFrom({SubscriptionState::Opening, SubscriptionState::Active}, SubscriptionState::Failed);
}

SubscriptionState SubscriptionStateAtomic::get() const {
    return this->state.get();
}

bool SubscriptionStateAtomic::isOpen() const {
    return this->state.in({SubscriptionState::Opening, SubscriptionState::Active});
}

bool SubscriptionStateAtomic::isTerminal() const {
    return this->state.in({SubscriptionState::Closed, SubscriptionState::Failed});
}

std::string_view SubscriptionStateAtomic::toString() const {
    return subscriptionStateToString(this->get());
}

} // namespace HN
