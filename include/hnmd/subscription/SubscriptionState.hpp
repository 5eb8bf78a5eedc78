#pragma once
#include <hnmd/core/AtomicState.hpp>

#include <string_view>

namespace HN {

// Lifecycle of one continuous filter request
enum class SubscriptionState {
    Opening, // Declared, stream not yet delivering
    Active,  // Receiving batches
    Closing, // Cancel requested, pump still draining
    Closed,  // Stream cancelled and pump finished
    Failed   // The source refused or broke the stream
};

[[nodiscard]] auto subscriptionStateToString(SubscriptionState state) -> std::string_view;

// Thread-safe wrapper for managing subscription state transitions
struct SubscriptionStateAtomic {
    bool activate();   // Opening -> Active
    bool beginClose(); // Opening or Active -> Closing
    bool markClosed(); // Closing -> Closed
    bool markFailed(); // Opening or Active -> Failed

    bool isOpen() const; // Opening or Active
    bool isTerminal() const;
    SubscriptionState get() const;
    std::string_view  toString() const;

private:
    AtomicState<SubscriptionState> state{SubscriptionState::Opening};
};

} // namespace HN
