#pragma once
#include <atomic>
#include <initializer_list>

namespace HN {

// Enum-valued state shared between threads and moved only by compare-and-swap.
template <typename State>
class AtomicState {
public:
    explicit AtomicState(State initial) : current(initial) {}

    AtomicState(AtomicState const&)            = delete;
    AtomicState& operator=(AtomicState const&) = delete;

    // from -> to; false when the state was anything else.
    auto advance(State from, State to) -> bool {
        return this->current.compare_exchange_strong(from, to, std::memory_order_acq_rel);
    }

    // Any of `from` -> to.
    auto advanceFrom(std::initializer_list<State> from, State to) -> bool {
        State seen = this->get();
        while (oneOf(seen, from)) {
            if (this->current.compare_exchange_weak(seen, to, std::memory_order_acq_rel))
                return true;
        }
        return false;
    }

    [[nodiscard]] auto get() const -> State { return this->current.load(std::memory_order_acquire); }
    [[nodiscard]] auto in(std::initializer_list<State> states) const -> bool { return oneOf(this->get(), states); }

private:
    static auto oneOf(State state, std::initializer_list<State> states) -> bool {
        for (auto candidate : states) {
            if (candidate == state)
                return true;
        }
        return false;
    }

    std::atomic<State> current;
};

} // namespace HN
