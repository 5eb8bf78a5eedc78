#pragma once
#include <hnmd/core/Error.hpp>

#include <chrono>
#include <cstddef>

namespace HN {

struct RuntimeOptions {
    std::size_t               workers = 4;
    std::chrono::milliseconds renderDebounce{16};
    std::chrono::milliseconds fetchTimeout{5000};
    std::chrono::milliseconds streamPoll{100};

    /**
     * Overrides `defaults` from the environment:
     *  - HNMD_WORKERS: data context worker count (at least 1)
     *  - HNMD_RENDER_DEBOUNCE_MS: coalescing window for render requests
     *  - HNMD_FETCH_TIMEOUT_MS: one-shot load timeout
     *  - HNMD_STREAM_POLL_MS: longest wait of a single stream read
     * A variable that is set but not a non-negative integer is an
     * InvalidConfiguration error.
     */
    [[nodiscard]] static auto FromEnvironment(RuntimeOptions defaults) -> Expected<RuntimeOptions>;
    [[nodiscard]] static auto FromEnvironment() -> Expected<RuntimeOptions> { return FromEnvironment(RuntimeOptions{}); }
};

} // namespace HN
