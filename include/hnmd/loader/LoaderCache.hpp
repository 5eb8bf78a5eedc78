#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/data/LoaderKey.hpp>
#include <hnmd/data/Record.hpp>

#include <parallel_hashmap/phmap.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace HN {

struct CacheEntry {
    LoaderKey                             key;
    Record                                record;
    std::chrono::system_clock::time_point fetchedAt;
};

// Lifecycle of a single one-shot load as seen by its caller:
// Requested, then InFlight or CachedHit, then Resolved or Failed. A load that
// timed out resolves without a record.
enum class LoadState {
    Requested,
    InFlight,
    CachedHit,
    Resolved,
    Failed
};

[[nodiscard]] auto loadStateToString(LoadState state) -> std::string_view;

struct LoaderStats {
    std::uint64_t fetches        = 0; // fetch function invocations (single and batched)
    std::uint64_t keysFetched    = 0; // keys sent to a fetch function
    std::uint64_t cacheHits      = 0;
    std::uint64_t inFlightJoins  = 0; // callers that attached to another caller's fetch
    std::uint64_t timeouts       = 0;
    std::uint64_t failures       = 0;
    std::uint64_t loadsResolved  = 0; // per caller and key
    std::uint64_t loadsFailed    = 0;
};

/**
 * LoaderCache: deduplicating cache for one-shot fetches keyed by LoaderKey.
 *
 * At most one fetch is outstanding per key: the first caller installs an
 * in-flight handle and runs the fetch, later callers for the same key wait on
 * that handle. A successful record is cached until invalidate(); a newer record
 * (by created_at) replaces an older one, never the reverse.
 *
 * A fetch that reports Error::Code::FetchTimeout is "no result": callers get an
 * empty optional and nothing is cached, so the next load retries. Any other
 * failure is returned to the owner and to every caller waiting on that key.
 */
class LoaderCache {
public:
    using FetchOne    = std::function<Expected<std::optional<Record>>(LoaderKey const&, std::chrono::milliseconds)>;
    using FetchMany   = std::function<Expected<std::vector<Record>>(std::vector<LoaderKey> const&, std::chrono::milliseconds)>;
    using BatchResult = std::map<std::string, Record>;
    // Called for every load state transition, on the thread that caused it.
    using Observer = std::function<void(LoaderKey const&, LoadState)>;

    LoaderCache() = default;
    LoaderCache(LoaderCache const&)            = delete;
    LoaderCache& operator=(LoaderCache const&) = delete;

    [[nodiscard]] auto load(LoaderKey const& key, FetchOne const& fetch, std::chrono::milliseconds timeout)
        -> Expected<std::optional<Record>>;

    // One batched fetch for the keys that are neither cached nor in flight.
    [[nodiscard]] auto loadBatch(std::vector<LoaderKey> const& keys, FetchMany const& fetch, std::chrono::milliseconds timeout)
        -> Expected<BatchResult>;

    auto invalidate(LoaderKey const& key) -> bool;
    auto setObserver(Observer observer) -> void;

    // State reached by the latest load of key.
    [[nodiscard]] auto loadState(LoaderKey const& key) const -> std::optional<LoadState>;

    [[nodiscard]] auto contains(LoaderKey const& key) const -> bool;
    [[nodiscard]] auto peek(LoaderKey const& key) const -> std::optional<CacheEntry>;
    [[nodiscard]] auto isInFlight(LoaderKey const& key) const -> bool;
    [[nodiscard]] auto inFlightCount() const -> std::size_t;
    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto records() const -> std::vector<Record>;
    [[nodiscard]] auto stats() const -> LoaderStats;

private:
    struct InFlight {
        std::mutex              mutex;
        std::condition_variable cv;
        bool                    done = false;
        std::optional<Record>   record;
        std::optional<Error>    error;
    };

    auto storeLocked(LoaderKey const& key, Record const& record) -> void;
    auto finish(std::string const& canonical, std::shared_ptr<InFlight> const& handle, Expected<std::optional<Record>> outcome) -> void;
    auto transition(LoaderKey const& key, LoadState state) -> void;
    auto settle(LoaderKey const& key, Expected<std::optional<Record>> const& outcome) -> void;
    static auto await(InFlight& handle, std::chrono::milliseconds timeout) -> Expected<std::optional<Record>>;

    mutable std::mutex                                           mutex;
    phmap::flat_hash_map<std::string, CacheEntry>                entries;
    phmap::flat_hash_map<std::string, std::shared_ptr<InFlight>> inFlight;

    mutable std::mutex                           stateMutex;
    phmap::flat_hash_map<std::string, LoadState> states;
    Observer                                     observer;

    std::atomic<std::uint64_t> fetchCount{0};
    std::atomic<std::uint64_t> keysFetchedCount{0};
    std::atomic<std::uint64_t> hitCount{0};
    std::atomic<std::uint64_t> joinCount{0};
    std::atomic<std::uint64_t> timeoutCount{0};
    std::atomic<std::uint64_t> failureCount{0};
    std::atomic<std::uint64_t> loadsResolvedCount{0};
    std::atomic<std::uint64_t> loadsFailedCount{0};
};

} // namespace HN
