#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/data/Filter.hpp>
#include <hnmd/data/LoaderKey.hpp>
#include <hnmd/loader/LoaderCache.hpp>
#include <hnmd/query/ChangeSink.hpp>
#include <hnmd/query/QueryStore.hpp>
#include <hnmd/source/DataSource.hpp>
#include <hnmd/subscription/SubscriptionState.hpp>
#include <hnmd/task/Executor.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace HN {

struct SubscriptionOptions {
    std::chrono::milliseconds fetchTimeout{5000};
    std::chrono::milliseconds streamPoll{100};
};

// "For every record of sourceQuery, load the record of `kind` owned by the
// value of `field`, and merge what comes back into targetQuery."
// `field` is "pubkey" (the record author) or "#<letter>" (every value of that tag).
struct LoadDependency {
    std::string   id;
    std::string   sourceQuery;
    std::uint32_t kind  = 0;
    std::string   field = "pubkey";
    std::string   targetQuery;

    bool operator==(LoadDependency const&) const = default;
};

// Distinct keys implied by records, in first-seen order.
[[nodiscard]] auto extractLoaderKeys(LoadDependency const& dependency, std::vector<Record> const& records) -> std::vector<LoaderKey>;

struct LoadStats {
    LoaderStats   cache;
    std::uint64_t requested = 0; // keys handed to the loader
    std::uint64_t resolved  = 0; // keys that produced a record
    std::uint64_t missing   = 0; // keys the source had nothing for within the timeout
    std::uint64_t failed    = 0; // keys whose fetch failed
    std::uint64_t discarded = 0; // records dropped because their dependency was cancelled
};

/**
 * SubscriptionManager: owns continuous filter requests and one-shot loads.
 *
 * Every open filter is pumped by a chain of Tasks on the executor, one
 * RecordStream::next() per Task, so filters share workers with load refreshes.
 * Load dependencies listen for version bumps of their source query and issue
 * only keys they have not requested before; keys that failed or produced
 * nothing are requested again on the next bump.
 *
 * closeFilter() and the destructor wait for the filter's pump Task and must
 * not be called from a Task running on the same executor.
 */
class SubscriptionManager {
public:
    SubscriptionManager(DataSource& source, QueryStore& store, LoaderCache& cache, Executor& executor, SubscriptionOptions options = {});
    ~SubscriptionManager();

    SubscriptionManager(SubscriptionManager const&)            = delete;
    SubscriptionManager& operator=(SubscriptionManager const&) = delete;

    // Declares queryId as a raw query capped at filter.limit and starts pumping.
    // Reopening with a different filter closes the old stream and clears the query.
    // Reopening a failed or ended request with the same filter keeps its items.
    auto openFilter(std::string const& queryId, Filter const& filter) -> Expected<void>;
    auto closeFilter(std::string const& queryId) -> Expected<void>;
    auto closeAll() -> void;

    [[nodiscard]] auto state(std::string const& queryId) const -> std::optional<SubscriptionState>;
    [[nodiscard]] auto openFilters() const -> std::map<std::string, Filter>;
    // Last filter requested per query, whatever the state of its stream.
    [[nodiscard]] auto requestedFilters() const -> std::map<std::string, Filter>;

    auto addLoadDependency(LoadDependency const& dependency) -> Expected<void>;
    // Cancels the dependency; loads already in flight still fill the cache.
    auto removeLoadDependency(std::string const& dependencyId) -> bool;
    [[nodiscard]] auto loadDependencies() const -> std::vector<LoadDependency>;

    // Blocks until no dependency refresh is queued or running.
    auto waitIdle(std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto loadStats() const -> LoadStats;

private:
    struct FilterEntry;
    struct DependencyEntry;
    struct Forwarder;

    auto pump(std::shared_ptr<FilterEntry> const& entry) -> void;
    auto closeEntry(FilterEntry& entry) -> void;
    auto scheduleRefresh(std::shared_ptr<DependencyEntry> const& entry) -> void;
    auto refresh(DependencyEntry& entry) -> void;
    auto finishRefresh() -> void;
    auto onQueryChanged(std::string const& queryId) -> void;
    auto fetchKeys(std::vector<LoaderKey> const& keys, std::chrono::milliseconds timeout) -> Expected<std::vector<Record>>;

    DataSource&         source;
    QueryStore&         store;
    LoaderCache&        cache;
    Executor&           executor;
    SubscriptionOptions options;

    mutable std::mutex                                      mutex;
    std::map<std::string, std::shared_ptr<FilterEntry>>     filters;
    std::map<std::string, std::shared_ptr<DependencyEntry>> dependencies;

    std::mutex              idleMutex;
    std::condition_variable idleCv;
    std::size_t             activeRefreshes = 0;

    std::atomic<std::uint64_t> requestedCount{0};
    std::atomic<std::uint64_t> resolvedCount{0};
    std::atomic<std::uint64_t> missingCount{0};
    std::atomic<std::uint64_t> failedCount{0};
    std::atomic<std::uint64_t> discardedCount{0};

    std::shared_ptr<Forwarder> changeSink;
};

} // namespace HN
