#include <hnmd/subscription/SubscriptionManager.hpp>

#include <hnmd/log/TaggedLogger.hpp>
#include <hnmd/task/Task.hpp>

#include <algorithm>
#include <set>
#include <utility>

namespace HN {

struct SubscriptionManager::FilterEntry {
    std::string                   queryId;
    Filter                        filter;
    SubscriptionStateAtomic       state;
    std::shared_ptr<RecordStream> stream;
    std::mutex                    mutex;
    std::shared_ptr<Task>         task;
};

struct SubscriptionManager::DependencyEntry {
    LoadDependency        dependency;
    std::atomic<bool>     cancelled{false};
    std::mutex            mutex;
    std::set<std::string> requested;
    bool                  running = false;
    bool                  dirty   = false;
    std::shared_ptr<Task> task;
};

struct SubscriptionManager::Forwarder : ChangeSink {
    explicit Forwarder(SubscriptionManager* owner) : owner(owner) {}

    void queryChanged(const std::string& queryId, std::uint64_t) override {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->owner)
            this->owner->onQueryChanged(queryId);
    }

    void detach() {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->owner = nullptr;
    }

    std::mutex           mutex;
    SubscriptionManager* owner;
};

namespace {

auto valid_field(std::string const& field) -> bool {
    return field == "pubkey" || (field.size() == 2 && field[0] == '#');
}

} // namespace

auto extractLoaderKeys(LoadDependency const& dependency, std::vector<Record> const& records) -> std::vector<LoaderKey> {
    std::vector<LoaderKey> keys;
    std::set<std::string>  seen;
    auto                   add = [&](std::string const& owner) {
        if (owner.empty())
            return;
        LoaderKey key{dependency.kind, owner};
        if (seen.insert(key.str()).second)
            keys.push_back(std::move(key));
    };
    for (auto const& record : records) {
        if (dependency.field == "pubkey") {
            add(record.pubkey);
        } else if (valid_field(dependency.field)) {
            for (auto const& value : record.tagValues(dependency.field.substr(1)))
                add(value);
        }
    }
    return keys;
}

SubscriptionManager::SubscriptionManager(DataSource& source, QueryStore& store, LoaderCache& cache, Executor& executor, SubscriptionOptions options)
    : source(source), store(store), cache(cache), executor(executor), options(options), changeSink(std::make_shared<Forwarder>(this)) {
    this->store.subscribe(std::weak_ptr<ChangeSink>(this->changeSink));
}

SubscriptionManager::~SubscriptionManager() {
    hn_log("SubscriptionManager::~SubscriptionManager", "Subscription");
    this->changeSink->detach();
    this->closeAll();

    // Refresh tasks hold `this`; once the executor has shut down nothing is left running.
    std::unique_lock<std::mutex> lock(this->idleMutex);
    while (this->activeRefreshes > 0) {
        if (this->idleCv.wait_for(lock, std::chrono::milliseconds(50), [this] { return this->activeRefreshes == 0; }))
            break;
        if (this->executor.size() == 0)
            break;
    }
}

auto SubscriptionManager::openFilter(std::string const& queryId, Filter const& filter) -> Expected<void> {
    std::shared_ptr<FilterEntry> previous;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (auto it = this->filters.find(queryId); it != this->filters.end()) {
            if (it->second->filter == filter && it->second->state.isOpen())
                return {};
            previous = std::move(it->second);
            this->filters.erase(it);
        }
    }
    if (previous) {
        hn_log("SubscriptionManager::openFilter replacing filter for " + queryId, "Subscription");
        this->closeEntry(*previous);
    }

    if (auto declared = this->store.declareRaw(queryId, filter.limit); !declared)
        return declared;
    if (previous && previous->filter != filter) {
        if (auto cleared = this->store.upsertRaw(queryId, {}, UpsertMode::Replace); !cleared)
            return std::unexpected(cleared.error());
    }

    auto entry     = std::make_shared<FilterEntry>();
    entry->queryId = queryId;
    entry->filter  = filter;

    auto stream = this->source.subscribe(filter);
    if (!stream) {
        hn_log("SubscriptionManager::openFilter " + queryId + " refused: " + describeError(stream.error()), "Subscription", "Error");
        entry->state.markFailed();
        std::lock_guard<std::mutex> lock(this->mutex);
        this->filters[queryId] = std::move(entry);
        return std::unexpected(stream.error());
    }
    entry->stream = std::shared_ptr<RecordStream>(std::move(*stream));

    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->filters[queryId] = entry;
    }
    hn_log("SubscriptionManager::openFilter " + queryId, "Subscription");
    this->pump(entry);
    return {};
}

auto SubscriptionManager::closeFilter(std::string const& queryId) -> Expected<void> {
    std::shared_ptr<FilterEntry> entry;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto                        it = this->filters.find(queryId);
        if (it == this->filters.end())
            return std::unexpected(Error{Error::Code::UnknownQueryReference, "no filter is open for '" + queryId + "'"});
        entry = std::move(it->second);
        this->filters.erase(it);
    }
    this->closeEntry(*entry);
    return {};
}

auto SubscriptionManager::closeAll() -> void {
    std::map<std::string, std::shared_ptr<FilterEntry>>     closing;
    std::map<std::string, std::shared_ptr<DependencyEntry>> cancelling;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        std::swap(closing, this->filters);
        std::swap(cancelling, this->dependencies);
    }
    for (auto& [id, dependency] : cancelling)
        dependency->cancelled = true;
    for (auto& [id, entry] : closing)
        this->closeEntry(*entry);
}

auto SubscriptionManager::state(std::string const& queryId) const -> std::optional<SubscriptionState> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (auto it = this->filters.find(queryId); it != this->filters.end())
        return it->second->state.get();
    return std::nullopt;
}

auto SubscriptionManager::openFilters() const -> std::map<std::string, Filter> {
    std::lock_guard<std::mutex>   lock(this->mutex);
    std::map<std::string, Filter> out;
    for (auto const& [id, entry] : this->filters) {
        if (entry->state.isOpen())
            out.emplace(id, entry->filter);
    }
    return out;
}

auto SubscriptionManager::requestedFilters() const -> std::map<std::string, Filter> {
    std::lock_guard<std::mutex>   lock(this->mutex);
    std::map<std::string, Filter> out;
    for (auto const& [id, entry] : this->filters)
        out.emplace(id, entry->filter);
    return out;
}

auto SubscriptionManager::pump(std::shared_ptr<FilterEntry> const& entry) -> void {
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->state.isOpen())
        return;

    auto task = Task::Create("filter:" + entry->queryId, [this, entry](Task& self) {
        if (self.cancelRequested() || !entry->state.isOpen())
            return;
        auto batch = entry->stream->next(this->options.streamPoll);
        if (!batch) {
            hn_log("Filter " + entry->queryId + " stream failed: " + describeError(batch.error()), "Subscription", "Error");
            entry->state.markFailed();
            return;
        }
        if (!*batch) {
            if (entry->state.beginClose()) {
                hn_log("Filter " + entry->queryId + " stream ended", "Subscription");
                entry->state.markClosed();
            }
            return;
        }
        entry->state.activate();
        if (!(*batch)->empty()) {
            auto merged = this->store.upsertRaw(entry->queryId, **batch);
            if (!merged)
                hn_log("Filter " + entry->queryId + " merge failed: " + describeError(merged.error()), "Subscription", "Error");
        }
        this->pump(entry);
    });
    entry->task = task;
    if (auto error = this->executor.submit(task)) {
        hn_log("Filter " + entry->queryId + " could not be scheduled: " + describeError(*error), "Subscription", "Error");
        task->markFailed();
        entry->state.markFailed();
    }
}

auto SubscriptionManager::closeEntry(FilterEntry& entry) -> void {
    bool closing = entry.state.beginClose();
    if (entry.stream)
        entry.stream->cancel();

    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        task = entry.task;
    }
    if (task) {
        task->requestCancel();
        task->wait();
    }
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        entry.task.reset();
    }
    if (closing)
        entry.state.markClosed();
    hn_log("SubscriptionManager closed filter " + entry.queryId + " (" + std::string{entry.state.toString()} + ")", "Subscription");
}

auto SubscriptionManager::addLoadDependency(LoadDependency const& dependency) -> Expected<void> {
    if (dependency.id.empty() || dependency.targetQuery.empty())
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "load dependency needs an id and a target query"});
    if (!valid_field(dependency.field))
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "load '" + dependency.id + "' has unsupported key field '" + dependency.field + "'"});
    if (!this->store.contains(dependency.sourceQuery))
        return std::unexpected(Error{Error::Code::UnknownQueryReference, "load '" + dependency.id + "' reads undeclared query '" + dependency.sourceQuery + "'"});
    if (auto declared = this->store.declareRaw(dependency.targetQuery); !declared)
        return declared;

    auto entry        = std::make_shared<DependencyEntry>();
    entry->dependency = dependency;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto                        it = this->dependencies.find(dependency.id);
        if (it != this->dependencies.end()) {
            if (it->second->dependency == dependency)
                return {};
            it->second->cancelled = true;
        }
        this->dependencies[dependency.id] = entry;
    }
    hn_log("SubscriptionManager::addLoadDependency " + dependency.id + " " + dependency.sourceQuery + " -> " + dependency.targetQuery, "Subscription");
    this->scheduleRefresh(entry);
    return {};
}

auto SubscriptionManager::removeLoadDependency(std::string const& dependencyId) -> bool {
    std::shared_ptr<DependencyEntry> entry;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto                        it = this->dependencies.find(dependencyId);
        if (it == this->dependencies.end())
            return false;
        entry = std::move(it->second);
        this->dependencies.erase(it);
    }
    entry->cancelled = true;
    return true;
}

auto SubscriptionManager::loadDependencies() const -> std::vector<LoadDependency> {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::vector<LoadDependency> out;
    for (auto const& [id, entry] : this->dependencies)
        out.push_back(entry->dependency);
    return out;
}

auto SubscriptionManager::waitIdle(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(this->idleMutex);
    return this->idleCv.wait_for(lock, timeout, [this] { return this->activeRefreshes == 0; });
}

auto SubscriptionManager::loadStats() const -> LoadStats {
    LoadStats stats;
    stats.cache     = this->cache.stats();
    stats.requested = this->requestedCount.load();
    stats.resolved  = this->resolvedCount.load();
    stats.missing   = this->missingCount.load();
    stats.failed    = this->failedCount.load();
    stats.discarded = this->discardedCount.load();
    return stats;
}

auto SubscriptionManager::onQueryChanged(std::string const& queryId) -> void {
    std::vector<std::shared_ptr<DependencyEntry>> affected;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        for (auto const& [id, entry] : this->dependencies) {
            if (entry->dependency.sourceQuery == queryId)
                affected.push_back(entry);
        }
    }
    for (auto const& entry : affected)
        this->scheduleRefresh(entry);
}

auto SubscriptionManager::scheduleRefresh(std::shared_ptr<DependencyEntry> const& entry) -> void {
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->cancelled)
        return;
    if (entry->running) {
        entry->dirty = true;
        return;
    }
    entry->running = true;
    entry->dirty   = false;
    {
        std::lock_guard<std::mutex> idle(this->idleMutex);
        ++this->activeRefreshes;
    }

    auto task = Task::Create("load:" + entry->dependency.id, [this, entry](Task&) {
        struct Done {
            SubscriptionManager* manager;
            ~Done() { manager->finishRefresh(); }
        } done{this};

        while (true) {
            this->refresh(*entry);
            std::lock_guard<std::mutex> lock(entry->mutex);
            if (!entry->dirty || entry->cancelled) {
                entry->running = false;
                entry->task.reset();
                return;
            }
            entry->dirty = false;
        }
    });
    // Executors hold tasks weakly; the entry owns it until the body finishes.
    entry->task = task;
    if (auto error = this->executor.submit(task)) {
        hn_log("Load " + entry->dependency.id + " could not be scheduled: " + describeError(*error), "Subscription", "Error");
        task->markFailed();
        entry->task.reset();
        entry->running = false;
        std::lock_guard<std::mutex> idle(this->idleMutex);
        --this->activeRefreshes;
        this->idleCv.notify_all();
    }
}

auto SubscriptionManager::finishRefresh() -> void {
    std::lock_guard<std::mutex> lock(this->idleMutex);
    --this->activeRefreshes;
    this->idleCv.notify_all();
}

auto SubscriptionManager::refresh(DependencyEntry& entry) -> void {
    auto const& dependency = entry.dependency;
    auto        snapshot   = this->store.snapshot();
    auto const* sourceQuery = snapshot.find(dependency.sourceQuery);
    if (!sourceQuery)
        return;

    std::vector<LoaderKey> fresh;
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        for (auto& key : extractLoaderKeys(dependency, sourceQuery->items)) {
            if (entry.requested.insert(key.str()).second)
                fresh.push_back(std::move(key));
        }
    }
    if (fresh.empty())
        return;

    this->requestedCount += fresh.size();
    hn_log("Load " + dependency.id + " requesting " + std::to_string(fresh.size()) + " new keys", "Subscription");
    auto fetched = this->cache.loadBatch(
            fresh,
            [this](std::vector<LoaderKey> const& keys, std::chrono::milliseconds timeout) { return this->fetchKeys(keys, timeout); },
            this->options.fetchTimeout);

    std::vector<Record> records;
    {
        std::lock_guard<std::mutex> lock(entry.mutex);
        for (auto const& key : fresh) {
            if (fetched) {
                if (auto it = fetched->find(key.str()); it != fetched->end()) {
                    records.push_back(it->second);
                    continue;
                }
            }
            entry.requested.erase(key.str());
        }
    }
    if (!fetched) {
        hn_log("Load " + dependency.id + " failed: " + describeError(fetched.error()), "Subscription", "Error");
        this->failedCount += fresh.size();
        return;
    }
    this->resolvedCount += records.size();
    this->missingCount += fresh.size() - records.size();

    if (entry.cancelled) {
        hn_log("Load " + dependency.id + " cancelled, dropping " + std::to_string(records.size()) + " records", "Subscription");
        this->discardedCount += records.size();
        return;
    }
    if (records.empty())
        return;
    auto merged = this->store.upsertRaw(dependency.targetQuery, records);
    if (!merged)
        hn_log("Load " + dependency.id + " merge failed: " + describeError(merged.error()), "Subscription", "Error");
}

auto SubscriptionManager::fetchKeys(std::vector<LoaderKey> const& keys, std::chrono::milliseconds timeout) -> Expected<std::vector<Record>> {
    std::set<std::uint32_t> kinds;
    std::set<std::string>   authors;
    std::set<std::string>   identifiers;
    for (auto const& key : keys) {
        kinds.insert(key.kind());
        authors.insert(key.pubkey());
        if (!key.identifier().empty())
            identifiers.insert(key.identifier());
    }
    Filter filter;
    filter.kinds   = std::vector<std::uint32_t>(kinds.begin(), kinds.end());
    filter.authors = std::vector<std::string>(authors.begin(), authors.end());
    if (!identifiers.empty())
        filter.tags["d"] = std::vector<std::string>(identifiers.begin(), identifiers.end());
    return this->source.fetchOnce(filter, timeout);
}

} // namespace HN
