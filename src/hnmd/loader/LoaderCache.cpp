#include <hnmd/loader/LoaderCache.hpp>

#include <hnmd/log/TaggedLogger.hpp>

#include <algorithm>
#include <exception>
#include <set>
#include <utility>

namespace HN {

namespace {

template <typename Fn>
auto guarded_fetch(Fn&& fn, std::string const& what) -> decltype(fn()) {
    try {
        return fn();
    } catch (std::exception const& ex) {
        return std::unexpected(Error{Error::Code::FetchTransportError, what + " threw: " + ex.what()});
    } catch (...) {
        return std::unexpected(Error{Error::Code::FetchTransportError, what + " threw a non-standard exception"});
    }
}

} // namespace

auto loadStateToString(LoadState state) -> std::string_view {
    switch (state) {
        case LoadState::Requested:
            return "Requested";
        case LoadState::InFlight:
            return "InFlight";
        case LoadState::CachedHit:
            return "CachedHit";
        case LoadState::Resolved:
            return "Resolved";
        case LoadState::Failed:
            return "Failed";
    }
    return "Unknown";
}

auto LoaderCache::load(LoaderKey const& key, FetchOne const& fetch, std::chrono::milliseconds timeout)
    -> Expected<std::optional<Record>> {
    std::shared_ptr<InFlight> handle;
    std::optional<Record>     hit;
    bool                      owner = false;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (auto it = this->entries.find(key.str()); it != this->entries.end()) {
            ++this->hitCount;
            hit = it->second.record;
        } else if (auto flight = this->inFlight.find(key.str()); flight != this->inFlight.end()) {
            handle = flight->second;
            ++this->joinCount;
        } else {
            handle = std::make_shared<InFlight>();
            this->inFlight.emplace(key.str(), handle);
            owner = true;
        }
    }

    this->transition(key, LoadState::Requested);
    if (hit) {
        this->transition(key, LoadState::CachedHit);
        this->transition(key, LoadState::Resolved);
        return hit;
    }
    this->transition(key, LoadState::InFlight);

    if (!owner) {
        hn_log("LoaderCache::load joining in-flight fetch for " + key.str(), "LoaderCache");
        auto outcome = await(*handle, timeout);
        this->settle(key, outcome);
        return outcome;
    }

    hn_log("LoaderCache::load fetching " + key.str(), "LoaderCache");
    ++this->fetchCount;
    ++this->keysFetchedCount;
    auto outcome = guarded_fetch([&] { return fetch(key, timeout); }, "fetch for " + key.str());
    if (!outcome && outcome.error().code == Error::Code::FetchTimeout) {
        hn_log("LoaderCache::load timed out for " + key.str(), "LoaderCache");
        ++this->timeoutCount;
        outcome = std::optional<Record>{};
    } else if (!outcome) {
        hn_log("LoaderCache::load failed for " + key.str() + ": " + describeError(outcome.error()), "LoaderCache", "Error");
        ++this->failureCount;
    }
    this->finish(key.str(), handle, outcome);

    if (outcome && *outcome) {
        // A newer record may already have been cached under this key.
        std::lock_guard<std::mutex> lock(this->mutex);
        if (auto it = this->entries.find(key.str()); it != this->entries.end())
            outcome = std::optional<Record>{it->second.record};
    }
    this->settle(key, outcome);
    return outcome;
}

auto LoaderCache::loadBatch(std::vector<LoaderKey> const& keys, FetchMany const& fetch, std::chrono::milliseconds timeout)
    -> Expected<BatchResult> {
    BatchResult                                                  result;
    std::vector<LoaderKey>                                       hits;
    std::vector<LoaderKey>                                       novel;
    std::vector<std::pair<LoaderKey, std::shared_ptr<InFlight>>> owned;
    std::vector<std::pair<LoaderKey, std::shared_ptr<InFlight>>> joined;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        std::set<std::string>       seen;
        for (auto const& key : keys) {
            if (!seen.insert(key.str()).second)
                continue;
            if (auto it = this->entries.find(key.str()); it != this->entries.end()) {
                ++this->hitCount;
                result.emplace(key.str(), it->second.record);
                hits.push_back(key);
            } else if (auto flight = this->inFlight.find(key.str()); flight != this->inFlight.end()) {
                ++this->joinCount;
                joined.emplace_back(key, flight->second);
            } else {
                auto handle = std::make_shared<InFlight>();
                this->inFlight.emplace(key.str(), handle);
                owned.emplace_back(key, handle);
                novel.push_back(key);
            }
        }
    }

    for (auto const& key : hits) {
        this->transition(key, LoadState::Requested);
        this->transition(key, LoadState::CachedHit);
        this->transition(key, LoadState::Resolved);
    }
    for (auto const& [key, handle] : owned) {
        this->transition(key, LoadState::Requested);
        this->transition(key, LoadState::InFlight);
    }
    for (auto const& [key, handle] : joined) {
        this->transition(key, LoadState::Requested);
        this->transition(key, LoadState::InFlight);
    }

    std::optional<Error> batchError;
    if (!novel.empty()) {
        hn_log("LoaderCache::loadBatch fetching " + std::to_string(novel.size()) + " of " + std::to_string(keys.size()) + " keys", "LoaderCache");
        ++this->fetchCount;
        this->keysFetchedCount += novel.size();
        auto fetched = guarded_fetch([&] { return fetch(novel, timeout); }, "batch fetch");

        bool timedOut = !fetched && fetched.error().code == Error::Code::FetchTimeout;
        if (timedOut) {
            hn_log("LoaderCache::loadBatch timed out", "LoaderCache");
            ++this->timeoutCount;
        } else if (!fetched) {
            hn_log("LoaderCache::loadBatch failed: " + describeError(fetched.error()), "LoaderCache", "Error");
            ++this->failureCount;
            batchError = fetched.error();
        }

        std::map<std::string, Record> newest;
        if (fetched) {
            for (auto const& record : *fetched) {
                auto canonical = LoaderKey::ForRecord(record).str();
                auto it        = newest.find(canonical);
                if (it == newest.end())
                    newest.emplace(canonical, record);
                else if (record.created_at > it->second.created_at)
                    it->second = record;
            }
        }

        std::vector<std::pair<LoaderKey, Expected<std::optional<Record>>>> outcomes;
        for (auto const& [key, handle] : owned) {
            Expected<std::optional<Record>> outcome = std::optional<Record>{};
            if (batchError) {
                outcome = std::unexpected(*batchError);
            } else if (auto it = newest.find(key.str()); it != newest.end()) {
                outcome = std::optional<Record>{it->second};
            }
            this->finish(key.str(), handle, outcome);
            outcomes.emplace_back(key, std::move(outcome));
        }

        {
            std::lock_guard<std::mutex> lock(this->mutex);
            for (auto const& [key, handle] : owned) {
                if (auto it = this->entries.find(key.str()); it != this->entries.end())
                    result.insert_or_assign(key.str(), it->second.record);
            }
        }
        for (auto const& [key, outcome] : outcomes)
            this->settle(key, outcome);
    }

    for (auto const& [key, handle] : joined) {
        auto outcome = await(*handle, timeout);
        if (outcome && *outcome) {
            result.insert_or_assign(key.str(), **outcome);
        } else if (!outcome) {
            hn_log("LoaderCache::loadBatch joined fetch for " + key.str() + " failed: " + describeError(outcome.error()), "LoaderCache");
        }
        this->settle(key, outcome);
    }

    if (batchError)
        return std::unexpected(*batchError);
    return result;
}

auto LoaderCache::invalidate(LoaderKey const& key) -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->entries.erase(key.str()) > 0;
}

auto LoaderCache::setObserver(Observer observer) -> void {
    std::lock_guard<std::mutex> lock(this->stateMutex);
    this->observer = std::move(observer);
}

auto LoaderCache::loadState(LoaderKey const& key) const -> std::optional<LoadState> {
    std::lock_guard<std::mutex> lock(this->stateMutex);
    if (auto it = this->states.find(key.str()); it != this->states.end())
        return it->second;
    return std::nullopt;
}

auto LoaderCache::contains(LoaderKey const& key) const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->entries.contains(key.str());
}

auto LoaderCache::peek(LoaderKey const& key) const -> std::optional<CacheEntry> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (auto it = this->entries.find(key.str()); it != this->entries.end())
        return it->second;
    return std::nullopt;
}

auto LoaderCache::isInFlight(LoaderKey const& key) const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->inFlight.contains(key.str());
}

auto LoaderCache::inFlightCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->inFlight.size();
}

auto LoaderCache::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->entries.size();
}

auto LoaderCache::records() const -> std::vector<Record> {
    std::lock_guard<std::mutex> lock(this->mutex);
    std::vector<Record>         out;
    out.reserve(this->entries.size());
    for (auto const& [canonical, entry] : this->entries)
        out.push_back(entry.record);
    std::sort(out.begin(), out.end(), recordPrecedes);
    return out;
}

auto LoaderCache::stats() const -> LoaderStats {
    LoaderStats stats;
    stats.fetches       = this->fetchCount.load();
    stats.keysFetched   = this->keysFetchedCount.load();
    stats.cacheHits     = this->hitCount.load();
    stats.inFlightJoins = this->joinCount.load();
    stats.timeouts      = this->timeoutCount.load();
    stats.failures      = this->failureCount.load();
    stats.loadsResolved = this->loadsResolvedCount.load();
    stats.loadsFailed   = this->loadsFailedCount.load();
    return stats;
}

auto LoaderCache::storeLocked(LoaderKey const& key, Record const& record) -> void {
    auto it = this->entries.find(key.str());
    if (it != this->entries.end() && it->second.record.created_at >= record.created_at)
        return;
    this->entries.insert_or_assign(key.str(), CacheEntry{key, record, std::chrono::system_clock::now()});
}

auto LoaderCache::finish(std::string const& canonical, std::shared_ptr<InFlight> const& handle, Expected<std::optional<Record>> outcome)
    -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (outcome && *outcome) {
            auto parsed = LoaderKey::Parse(canonical);
            if (parsed)
                this->storeLocked(*parsed, **outcome);
        }
        this->inFlight.erase(canonical);
    }
    {
        std::lock_guard<std::mutex> lock(handle->mutex);
        handle->done = true;
        if (outcome)
            handle->record = *outcome;
        else
            handle->error = outcome.error();
    }
    handle->cv.notify_all();
}

auto LoaderCache::transition(LoaderKey const& key, LoadState state) -> void {
    Observer notify;
    {
        std::lock_guard<std::mutex> lock(this->stateMutex);
        this->states.insert_or_assign(key.str(), state);
        notify = this->observer;
    }
    if (state == LoadState::Resolved)
        ++this->loadsResolvedCount;
    else if (state == LoadState::Failed)
        ++this->loadsFailedCount;
    if (notify)
        notify(key, state);
}

auto LoaderCache::settle(LoaderKey const& key, Expected<std::optional<Record>> const& outcome) -> void {
    this->transition(key, outcome ? LoadState::Resolved : LoadState::Failed);
}

auto LoaderCache::await(InFlight& handle, std::chrono::milliseconds timeout) -> Expected<std::optional<Record>> {
    std::unique_lock<std::mutex> lock(handle.mutex);
    if (timeout > std::chrono::milliseconds::zero()) {
        if (!handle.cv.wait_for(lock, timeout, [&] { return handle.done; }))
            return std::optional<Record>{};
    } else {
        handle.cv.wait(lock, [&] { return handle.done; });
    }
    if (handle.error)
        return std::unexpected(*handle.error);
    return handle.record;
}

} // namespace HN
