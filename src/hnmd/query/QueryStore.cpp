#include <hnmd/query/QueryStore.hpp>

#include <hnmd/log/TaggedLogger.hpp>

#include <parallel_hashmap/phmap.h>

#include <algorithm>
#include <utility>

namespace HN {

namespace {

auto newer_of(Record const& lhs, Record const& rhs) -> Record const& {
    if (lhs.created_at != rhs.created_at)
        return lhs.created_at > rhs.created_at ? lhs : rhs;
    if (lhs == rhs)
        return lhs;
    auto lhsText = canonicalText(recordToJson(lhs));
    auto rhsText = canonicalText(recordToJson(rhs));
    [[maybe_unused]] Error conflict{Error::Code::MergeConflict, "record " + lhs.id + " has two payloads at created_at " + std::to_string(lhs.created_at)};
    hn_log(describeError(conflict), "QueryStore", "Error");
    return lhsText >= rhsText ? lhs : rhs;
}

auto ordered_unique(std::vector<Record> const& current, std::vector<Record> const& incoming) -> std::vector<Record> {
    phmap::flat_hash_map<std::string, Record> byId;
    byId.reserve(current.size() + incoming.size());
    for (auto const* source : {&current, &incoming}) {
        for (auto const& record : *source) {
            auto [it, inserted] = byId.try_emplace(record.id, record);
            if (!inserted)
                it->second = newer_of(it->second, record);
        }
    }
    std::vector<Record> out;
    out.reserve(byId.size());
    for (auto& [id, record] : byId)
        out.push_back(std::move(record));
    std::sort(out.begin(), out.end(), recordPrecedes);
    return out;
}

auto unknown_query(std::string const& queryId) -> Error {
    return Error{Error::Code::UnknownQueryReference, "query '" + queryId + "' was never declared"};
}

} // namespace

auto mergeRecords(std::vector<Record> const& current, std::vector<Record> const& incoming) -> std::vector<Record> {
    return ordered_unique(current, incoming);
}

QuerySnapshot::QuerySnapshot(Map queries, std::uint64_t revision)
    : queries(std::move(queries)), storeRevision(revision) {}

auto QuerySnapshot::find(std::string const& queryId) const -> Query const* {
    auto it = this->queries.find(queryId);
    return it == this->queries.end() ? nullptr : it->second.get();
}

auto QuerySnapshot::contains(std::string const& queryId) const -> bool {
    return this->queries.contains(queryId);
}

auto QuerySnapshot::version(std::string const& queryId) const -> std::optional<std::uint64_t> {
    if (auto const* query = this->find(queryId))
        return query->version;
    return std::nullopt;
}

auto QuerySnapshot::toJson() const -> Value {
    Value out = Value::object();
    for (auto const& [id, query] : this->queries)
        out[id] = query->toJson();
    return out;
}

auto QueryStore::declareRaw(std::string const& queryId, std::optional<std::size_t> limit) -> Expected<void> {
    return this->declare(queryId, Query::Kind::Raw, limit);
}

auto QueryStore::declareDerived(std::string const& queryId) -> Expected<void> {
    return this->declare(queryId, Query::Kind::Derived, std::nullopt);
}

auto QueryStore::declare(std::string const& queryId, Query::Kind kind, std::optional<std::size_t> limit) -> Expected<void> {
    if (queryId.empty())
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "query id must not be empty"});

    std::unique_lock<std::shared_mutex> lock(this->mutex);
    auto                                it = this->queries.find(queryId);
    if (it == this->queries.end()) {
        auto query   = std::make_shared<Query>();
        query->id    = queryId;
        query->kind  = kind;
        query->limit = limit;
        this->queries.emplace(queryId, std::move(query));
        hn_log("QueryStore::declare " + queryId + " as " + std::string{queryKindToString(kind)}, "QueryStore");
        return {};
    }
    if (it->second->kind != kind) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration,
                                     "query '" + queryId + "' is already declared as " + std::string{queryKindToString(it->second->kind)}});
    }
    if (kind == Query::Kind::Raw && it->second->limit != limit) {
        // Tightening the cap is applied on the next upsert.
        auto next   = std::make_shared<Query>(*it->second);
        next->limit = limit;
        it->second  = std::move(next);
    }
    return {};
}

auto QueryStore::contains(std::string const& queryId) const -> bool {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    return this->queries.contains(queryId);
}

auto QueryStore::version(std::string const& queryId) const -> Expected<std::uint64_t> {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    auto                                it = this->queries.find(queryId);
    if (it == this->queries.end())
        return std::unexpected(unknown_query(queryId));
    return it->second->version;
}

auto QueryStore::upsertRaw(std::string const& queryId, std::vector<Record> const& newItems, UpsertMode mode) -> Expected<bool> {
    std::uint64_t version = 0;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        auto                                it = this->queries.find(queryId);
        if (it == this->queries.end())
            return std::unexpected(unknown_query(queryId));
        auto const& current = *it->second;
        if (current.kind != Query::Kind::Raw)
            return std::unexpected(Error{Error::Code::InvalidState, "query '" + queryId + "' is derived and cannot take records"});

        auto items = mode == UpsertMode::Merge ? ordered_unique(current.items, newItems) : ordered_unique({}, newItems);
        if (current.limit && items.size() > *current.limit)
            items.resize(*current.limit);
        if (items == current.items)
            return false;

        auto next   = std::make_shared<Query>(current);
        next->items = std::move(items);
        next->version += 1;
        version = next->version;
        it->second = std::move(next);
        ++this->revisionCounter;
    }
    hn_log("QueryStore::upsertRaw " + queryId + " -> version " + std::to_string(version), "QueryStore");
    this->notify(queryId, version);
    return true;
}

auto QueryStore::recomputeDerived(std::string const& queryId, Transform const& transform, QuerySnapshot const& inputs) -> Expected<bool> {
    {
        std::shared_lock<std::shared_mutex> lock(this->mutex);
        auto                                it = this->queries.find(queryId);
        if (it == this->queries.end())
            return std::unexpected(unknown_query(queryId));
        if (it->second->kind != Query::Kind::Derived)
            return std::unexpected(Error{Error::Code::InvalidState, "query '" + queryId + "' is raw and has no transform"});
    }

    auto result = transform(inputs);
    if (!result) {
        hn_log("QueryStore::recomputeDerived " + queryId + " kept prior value: " + describeError(result.error()), "QueryStore", "Error");
        return std::unexpected(result.error());
    }

    std::uint64_t version = 0;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        auto                                it = this->queries.find(queryId);
        if (it == this->queries.end())
            return std::unexpected(unknown_query(queryId));
        if (it->second->value == *result)
            return false;
        auto next   = std::make_shared<Query>(*it->second);
        next->value = std::move(*result);
        next->version += 1;
        version    = next->version;
        it->second = std::move(next);
        ++this->revisionCounter;
    }
    hn_log("QueryStore::recomputeDerived " + queryId + " -> version " + std::to_string(version), "QueryStore");
    this->notify(queryId, version);
    return true;
}

auto QueryStore::snapshot() const -> QuerySnapshot {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    return QuerySnapshot{QuerySnapshot::Map{this->queries.begin(), this->queries.end()}, this->revisionCounter};
}

auto QueryStore::revision() const -> std::uint64_t {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    return this->revisionCounter;
}

auto QueryStore::subscribe(std::weak_ptr<ChangeSink> sink) -> void {
    std::lock_guard<std::mutex> lock(this->sinksMutex);
    this->sinks.push_back(std::move(sink));
}

auto QueryStore::notify(std::string const& queryId, std::uint64_t version) -> void {
    std::vector<std::shared_ptr<ChangeSink>> live;
    {
        std::lock_guard<std::mutex> lock(this->sinksMutex);
        std::erase_if(this->sinks, [](std::weak_ptr<ChangeSink> const& sink) { return sink.expired(); });
        for (auto const& sink : this->sinks) {
            if (auto locked = sink.lock())
                live.push_back(std::move(locked));
        }
    }
    for (auto const& sink : live)
        sink->queryChanged(queryId, version);
}

} // namespace HN
