#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/core/Value.hpp>
#include <hnmd/data/Record.hpp>
#include <hnmd/query/ChangeSink.hpp>
#include <hnmd/query/Query.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace HN {

enum class UpsertMode {
    Merge,  // union by record id, newest created_at wins
    Replace // the new items become the whole set
};

// Read-only view of every query at one store revision. Copies share the
// underlying Query objects; the store never mutates a Query it has published.
class QuerySnapshot {
public:
    using Map = std::map<std::string, std::shared_ptr<Query const>>;

    QuerySnapshot() = default;
    QuerySnapshot(Map queries, std::uint64_t revision);

    [[nodiscard]] auto find(std::string const& queryId) const -> Query const*;
    [[nodiscard]] auto contains(std::string const& queryId) const -> bool;
    [[nodiscard]] auto version(std::string const& queryId) const -> std::optional<std::uint64_t>;
    [[nodiscard]] auto revision() const -> std::uint64_t { return this->storeRevision; }
    [[nodiscard]] auto size() const -> std::size_t { return this->queries.size(); }
    [[nodiscard]] auto entries() const -> Map const& { return this->queries; }

    // {"<queryId>": <Query::toJson()>, ...}
    [[nodiscard]] auto toJson() const -> Value;

private:
    Map           queries;
    std::uint64_t storeRevision = 0;
};

/**
 * QueryStore: the authoritative, versioned result sets.
 *
 * Raw items are kept sorted by created_at descending, ties by id ascending,
 * and capped to the declared limit. A query's version increases by exactly one
 * for every observable change and never otherwise. revision() is the sum of
 * all version bumps.
 *
 * Readers take snapshot() and work lock-free on it; writers replace the
 * affected Query under an exclusive lock. Change notifications are delivered
 * after the lock is released, in the writer's thread.
 */
class QueryStore {
public:
    using Transform = std::function<Expected<Value>(QuerySnapshot const&)>;

    QueryStore() = default;
    QueryStore(QueryStore const&)            = delete;
    QueryStore& operator=(QueryStore const&) = delete;

    // Declaring an existing raw query again updates its limit. Declaring an id
    // under the other kind is an InvalidConfiguration error.
    auto declareRaw(std::string const& queryId, std::optional<std::size_t> limit = std::nullopt) -> Expected<void>;
    auto declareDerived(std::string const& queryId) -> Expected<void>;

    [[nodiscard]] auto contains(std::string const& queryId) const -> bool;
    [[nodiscard]] auto version(std::string const& queryId) const -> Expected<std::uint64_t>;

    // Returns whether the ordered item sequence changed (and the version bumped).
    auto upsertRaw(std::string const& queryId, std::vector<Record> const& newItems, UpsertMode mode = UpsertMode::Merge)
        -> Expected<bool>;

    // Runs transform over inputs. On failure the prior value is kept and the
    // error returned.
    auto recomputeDerived(std::string const& queryId, Transform const& transform, QuerySnapshot const& inputs) -> Expected<bool>;

    [[nodiscard]] auto snapshot() const -> QuerySnapshot;
    [[nodiscard]] auto revision() const -> std::uint64_t;

    auto subscribe(std::weak_ptr<ChangeSink> sink) -> void;

private:
    auto declare(std::string const& queryId, Query::Kind kind, std::optional<std::size_t> limit) -> Expected<void>;
    auto notify(std::string const& queryId, std::uint64_t version) -> void;

    mutable std::shared_mutex                           mutex;
    std::map<std::string, std::shared_ptr<Query const>> queries;
    std::uint64_t                                       revisionCounter = 0;

    std::mutex                             sinksMutex;
    std::vector<std::weak_ptr<ChangeSink>> sinks;
};

// Merge rule shared by the store and tests: union by id where the later
// created_at wins. Records with the same id and timestamp but different
// payloads resolve to the larger canonical JSON.
[[nodiscard]] auto mergeRecords(std::vector<Record> const& current, std::vector<Record> const& incoming) -> std::vector<Record>;

} // namespace HN
