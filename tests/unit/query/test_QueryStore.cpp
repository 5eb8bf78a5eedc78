#include "HnmdTestHelper.hpp"

#include <doctest/doctest.h>
#include <hnmd/query/QueryStore.hpp>

#include <algorithm>
#include <thread>
#include <vector>

using namespace HN;
using namespace HN::Test;

namespace {

struct CollectingSink : ChangeSink {
    void queryChanged(const std::string& queryId, std::uint64_t version) override {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->changes.emplace_back(queryId, version);
    }

    std::mutex                                         mutex;
    std::vector<std::pair<std::string, std::uint64_t>> changes;
};

auto ids(std::vector<Record> const& records) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (auto const& record : records)
        out.push_back(record.id);
    return out;
}

} // namespace

TEST_SUITE("query.store") {

TEST_CASE("QueryStore declarations") {
    QueryStore store;

    SUBCASE("Raw and derived queries start at version zero") {
        REQUIRE(store.declareRaw("feed", 10));
        REQUIRE(store.declareDerived("names"));
        CHECK(store.version("feed") == 0u);
        CHECK(store.version("names") == 0u);
        CHECK(store.contains("feed"));
        CHECK(store.snapshot().find("names")->kind == Query::Kind::Derived);
    }

    SUBCASE("Redeclaring under the other kind is rejected") {
        REQUIRE(store.declareRaw("feed"));
        auto clash = store.declareDerived("feed");
        REQUIRE_FALSE(clash);
        CHECK(clash.error().code == Error::Code::InvalidConfiguration);
        CHECK(store.declareRaw("feed"));
    }

    SUBCASE("Unknown ids and empty ids are errors") {
        CHECK(store.version("nope").error().code == Error::Code::UnknownQueryReference);
        CHECK(store.upsertRaw("nope", {}).error().code == Error::Code::UnknownQueryReference);
        CHECK(store.declareRaw("").error().code == Error::Code::InvalidConfiguration);
    }
}

TEST_CASE("QueryStore upserts") {
    QueryStore store;
    REQUIRE(store.declareRaw("feed"));
    auto sink = std::make_shared<CollectingSink>();
    store.subscribe(sink);

    SUBCASE("New items bump the version once and notify") {
        auto changed = store.upsertRaw("feed", {makeRecord("a", "alice", 1), makeRecord("b", "bob", 2)});
        REQUIRE(changed);
        CHECK(*changed);
        CHECK(store.version("feed") == 1u);
        CHECK(store.revision() == 1u);
        REQUIRE(sink->changes.size() == 1);
        CHECK(sink->changes[0] == std::pair<std::string, std::uint64_t>{"feed", 1});
        CHECK(ids(store.snapshot().find("feed")->items) == std::vector<std::string>{"b", "a"});
    }

    SUBCASE("An upsert that changes nothing keeps the version") {
        REQUIRE(store.upsertRaw("feed", {makeRecord("a", "alice", 1)}));
        auto again = store.upsertRaw("feed", {makeRecord("a", "alice", 1)});
        REQUIRE(again);
        CHECK_FALSE(*again);
        CHECK(store.version("feed") == 1u);
        CHECK(sink->changes.size() == 1);
    }

    SUBCASE("Later created_at replaces the stored record with the same id") {
        REQUIRE(store.upsertRaw("feed", {makeRecord("a", "alice", 5, 1, "new")}));
        REQUIRE(store.upsertRaw("feed", {makeRecord("a", "alice", 1, 1, "old")}));
        CHECK(store.snapshot().find("feed")->items[0].content == "new");
        CHECK(store.version("feed") == 1u);
    }

    SUBCASE("Replace drops what the batch does not contain") {
        REQUIRE(store.upsertRaw("feed", {makeRecord("a", "alice", 1), makeRecord("b", "bob", 2)}));
        REQUIRE(store.upsertRaw("feed", {makeRecord("c", "carol", 3)}, UpsertMode::Replace));
        CHECK(ids(store.snapshot().find("feed")->items) == std::vector<std::string>{"c"});
        CHECK(store.version("feed") == 2u);
    }

    SUBCASE("The limit keeps the newest items") {
        REQUIRE(store.declareRaw("top", 2));
        REQUIRE(store.upsertRaw("top", {makeRecord("a", "x", 1), makeRecord("b", "x", 3), makeRecord("c", "x", 2)}));
        CHECK(ids(store.snapshot().find("top")->items) == std::vector<std::string>{"b", "c"});
        auto older = store.upsertRaw("top", {makeRecord("d", "x", 0)});
        REQUIRE(older);
        CHECK_FALSE(*older);
    }

    SUBCASE("Derived queries refuse records") {
        REQUIRE(store.declareDerived("names"));
        CHECK(store.upsertRaw("names", {makeRecord("a", "alice", 1)}).error().code == Error::Code::InvalidState);
    }

    SUBCASE("Snapshots are immutable") {
        REQUIRE(store.upsertRaw("feed", {makeRecord("a", "alice", 1)}));
        auto before = store.snapshot();
        REQUIRE(store.upsertRaw("feed", {makeRecord("b", "bob", 2)}));
        CHECK(before.find("feed")->items.size() == 1);
        CHECK(before.version("feed") == 1u);
        CHECK(store.snapshot().version("feed") == 2u);
        CHECK(before.toJson()["feed"][0]["id"] == "a");
    }

    SUBCASE("Expired sinks are dropped") {
        sink.reset();
        CHECK(store.upsertRaw("feed", {makeRecord("a", "alice", 1)}));
    }
}

TEST_CASE("QueryStore versions are monotonic under concurrent writers") {
    QueryStore store;
    REQUIRE(store.declareRaw("feed"));
    auto sink = std::make_shared<CollectingSink>();
    store.subscribe(sink);

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&store, w] {
            for (int i = 0; i < 50; ++i)
                (void)store.upsertRaw("feed", {makeRecord("w" + std::to_string(w) + "-" + std::to_string(i), "x", i)});
        });
    }
    for (auto& writer : writers)
        writer.join();

    CHECK(store.version("feed") == 200u);
    CHECK(store.snapshot().find("feed")->items.size() == 200);
    std::vector<std::uint64_t> versions;
    for (auto const& [id, version] : sink->changes)
        versions.push_back(version);
    std::sort(versions.begin(), versions.end());
    CHECK(std::adjacent_find(versions.begin(), versions.end()) == versions.end());
    CHECK(versions.back() == 200u);
}

TEST_CASE("Merging records") {
    auto a  = makeRecord("a", "alice", 1);
    auto b  = makeRecord("b", "bob", 2);
    auto b2 = makeRecord("b", "bob", 4, 1, "edited");
    auto c  = makeRecord("c", "carol", 3);

    SUBCASE("Merge is commutative") {
        CHECK(mergeRecords({a, b}, {b2, c}) == mergeRecords({b2, c}, {a, b}));
    }

    SUBCASE("Merge is idempotent") {
        auto once = mergeRecords({a, b}, {c});
        CHECK(mergeRecords(once, once) == once);
        CHECK(mergeRecords(once, {c}) == once);
    }

    SUBCASE("Equal timestamps with different payloads resolve the same way from both sides") {
        auto left  = makeRecord("x", "alice", 7, 1, "left");
        auto right = makeRecord("x", "alice", 7, 1, "right");
        auto one   = mergeRecords({left}, {right});
        auto other = mergeRecords({right}, {left});
        REQUIRE(one.size() == 1);
        CHECK(one == other);
    }
}

TEST_CASE("QueryStore derived recomputation") {
    QueryStore store;
    REQUIRE(store.declareRaw("feed"));
    REQUIRE(store.declareDerived("count"));

    QueryStore::Transform count = [](QuerySnapshot const& snapshot) -> Expected<Value> {
        return Value(snapshot.find("feed")->items.size());
    };

    SUBCASE("A changed value bumps the version") {
        REQUIRE(store.upsertRaw("feed", {makeRecord("a", "alice", 1)}));
        auto changed = store.recomputeDerived("count", count, store.snapshot());
        REQUIRE(changed);
        CHECK(*changed);
        CHECK(store.snapshot().find("count")->value == 1);
        auto same = store.recomputeDerived("count", count, store.snapshot());
        REQUIRE(same);
        CHECK_FALSE(*same);
        CHECK(store.version("count") == 1u);
    }

    SUBCASE("A failed transform keeps the prior value") {
        REQUIRE(store.recomputeDerived("count", count, store.snapshot()));
        QueryStore::Transform broken = [](QuerySnapshot const&) -> Expected<Value> {
            return std::unexpected(Error{Error::Code::EvalError, "bad pipe"});
        };
        auto failed = store.recomputeDerived("count", broken, store.snapshot());
        REQUIRE_FALSE(failed);
        CHECK(failed.error().code == Error::Code::EvalError);
        CHECK(store.snapshot().find("count")->value == 0);
    }

    SUBCASE("Raw queries have no transform") {
        CHECK(store.recomputeDerived("feed", count, store.snapshot()).error().code == Error::Code::InvalidState);
    }
}

} // TEST_SUITE
