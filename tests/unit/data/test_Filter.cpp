#include "HnmdTestHelper.hpp"

#include <doctest/doctest.h>
#include <hnmd/data/Filter.hpp>
#include <hnmd/data/LoaderKey.hpp>
#include <hnmd/data/Record.hpp>

using namespace HN;
using namespace HN::Test;

TEST_SUITE("data.filter") {

TEST_CASE("Filter matching") {
    auto const alice = hexKey('a');
    auto const bob   = hexKey('b');
    auto       note  = makeRecord("n1", alice, 100, 1, "hello", {{"e", "root"}, {"p", bob}, {"t", "nostr"}});

    SUBCASE("Empty filter matches everything") {
        CHECK(Filter{}.matches(note));
    }

    SUBCASE("Kinds and authors") {
        Filter filter;
        filter.kinds   = std::vector<std::uint32_t>{1, 6};
        filter.authors = std::vector<std::string>{alice};
        CHECK(filter.matches(note));
        filter.authors = std::vector<std::string>{bob};
        CHECK_FALSE(filter.matches(note));
        filter.authors.reset();
        filter.kinds = std::vector<std::uint32_t>{0};
        CHECK_FALSE(filter.matches(note));
    }

    SUBCASE("Time bounds are inclusive") {
        Filter filter;
        filter.since = 100;
        filter.until = 100;
        CHECK(filter.matches(note));
        filter.since = 101;
        CHECK_FALSE(filter.matches(note));
    }

    SUBCASE("Tag constraints need one matching value per tag") {
        Filter filter;
        filter.tags["t"] = {"bitcoin", "nostr"};
        CHECK(filter.matches(note));
        filter.tags["e"] = {"other"};
        CHECK_FALSE(filter.matches(note));
    }
}

TEST_CASE("Filter JSON") {
    SUBCASE("Frontmatter field names are understood") {
        auto parsed = filterFromJson(Value::parse(R"({"kinds":[1],"authors":["{user.pubkey}"],"#t":["nostr"],"since":5,"limit":20})"));
        REQUIRE(parsed);
        CHECK(parsed->kinds == std::vector<std::uint32_t>{1});
        REQUIRE(parsed->authors);
        CHECK(parsed->authors->front() == "{user.pubkey}");
        CHECK(parsed->tags.at("t") == std::vector<std::string>{"nostr"});
        CHECK(parsed->since == 5);
        CHECK(parsed->limit == 20u);
        CHECK(parsed->hasPlaceholders());

        auto again = filterFromJson(filterToJson(*parsed));
        REQUIRE(again);
        CHECK(*again == *parsed);
    }

    SUBCASE("Malformed fields are rejected") {
        auto unknown = filterFromJson(Value::parse(R"({"colour":"red"})"));
        REQUIRE_FALSE(unknown);
        CHECK(unknown.error().code == Error::Code::MalformedInput);

        auto badLimit = filterFromJson(Value::parse(R"({"limit":-1})"));
        REQUIRE_FALSE(badLimit);
        CHECK(badLimit.error().code == Error::Code::MalformedInput);

        auto badKinds = filterFromJson(Value::parse(R"({"kinds":["one"]})"));
        CHECK_FALSE(badKinds);
    }
}

TEST_CASE("Filter compilation") {
    PathExpressionEvaluator evaluator;
    auto const              alice   = hexKey('a');
    auto const              bob     = hexKey('b');
    Value                   context = {{"user", {{"pubkey", alice}}}, {"queries", {{"follows", {bob, alice}}}}};

    SUBCASE("Placeholders resolve against the context") {
        Filter filterTemplate;
        filterTemplate.authors = std::vector<std::string>{"{user.pubkey}"};
        auto compiled          = Filter::Compile(filterTemplate, context, evaluator);
        REQUIRE(compiled);
        CHECK(*compiled->authors == std::vector<std::string>{alice});
        CHECK_FALSE(compiled->hasPlaceholders());
    }

    SUBCASE("Array results expand and are deduplicated") {
        Filter filterTemplate;
        filterTemplate.authors = std::vector<std::string>{"queries.follows", alice};
        auto compiled          = Filter::Compile(filterTemplate, context, evaluator);
        REQUIRE(compiled);
        CHECK(*compiled->authors == std::vector<std::string>{alice, bob});
    }

    SUBCASE("A placeholder that resolves to nothing does not widen the filter") {
        Filter filterTemplate;
        filterTemplate.authors = std::vector<std::string>{"user.missing"};
        auto compiled          = Filter::Compile(filterTemplate, context, evaluator);
        REQUIRE_FALSE(compiled);
        CHECK(compiled.error().code == Error::Code::EvalError);
    }

    SUBCASE("One failing placeholder among resolved ones is dropped") {
        Filter filterTemplate;
        filterTemplate.authors = std::vector<std::string>{"user.missing", "{user.pubkey}"};
        auto compiled          = Filter::Compile(filterTemplate, context, evaluator);
        REQUIRE(compiled);
        CHECK(*compiled->authors == std::vector<std::string>{alice});
    }

    SUBCASE("Inverted time bounds are a configuration error") {
        Filter filterTemplate;
        filterTemplate.since = 10;
        filterTemplate.until = 5;
        auto compiled        = Filter::Compile(filterTemplate, context, evaluator);
        REQUIRE_FALSE(compiled);
        CHECK(compiled.error().code == Error::Code::InvalidConfiguration);
    }
}

TEST_CASE("LoaderKey") {
    SUBCASE("Canonical form") {
        LoaderKey profile{0, "alice"};
        CHECK(profile.str() == "0:alice:");
        LoaderKey article{30023, "alice", "post:1"};
        CHECK(article.str() == "30023:alice:post:1");
    }

    SUBCASE("Parse accepts identifiers containing separators") {
        auto parsed = LoaderKey::Parse("30023:alice:post:1");
        REQUIRE(parsed);
        CHECK(parsed->kind() == 30023u);
        CHECK(parsed->pubkey() == "alice");
        CHECK(parsed->identifier() == "post:1");
        CHECK(*parsed == LoaderKey{30023, "alice", "post:1"});
    }

    SUBCASE("Parse rejects malformed keys") {
        CHECK_FALSE(LoaderKey::Parse("alice"));
        CHECK_FALSE(LoaderKey::Parse("x:alice:"));
        CHECK_FALSE(LoaderKey::Parse("0::"));
    }

    SUBCASE("Records map to their key through the d tag") {
        auto profile = makeRecord("p1", "alice", 10, 0);
        CHECK(LoaderKey::ForRecord(profile).str() == "0:alice:");
        auto article = makeRecord("a1", "alice", 10, 30023, "", {{"d", "intro"}});
        CHECK(LoaderKey::ForRecord(article).str() == "30023:alice:intro");
    }

    SUBCASE("Only addressable kinds use the d tag") {
        auto profile = makeRecord("p2", "alice", 10, 0, "", {{"d", "stray"}});
        CHECK(LoaderKey::ForRecord(profile).str() == "0:alice:");
        auto note = makeRecord("n1", "alice", 10, 1, "", {{"d", "x"}});
        CHECK(LoaderKey::ForRecord(note).str() == "1:alice:");
        CHECK(LoaderKey::IsAddressable(30000));
        CHECK(LoaderKey::IsAddressable(39999));
        CHECK_FALSE(LoaderKey::IsAddressable(40000));
    }

    SUBCASE("toFilter selects exactly the keyed record") {
        auto filter  = LoaderKey{30023, "alice", "intro"}.toFilter();
        auto article = makeRecord("a1", "alice", 10, 30023, "", {{"d", "intro"}});
        auto other   = makeRecord("a2", "alice", 10, 30023, "", {{"d", "outro"}});
        CHECK(filter.matches(article));
        CHECK_FALSE(filter.matches(other));
    }
}

TEST_CASE("Record") {
    auto record = makeRecord("id1", "alice", 42, 1, "gm", {{"p", "bob"}, {"p", "carol"}, {"d", "x"}});

    SUBCASE("Tag lookup") {
        CHECK(record.tagValue("p") == "bob");
        CHECK(record.tagValues("p") == std::vector<std::string>{"bob", "carol"});
        CHECK_FALSE(record.tagValue("e"));
    }

    SUBCASE("JSON exchange") {
        auto json = recordToJson(record);
        CHECK(json["created_at"] == 42);
        CHECK(json["tags"][0][1] == "bob");
        auto parsed = recordFromJson(json);
        REQUIRE(parsed);
        CHECK(*parsed == record);
        CHECK_FALSE(recordFromJson(Value::parse(R"({"id": 5})")));
    }

    SUBCASE("Feed order is newest first") {
        auto older = makeRecord("b", "alice", 1);
        auto newer = makeRecord("a", "alice", 2);
        CHECK(recordPrecedes(newer, older));
        CHECK_FALSE(recordPrecedes(older, newer));
    }
}

} // TEST_SUITE
