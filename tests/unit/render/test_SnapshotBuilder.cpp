#include "HnmdTestHelper.hpp"

#include <doctest/doctest.h>
#include <hnmd/render/SnapshotBuilder.hpp>

using namespace HN;
using namespace HN::Render;
using namespace HN::Test;

namespace {

auto feedContext() -> RenderContext {
    RenderContext context;
    context.user    = Value{{"pubkey", hexKey('a')}};
    context.state   = Value{{"expanded", true}, {"title", "Notes"}};
    context.queries = Value{{"feed", Value::array({Value{{"content", "first"}}, Value{{"content", "second"}}})}, {"single", Value{{"content", "only"}}}};
    return context;
}

} // namespace

TEST_SUITE("render.snapshot") {

TEST_CASE("Each expansion") {
    PathExpressionEvaluator evaluator;
    ComponentRegistry       components;
    SnapshotBuilder         builder(evaluator, components);

    SUBCASE("One instance per array item with its bindings") {
        NodeList body{Node::Each("queries.feed", "note", {Node::Expr("note.content")})};
        auto     mounted = builder.build(body, feedContext());
        REQUIRE(mounted.size() == 1);
        CHECK(mounted[0].node.is<EachNode>());
        REQUIRE(mounted[0].expansions.size() == 1);
        auto const& instances = mounted[0].expansions[0];
        REQUIRE(instances.size() == 2);
        CHECK(instances[1].bindings["itemIndex"] == 1);
        CHECK(instances[1].bindings["note"]["content"] == "second");
        CHECK(instances[1].scope["note"]["content"] == "second");
        auto const* group = instances[0].node.as<ElementNode>();
        REQUIRE(group);
        CHECK(group->kind == ElementKind::Group);
        CHECK(group->children.front() == Node::Expr("note.content"));
    }

    SUBCASE("A non-array source yields one instance") {
        auto mounted = builder.build({Node::Each("queries.single", "note", {Node::Text("x")})}, feedContext());
        REQUIRE(mounted[0].expansions[0].size() == 1);
        CHECK(mounted[0].expansions[0][0].bindings["itemIndex"] == 0);
    }

    SUBCASE("Null and failing sources yield nothing") {
        auto missing = builder.build({Node::Each("queries.nothing", "note", {Node::Text("x")})}, feedContext());
        CHECK(missing[0].expansions[0].empty());
        auto failing = builder.build({Node::Each("queries.feed.content", "note", {Node::Text("x")})}, feedContext());
        CHECK(failing[0].expansions[0].empty());
    }

    SUBCASE("Nested iterations see the outer locals") {
        RenderContext context = feedContext();
        context.queries["groups"] = Value::array({Value{{"items", Value::array({1, 2, 3})}}});
        auto mounted = builder.build({Node::Each("queries.groups", "group", {Node::Each("group.items", "item", {Node::Expr("item")})})}, context);
        auto const& outer = mounted[0].expansions[0];
        REQUIRE(outer.size() == 1);
        REQUIRE(outer[0].expansions.size() == 1);
        auto const& inner = outer[0].expansions[0];
        REQUIRE(inner.size() == 3);
        CHECK(inner[2].scope["group"]["items"].size() == 3);
        CHECK(inner[2].bindings["item"] == 3);
    }
}

TEST_CASE("If resolution") {
    PathExpressionEvaluator evaluator;
    ComponentRegistry       components;
    SnapshotBuilder         builder(evaluator, components);
    auto                    node = Node::If("state.expanded", {Node::Text("open")}, {Node::Text("closed")});

    SUBCASE("Truthy condition keeps the then branch") {
        auto mounted = builder.build({node}, feedContext());
        auto const* group = mounted[0].node.as<ElementNode>();
        REQUIRE(group);
        CHECK(group->attributes.at("branch") == "then");
        CHECK(group->children == NodeList{Node::Text("open")});
    }

    SUBCASE("Falsy condition keeps the else branch") {
        auto context                = feedContext();
        context.state["expanded"] = false;
        auto const* group         = builder.build({node}, context)[0].node.as<ElementNode>();
        REQUIRE(group);
        CHECK(group->attributes.at("branch") == "else");
    }

    SUBCASE("A failing condition takes the else branch") {
        CountingEvaluator failing;
        failing.fail("state.expanded");
        SnapshotBuilder other(failing, components);
        auto const*     group = other.build({node}, feedContext())[0].node.as<ElementNode>();
        REQUIRE(group);
        CHECK(group->children == NodeList{Node::Text("closed")});
    }

    SUBCASE("Iterations inside a branch are expanded") {
        auto mounted = builder.build({Node::If("state.expanded", {Node::Each("queries.feed", "note", {Node::Text("n")})})}, feedContext());
        REQUIRE(mounted[0].expansions.size() == 1);
        CHECK(mounted[0].expansions[0].size() == 2);
    }
}

TEST_CASE("Component instances") {
    PathExpressionEvaluator evaluator;
    ComponentRegistry       components;
    ComponentDef            card;
    card.props["title"]   = PropSchema{"string", true, std::nullopt};
    card.props["compact"] = PropSchema{"boolean", false, Value(false)};
    card.body             = {Node::Expr("props.title")};
    components.add("card", card);
    SnapshotBuilder builder(evaluator, components);

    SUBCASE("Props are evaluated in the caller's scope and defaults filled in") {
        auto mounted = builder.build({Node::Component("card", {{"title", "state.title"}})}, feedContext());
        REQUIRE(mounted[0].expansions.size() == 1);
        REQUIRE(mounted[0].expansions[0].size() == 1);
        auto const& instance = mounted[0].expansions[0][0];
        CHECK(instance.bindings["props"]["title"] == "Notes");
        CHECK(instance.bindings["props"]["compact"] == false);
        auto const* group = instance.node.as<ElementNode>();
        REQUIRE(group);
        CHECK(group->attributes.at("component") == "card");
    }

    SUBCASE("Components inside an iteration bind per item") {
        auto mounted = builder.build({Node::Each("queries.feed", "note", {Node::Component("card", {{"title", "note.content"}})})}, feedContext());
        auto const& instances = mounted[0].expansions[0];
        REQUIRE(instances.size() == 2);
        CHECK(instances[1].expansions[0][0].bindings["props"]["title"] == "second");
    }

    SUBCASE("An unregistered component mounts a placeholder") {
        auto mounted = builder.build({Node::Component("ghost")}, feedContext());
        REQUIRE(mounted[0].expansions[0].size() == 1);
        CHECK(mounted[0].expansions[0][0].node.is<TextNode>());
    }
}

} // TEST_SUITE
