#include "HnmdTestHelper.hpp"

#include <doctest/doctest.h>
#include <hnmd/render/Reconciler.hpp>

using namespace HN;
using namespace HN::Render;
using namespace HN::Test;

namespace {

auto kinds(EditList const& edits) -> std::vector<EditKind> {
    std::vector<EditKind> out;
    for (auto const& op : edits)
        out.push_back(op.kind);
    return out;
}

auto indices(EditList const& edits) -> std::vector<std::size_t> {
    std::vector<std::size_t> out;
    for (auto const& op : edits)
        out.push_back(op.index);
    return out;
}

auto notes(std::initializer_list<char const*> contents) -> Value {
    Value out = Value::array();
    for (auto const* content : contents)
        out.push_back(Value{{"content", content}});
    return out;
}

// Builds and reconciles one pass, carrying the arena between calls.
struct Passes {
    PathExpressionEvaluator evaluator;
    ExpressionEvaluator*    active = &evaluator;
    ComponentRegistry       components;
    ReconcileArena          arena;

    auto run(NodeList const& body, RenderContext const& context) -> EditList {
        SnapshotBuilder builder(*this->active, this->components);
        auto            mounted = builder.build(body, context);
        auto            result  = Reconcile(this->arena, mounted, context.toJson(), *this->active);
        this->arena             = std::move(result.arena);
        return std::move(result.edits);
    }
};

} // namespace

TEST_SUITE("render.reconcile") {

TEST_CASE("Appending to an iterated query keeps the existing items") {
    Passes        passes;
    NodeList      body{Node::Each("queries.feed", "note", {Node::Expr("note.content")})};
    RenderContext context;
    context.queries["feed"] = notes({"A", "B"});

    auto first = passes.run(body, context);
    REQUIRE(kinds(first) == std::vector{EditKind::Add});
    REQUIRE(first[0].nested.size() == 1);
    CHECK(kinds(first[0].nested[0]) == std::vector{EditKind::Add, EditKind::Add});

    context.queries["feed"] = notes({"A", "B", "C"});
    auto second             = passes.run(body, context);
    REQUIRE(kinds(second) == std::vector{EditKind::Keep});
    auto const& items = second[0].nested[0];
    CHECK(kinds(items) == std::vector{EditKind::Keep, EditKind::Keep, EditKind::Add});
    REQUIRE(items[2].node);
    REQUIRE(items[2].values.size() == 1);
    REQUIRE(items[2].values[0]);
    CHECK(*items[2].values[0] == "C");
    CHECK_FALSE(items[0].node);
}

TEST_CASE("Unchanged expression values survive edits elsewhere") {
    Passes        passes;
    RenderContext context;
    context.state["count"] = 77;

    NodeList before{Node::Element(ElementKind::Paragraph, {Node::Text("Count: "), Node::Expr("state.count")}),
                    Node::Element(ElementKind::Paragraph, {Node::Text("static")})};
    NodeList after{Node::Element(ElementKind::Paragraph, {Node::Text("Count: "), Node::Expr("state.count")}),
                   Node::Element(ElementKind::Paragraph, {Node::Text("edited")})};

    passes.run(before, context);
    auto edits = passes.run(after, context);
    CHECK(kinds(edits) == std::vector{EditKind::Keep, EditKind::Rebuild});
    REQUIRE(edits[1].node);
    CHECK(edits[1].values.empty());
}

TEST_CASE("A changed expression value rebuilds its position") {
    Passes        passes;
    RenderContext context;
    context.state["count"] = 77;
    NodeList body{Node::Expr("state.count"), Node::Text("label")};

    passes.run(body, context);
    context.state["count"] = 78;
    auto edits             = passes.run(body, context);
    CHECK(kinds(edits) == std::vector{EditKind::Rebuild, EditKind::Keep});
    REQUIRE(edits[0].values.size() == 1);
    CHECK(*edits[0].values[0] == 78);
    CHECK(edits[0].generation == 1);
}

TEST_CASE("Rendering the same input twice keeps everything") {
    Passes        passes;
    RenderContext context;
    context.state["open"]   = true;
    context.queries["feed"] = notes({"A", "B", "C"});
    NodeList body{Node::Element(ElementKind::Heading, {Node::Text("Feed")}, {{"level", "1"}}),
                  Node::If("state.open", {Node::Expr("queries.feed | length")}),
                  Node::Each("queries.feed", "note", {Node::Expr("note.content"), Node::Expr("itemIndex")})};

    passes.run(body, context);
    auto edits = passes.run(body, context);
    auto sum   = summarize(edits);
    CHECK(sum.onlyKeeps());
    CHECK(sum.keeps == 6);
}

TEST_CASE("Shrinking lists remove from the tail") {
    Passes        passes;
    RenderContext context;
    NodeList      body{Node::Text("a"), Node::Text("b"), Node::Text("c"), Node::Text("d")};
    passes.run(body, context);

    auto edits = passes.run({Node::Text("a")}, context);
    CHECK(kinds(edits) == std::vector{EditKind::Keep, EditKind::Remove, EditKind::Remove, EditKind::Remove});
    CHECK(indices(edits) == std::vector<std::size_t>{0, 3, 2, 1});
}

TEST_CASE("Mixed edits come out as updates, removals, additions") {
    Passes        passes;
    RenderContext context;
    passes.run({Node::Text("a"), Node::Text("b"), Node::Text("c")}, context);

    auto shrink = passes.run({Node::Text("x")}, context);
    CHECK(kinds(shrink) == std::vector{EditKind::Rebuild, EditKind::Remove, EditKind::Remove});

    auto grow = passes.run({Node::Text("x"), Node::Text("y"), Node::Text("z")}, context);
    CHECK(kinds(grow) == std::vector{EditKind::Keep, EditKind::Add, EditKind::Add});
    CHECK(indices(grow) == std::vector<std::size_t>{0, 1, 2});
}

TEST_CASE("Diffing is positional") {
    Passes        passes;
    NodeList      body{Node::Each("queries.feed", "note", {Node::Expr("note.content")})};
    RenderContext context;
    context.queries["feed"] = notes({"A", "B", "C"});
    passes.run(body, context);

    context.queries["feed"] = notes({"A", "X", "B", "C"});
    auto edits              = passes.run(body, context);
    CHECK(kinds(edits[0].nested[0]) == std::vector{EditKind::Keep, EditKind::Rebuild, EditKind::Rebuild, EditKind::Add});
}

TEST_CASE("Slot generations") {
    Passes        passes;
    RenderContext context;
    passes.run({Node::Text("a"), Node::Text("b")}, context);

    auto rebuilt = passes.run({Node::Text("a"), Node::Text("c")}, context);
    REQUIRE(kinds(rebuilt) == std::vector{EditKind::Keep, EditKind::Rebuild});
    CHECK(rebuilt[0].generation == 0);
    CHECK(rebuilt[1].generation == 1);

    auto removed = passes.run({Node::Text("a")}, context);
    REQUIRE(kinds(removed) == std::vector{EditKind::Keep, EditKind::Remove});
    CHECK(removed[1].generation == 1);
    CHECK(passes.arena.generations.size() == 2);

    auto added = passes.run({Node::Text("a"), Node::Text("d")}, context);
    REQUIRE(kinds(added) == std::vector{EditKind::Keep, EditKind::Add});
    CHECK(added[1].generation == 1);

    auto again = passes.run({Node::Text("a"), Node::Text("e")}, context);
    CHECK(again[1].generation == 2);
    CHECK(passes.arena.states[1].generation == 2);
}

TEST_CASE("Nested scopes") {
    Passes        passes;
    RenderContext context;
    context.state["title"]  = "Feed";
    context.queries["feed"] = notes({"A", "B"});
    NodeList body{Node::Element(ElementKind::VStack,
                                {Node::Expr("state.title"), Node::Each("queries.feed", "note", {Node::Expr("note.content")})})};
    passes.run(body, context);

    SUBCASE("An item change is reported under a kept owner") {
        context.queries["feed"] = notes({"A", "B2"});
        auto edits              = passes.run(body, context);
        REQUIRE(kinds(edits) == std::vector{EditKind::Keep});
        REQUIRE(edits[0].nested.size() == 1);
        CHECK(kinds(edits[0].nested[0]) == std::vector{EditKind::Keep, EditKind::Rebuild});
    }

    SUBCASE("A rebuilt owner rebuilds its items") {
        context.state["title"] = "Latest";
        auto edits             = passes.run(body, context);
        REQUIRE(kinds(edits) == std::vector{EditKind::Rebuild});
        CHECK(kinds(edits[0].nested[0]) == std::vector{EditKind::Add, EditKind::Add});
        auto following = passes.run(body, context);
        CHECK(summarize(following).onlyKeeps());
    }
}

TEST_CASE("Failed expressions always rebuild") {
    Passes            passes;
    CountingEvaluator failing;
    passes.active = &failing;
    RenderContext context;
    context.state["count"] = 1;
    NodeList body{Node::Expr("state.count")};

    passes.run(body, context);
    failing.fail("state.count");

    auto broken = passes.run(body, context);
    REQUIRE(kinds(broken) == std::vector{EditKind::Rebuild});
    REQUIRE(broken[0].values.size() == 1);
    REQUIRE_FALSE(broken[0].values[0]);
    CHECK(broken[0].values[0].error().code == Error::Code::EvalError);
    CHECK_FALSE(passes.arena.states[0].exprValueHash);

    CHECK(kinds(passes.run(body, context)) == std::vector{EditKind::Rebuild});

    failing.heal();
    CHECK(kinds(passes.run(body, context)) == std::vector{EditKind::Rebuild});
    CHECK(kinds(passes.run(body, context)) == std::vector{EditKind::Keep});
}

TEST_CASE("Edit summaries") {
    EditOp keep{.kind = EditKind::Keep};
    EditOp add{.kind = EditKind::Add, .index = 1};
    EditOp remove{.kind = EditKind::Remove, .index = 2};
    EditOp rebuild{.kind = EditKind::Rebuild};
    keep.nested.push_back(EditList{add, remove});
    auto sum = summarize(EditList{keep, rebuild});
    CHECK(sum == EditSummary{1, 1, 1, 1});
    CHECK_FALSE(sum.onlyKeeps());
    CHECK(summarize({}).onlyKeeps());
    CHECK(editKindToString(EditKind::Rebuild) == "Rebuild");
}

} // TEST_SUITE
