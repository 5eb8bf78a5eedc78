#pragma once
#include <hnmd/core/Value.hpp>
#include <hnmd/document/Document.hpp>
#include <hnmd/document/Node.hpp>
#include <hnmd/pipe/ExpressionEvaluator.hpp>
#include <hnmd/render/RenderContext.hpp>

#include <cstddef>
#include <vector>

namespace HN::Render {

/**
 * MountedNode: one position of a concrete render tree.
 *
 * `node` is the static node with If branches and component instances resolved
 * away. Each and Component nodes stay in place as scope placeholders; their
 * instances live in `expansions`, one entry per placeholder in document order
 * (Each bodies are not entered). `bindings` are the locals this position
 * introduces (`as`/`itemIndex` or `props`); `scope` is every local visible at
 * this position, bindings included.
 */
struct MountedNode {
    Node                                  node;
    Value                                 bindings = Value::object();
    Value                                 scope    = Value::object();
    std::vector<std::vector<MountedNode>> expansions;
};

using MountedList = std::vector<MountedNode>;

/**
 * SnapshotBuilder: turns the static document body into the mounted sequence
 * for one render pass.
 *
 * - Each: `from` is evaluated; an array yields one instance per item, any
 *   other value a single instance, an evaluation failure none.
 * - If: exactly one branch is kept, as a group element; a failed condition
 *   selects the else branch.
 * - Component: one instance bound to `props`, built from the prop expressions
 *   and the declared defaults.
 * Expression leaves are left for the reconciler to evaluate.
 */
class SnapshotBuilder {
public:
    SnapshotBuilder(ExpressionEvaluator& evaluator, ComponentRegistry const& components);

    [[nodiscard]] auto build(NodeList const& nodes, RenderContext const& context) -> MountedList;

    static constexpr std::size_t MaxComponentDepth = 32;

private:
    auto resolveList(NodeList const& nodes, Value const& scope, std::vector<MountedList>& expansions, std::size_t depth) -> NodeList;
    auto resolve(Node const& node, Value const& scope, std::vector<MountedList>& expansions, std::size_t depth) -> Node;
    auto expandEach(EachNode const& each, Value const& scope, std::size_t depth) -> MountedList;
    auto expandComponent(ComponentNode const& component, Value const& scope, std::size_t depth) -> MountedList;
    auto mountInstance(NodeList const& body, Value bindings, Value const& scope, std::size_t depth, std::map<std::string, std::string> attributes)
        -> MountedNode;
    auto evaluate(std::string const& expression, Value const& scope) -> Expected<Value>;

    ExpressionEvaluator&     evaluator;
    ComponentRegistry const& components;
    Value                    context;
};

} // namespace HN::Render
