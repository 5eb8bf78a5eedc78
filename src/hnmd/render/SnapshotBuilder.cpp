#include <hnmd/render/SnapshotBuilder.hpp>

#include <hnmd/log/TaggedLogger.hpp>

#include <utility>

namespace HN::Render {

namespace {

auto with_locals(Value const& scope, Value const& bindings) -> Value {
    Value merged = scope;
    for (auto const& [key, value] : bindings.items())
        merged[key] = value;
    return merged;
}

} // namespace

SnapshotBuilder::SnapshotBuilder(ExpressionEvaluator& evaluator, ComponentRegistry const& components)
    : evaluator(evaluator), components(components) {}

auto SnapshotBuilder::build(NodeList const& nodes, RenderContext const& context) -> MountedList {
    this->context = context.toJson();
    auto const scope = Value::object();

    MountedList mounted;
    mounted.reserve(nodes.size());
    for (auto const& node : nodes) {
        MountedNode position;
        position.node = this->resolve(node, scope, position.expansions, 0);
        mounted.push_back(std::move(position));
    }
    hn_log("SnapshotBuilder::build mounted " + std::to_string(mounted.size()) + " positions", "Snapshot");
    return mounted;
}

auto SnapshotBuilder::resolveList(NodeList const& nodes, Value const& scope, std::vector<MountedList>& expansions, std::size_t depth) -> NodeList {
    NodeList out;
    out.reserve(nodes.size());
    for (auto const& node : nodes)
        out.push_back(this->resolve(node, scope, expansions, depth));
    return out;
}

auto SnapshotBuilder::resolve(Node const& node, Value const& scope, std::vector<MountedList>& expansions, std::size_t depth) -> Node {
    if (auto const* element = node.as<ElementNode>())
        return Node::Element(element->kind, this->resolveList(element->children, scope, expansions, depth), element->attributes);
    if (auto const* button = node.as<ButtonNode>())
        return Node::Button(button->action, this->resolveList(button->children, scope, expansions, depth));
    if (auto const* branch = node.as<IfNode>()) {
        auto condition = this->evaluate(branch->condition, scope);
        if (!condition)
            hn_log("If condition '" + branch->condition + "' failed, using else: " + describeError(condition.error()), "Snapshot", "Error");
        bool taken = condition && isTruthy(*condition);
        return Node::Element(ElementKind::Group,
                             this->resolveList(taken ? branch->then : branch->otherwise, scope, expansions, depth),
                             {{"branch", taken ? "then" : "else"}});
    }
    if (auto const* each = node.as<EachNode>()) {
        expansions.push_back(this->expandEach(*each, scope, depth));
        return node;
    }
    if (auto const* component = node.as<ComponentNode>()) {
        expansions.push_back(this->expandComponent(*component, scope, depth));
        return node;
    }
    return node;
}

auto SnapshotBuilder::expandEach(EachNode const& each, Value const& scope, std::size_t depth) -> MountedList {
    auto source = this->evaluate(each.from, scope);
    if (!source) {
        hn_log("Each source '" + each.from + "' failed: " + describeError(source.error()), "Snapshot", "Error");
        return {};
    }

    Value items = Value::array();
    if (source->is_array())
        items = std::move(*source);
    else if (!source->is_null())
        items.push_back(std::move(*source));

    MountedList instances;
    instances.reserve(items.size());
    for (std::size_t index = 0; index < items.size(); ++index) {
        Value bindings{{each.as, items[index]}, {"itemIndex", index}};
        instances.push_back(this->mountInstance(each.body, std::move(bindings), scope, depth, {}));
    }
    return instances;
}

auto SnapshotBuilder::expandComponent(ComponentNode const& component, Value const& scope, std::size_t depth) -> MountedList {
    auto const* definition = this->components.find(component.name);
    if (!definition || depth >= MaxComponentDepth) {
        hn_log("Component '" + component.name + "' cannot be expanded", "Snapshot", "Error");
        MountedNode missing;
        missing.node  = Node::Text("[component " + component.name + " unavailable]");
        missing.scope = scope;
        return {std::move(missing)};
    }

    Value props = Value::object();
    for (auto const& [name, expression] : component.props) {
        auto value = this->evaluate(expression, scope);
        if (!value) {
            hn_log("Prop '" + name + "' of '" + component.name + "' failed: " + describeError(value.error()), "Snapshot", "Error");
            continue;
        }
        props[name] = std::move(*value);
    }
    for (auto const& [name, schema] : definition->props) {
        if (!props.contains(name) && schema.defaultValue)
            props[name] = *schema.defaultValue;
    }

    Value bindings{{"props", std::move(props)}};
    MountedList instance;
    instance.push_back(this->mountInstance(definition->body, std::move(bindings), scope, depth + 1, {{"component", component.name}}));
    return instance;
}

auto SnapshotBuilder::mountInstance(NodeList const& body, Value bindings, Value const& scope, std::size_t depth, std::map<std::string, std::string> attributes)
    -> MountedNode {
    MountedNode instance;
    instance.scope    = with_locals(scope, bindings);
    instance.node     = Node::Element(ElementKind::Group, this->resolveList(body, instance.scope, instance.expansions, depth), std::move(attributes));
    instance.bindings = std::move(bindings);
    return instance;
}

auto SnapshotBuilder::evaluate(std::string const& expression, Value const& scope) -> Expected<Value> {
    ScopedBindings bound(this->context, scope);
    return this->evaluator.evaluate(expression, this->context);
}

} // namespace HN::Render
