#include <hnmd/document/Node.hpp>

#include <array>
#include <utility>

namespace HN {

namespace {

constexpr std::array<std::pair<ElementKind, std::string_view>, 14> kElementNames{{
        {ElementKind::Heading, "heading"},
        {ElementKind::Paragraph, "paragraph"},
        {ElementKind::Strong, "strong"},
        {ElementKind::Emphasis, "emphasis"},
        {ElementKind::Link, "link"},
        {ElementKind::List, "list"},
        {ElementKind::ListItem, "list_item"},
        {ElementKind::Image, "image"},
        {ElementKind::Input, "input"},
        {ElementKind::Spacer, "spacer"},
        {ElementKind::VStack, "vstack"},
        {ElementKind::HStack, "hstack"},
        {ElementKind::Grid, "grid"},
        {ElementKind::Group, "group"},
}};

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

auto collect(Node const& node, std::vector<ExprNode const*>& out) -> void {
    std::visit(overloaded{
                       [&](ExprNode const& expr) { out.push_back(&expr); },
                       [&](ElementNode const& element) {
                           for (auto const& child : element.children)
                               collect(child, out);
                       },
                       [&](ButtonNode const& button) {
                           for (auto const& child : button.children)
                               collect(child, out);
                       },
                       [&](IfNode const& branch) {
                           for (auto const& child : branch.then)
                               collect(child, out);
                           for (auto const& child : branch.otherwise)
                               collect(child, out);
                       },
                       [](auto const&) {},
               },
               node.data);
}

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto read_string(Value const& json, char const* field, bool required = true) -> Expected<std::string> {
    auto it = json.find(field);
    if (it == json.end()) {
        if (required)
            return std::unexpected(malformed(std::string{"node is missing '"} + field + "'"));
        return std::string{};
    }
    if (!it->is_string())
        return std::unexpected(malformed(std::string{"node field '"} + field + "' must be a string"));
    return it->get<std::string>();
}

auto read_children(Value const& json, char const* field) -> Expected<NodeList> {
    auto it = json.find(field);
    if (it == json.end())
        return NodeList{};
    return nodesFromJson(*it);
}

auto read_string_map(Value const& json, char const* field) -> Expected<std::map<std::string, std::string>> {
    std::map<std::string, std::string> out;
    auto                               it = json.find(field);
    if (it == json.end())
        return out;
    if (!it->is_object())
        return std::unexpected(malformed(std::string{"node field '"} + field + "' must be an object"));
    for (auto const& [key, value] : it->items()) {
        if (value.is_string())
            out.emplace(key, value.get<std::string>());
        else
            out.emplace(key, canonicalText(value));
    }
    return out;
}

} // namespace

auto elementKindToString(ElementKind kind) -> std::string_view {
    for (auto const& [k, name] : kElementNames) {
        if (k == kind)
            return name;
    }
    return "group";
}

auto elementKindFromString(std::string_view name) -> std::optional<ElementKind> {
    for (auto const& [kind, n] : kElementNames) {
        if (n == name)
            return kind;
    }
    return std::nullopt;
}

bool ElementNode::operator==(ElementNode const&) const = default;
bool EachNode::operator==(EachNode const&) const       = default;
bool IfNode::operator==(IfNode const&) const           = default;
bool ButtonNode::operator==(ButtonNode const&) const   = default;
bool Node::operator==(Node const&) const               = default;

auto Node::Text(std::string value) -> Node {
    return Node{TextNode{std::move(value)}};
}

auto Node::Element(ElementKind kind, NodeList children, std::map<std::string, std::string> attributes) -> Node {
    return Node{ElementNode{kind, std::move(attributes), std::move(children)}};
}

auto Node::Each(std::string from, std::string as, NodeList body) -> Node {
    return Node{EachNode{std::move(from), std::move(as), std::move(body)}};
}

auto Node::If(std::string condition, NodeList then, NodeList otherwise) -> Node {
    return Node{IfNode{std::move(condition), std::move(then), std::move(otherwise)}};
}

auto Node::Button(std::string action, NodeList children) -> Node {
    return Node{ButtonNode{std::move(action), std::move(children)}};
}

auto Node::Expr(std::string expression, bool json) -> Node {
    return Node{ExprNode{std::move(expression), json}};
}

auto Node::Component(std::string name, std::map<std::string, std::string> props) -> Node {
    return Node{ComponentNode{std::move(name), std::move(props)}};
}

auto Node::typeName() const -> std::string_view {
    return std::visit(overloaded{
                              [](TextNode const&) -> std::string_view { return "text"; },
                              [](ElementNode const& element) -> std::string_view { return elementKindToString(element.kind); },
                              [](EachNode const&) -> std::string_view { return "each"; },
                              [](IfNode const&) -> std::string_view { return "if"; },
                              [](ButtonNode const&) -> std::string_view { return "button"; },
                              [](ExprNode const& expr) -> std::string_view { return expr.json ? "json" : "expr"; },
                              [](ComponentNode const&) -> std::string_view { return "component"; },
                      },
                      this->data);
}

auto containsExpressions(Node const& node) -> bool {
    return !collectExpressions(node).empty();
}

auto collectExpressions(Node const& node) -> std::vector<ExprNode const*> {
    std::vector<ExprNode const*> out;
    collect(node, out);
    return out;
}

auto nodeToJson(Node const& node) -> Value {
    return std::visit(overloaded{
                              [](TextNode const& text) { return Value{{"type", "text"}, {"value", text.value}}; },
                              [](ElementNode const& element) {
                                  Value json{{"type", std::string{elementKindToString(element.kind)}}, {"children", nodesToJson(element.children)}};
                                  if (!element.attributes.empty())
                                      json["attributes"] = element.attributes;
                                  return json;
                              },
                              [](EachNode const& each) {
                                  return Value{{"type", "each"}, {"from", each.from}, {"as", each.as}, {"children", nodesToJson(each.body)}};
                              },
                              [](IfNode const& branch) {
                                  Value json{{"type", "if"}, {"value", branch.condition}, {"children", nodesToJson(branch.then)}};
                                  if (!branch.otherwise.empty())
                                      json["else"] = nodesToJson(branch.otherwise);
                                  return json;
                              },
                              [](ButtonNode const& button) {
                                  return Value{{"type", "button"}, {"action", button.action}, {"children", nodesToJson(button.children)}};
                              },
                              [](ExprNode const& expr) {
                                  if (expr.json)
                                      return Value{{"type", "json"}, {"value", expr.expression}};
                                  return Value{{"type", "expr"}, {"expression", expr.expression}};
                              },
                              [](ComponentNode const& component) {
                                  return Value{{"type", "component"}, {"name", component.name}, {"props", component.props}};
                              },
                      },
                      node.data);
}

auto nodeFromJson(Value const& json) -> Expected<Node> {
    if (!json.is_object())
        return std::unexpected(malformed("node must be a JSON object"));
    auto type = read_string(json, "type");
    if (!type)
        return std::unexpected(type.error());

    if (*type == "text") {
        auto value = read_string(json, "value");
        if (!value)
            return std::unexpected(value.error());
        return Node::Text(std::move(*value));
    }
    if (*type == "expr" || *type == "json") {
        auto expression = read_string(json, *type == "expr" ? "expression" : "value");
        if (!expression)
            return std::unexpected(expression.error());
        return Node::Expr(std::move(*expression), *type == "json");
    }
    if (*type == "each") {
        auto from     = read_string(json, "from");
        auto as       = read_string(json, "as");
        auto children = read_children(json, "children");
        if (!from)
            return std::unexpected(from.error());
        if (!as)
            return std::unexpected(as.error());
        if (!children)
            return std::unexpected(children.error());
        return Node::Each(std::move(*from), std::move(*as), std::move(*children));
    }
    if (*type == "if") {
        auto condition = read_string(json, "value");
        auto then      = read_children(json, "children");
        auto otherwise = read_children(json, "else");
        if (!condition)
            return std::unexpected(condition.error());
        if (!then)
            return std::unexpected(then.error());
        if (!otherwise)
            return std::unexpected(otherwise.error());
        return Node::If(std::move(*condition), std::move(*then), std::move(*otherwise));
    }
    if (*type == "button") {
        auto action   = read_string(json, "action", false);
        auto children = read_children(json, "children");
        if (!action)
            return std::unexpected(action.error());
        if (!children)
            return std::unexpected(children.error());
        return Node::Button(std::move(*action), std::move(*children));
    }
    if (*type == "component") {
        auto name  = read_string(json, "name");
        auto props = read_string_map(json, "props");
        if (!name)
            return std::unexpected(name.error());
        if (!props)
            return std::unexpected(props.error());
        return Node::Component(std::move(*name), std::move(*props));
    }
    if (auto kind = elementKindFromString(*type)) {
        auto children   = read_children(json, "children");
        auto attributes = read_string_map(json, "attributes");
        if (!children)
            return std::unexpected(children.error());
        if (!attributes)
            return std::unexpected(attributes.error());
        return Node::Element(*kind, std::move(*children), std::move(*attributes));
    }
    return std::unexpected(malformed("unknown node type '" + *type + "'"));
}

auto nodesToJson(NodeList const& nodes) -> Value {
    Value out = Value::array();
    for (auto const& node : nodes)
        out.push_back(nodeToJson(node));
    return out;
}

auto nodesFromJson(Value const& json) -> Expected<NodeList> {
    if (!json.is_array())
        return std::unexpected(malformed("node list must be a JSON array"));
    NodeList out;
    out.reserve(json.size());
    for (auto const& item : json) {
        auto node = nodeFromJson(item);
        if (!node)
            return std::unexpected(node.error());
        out.push_back(std::move(*node));
    }
    return out;
}

} // namespace HN
