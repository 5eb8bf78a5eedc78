#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/core/Value.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace HN {

struct Node;
using NodeList = std::vector<Node>;

enum class ElementKind {
    Heading,
    Paragraph,
    Strong,
    Emphasis,
    Link,
    List,
    ListItem,
    Image,
    Input,
    Spacer,
    VStack,
    HStack,
    Grid,
    Group
};

[[nodiscard]] auto elementKindToString(ElementKind kind) -> std::string_view;
[[nodiscard]] auto elementKindFromString(std::string_view name) -> std::optional<ElementKind>;

struct TextNode {
    std::string value;

    bool operator==(TextNode const&) const = default;
};

// Markdown and layout elements. Attributes carry the element's scalar
// properties (heading level, link url, image src, input name, ...).
struct ElementNode {
    ElementKind                        kind = ElementKind::Group;
    std::map<std::string, std::string> attributes;
    NodeList                           children;

    bool operator==(ElementNode const&) const;
};

// Repeats `body` once per item of the array `from` evaluates to, binding the
// item to `as` and its position to `itemIndex`.
struct EachNode {
    std::string from;
    std::string as;
    NodeList    body;

    bool operator==(EachNode const&) const;
};

// An empty `otherwise` renders nothing when the condition is falsy.
struct IfNode {
    std::string condition;
    NodeList    then;
    NodeList    otherwise;

    bool operator==(IfNode const&) const;
};

struct ButtonNode {
    std::string action;
    NodeList    children;

    bool operator==(ButtonNode const&) const;
};

// Expression interpolation leaf; `json` renders the value pretty-printed.
struct ExprNode {
    std::string expression;
    bool        json = false;

    bool operator==(ExprNode const&) const = default;
};

// Instance of a registered component. Each prop is an expression evaluated
// in the caller's context.
struct ComponentNode {
    std::string                        name;
    std::map<std::string, std::string> props;

    bool operator==(ComponentNode const&) const = default;
};

struct Node {
    using Variant = std::variant<TextNode, ElementNode, EachNode, IfNode, ButtonNode, ExprNode, ComponentNode>;

    Variant data;

    static auto Text(std::string value) -> Node;
    static auto Element(ElementKind kind, NodeList children = {}, std::map<std::string, std::string> attributes = {}) -> Node;
    static auto Each(std::string from, std::string as, NodeList body) -> Node;
    static auto If(std::string condition, NodeList then, NodeList otherwise = {}) -> Node;
    static auto Button(std::string action, NodeList children) -> Node;
    static auto Expr(std::string expression, bool json = false) -> Node;
    static auto Component(std::string name, std::map<std::string, std::string> props = {}) -> Node;

    template <typename T>
    [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(this->data);
    }
    template <typename T>
    [[nodiscard]] auto as() const -> T const* {
        return std::get_if<T>(&this->data);
    }

    [[nodiscard]] auto typeName() const -> std::string_view;

    bool operator==(Node const&) const;
};

// True when the node or a descendant is an expression leaf. Each bodies are
// not entered; they are diffed as their own scope.
[[nodiscard]] auto containsExpressions(Node const& node) -> bool;

// Expression leaves in document order, same traversal as containsExpressions.
[[nodiscard]] auto collectExpressions(Node const& node) -> std::vector<ExprNode const*>;

[[nodiscard]] auto nodeToJson(Node const& node) -> Value;
[[nodiscard]] auto nodeFromJson(Value const& json) -> Expected<Node>;
[[nodiscard]] auto nodesToJson(NodeList const& nodes) -> Value;
[[nodiscard]] auto nodesFromJson(Value const& json) -> Expected<NodeList>;

} // namespace HN
