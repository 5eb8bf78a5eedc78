#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/core/Value.hpp>
#include <hnmd/data/Filter.hpp>
#include <hnmd/data/Record.hpp>
#include <hnmd/document/Node.hpp>
#include <hnmd/pipe/PipeEngine.hpp>
#include <hnmd/subscription/SubscriptionManager.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace HN {

// Record template published when a button fires. `content` and every tag
// value may contain {expression} spans.
struct ActionTemplate {
    std::uint32_t    kind = 1;
    std::string      content;
    std::vector<Tag> tags;

    bool operator==(ActionTemplate const&) const = default;
};

struct PropSchema {
    std::string          type     = "any";
    bool                 required = false;
    std::optional<Value> defaultValue;

    bool operator==(PropSchema const&) const = default;
};

struct ComponentDef {
    std::map<std::string, PropSchema> props;
    NodeList                          body;

    bool operator==(ComponentDef const&) const = default;
};

class ComponentRegistry {
public:
    auto add(std::string name, ComponentDef definition) -> void;
    [[nodiscard]] auto find(std::string const& name) const -> ComponentDef const*;
    [[nodiscard]] auto contains(std::string const& name) const -> bool;
    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const -> std::size_t { return this->components.size(); }

    bool operator==(ComponentRegistry const&) const = default;

private:
    std::map<std::string, ComponentDef> components;
};

struct Frontmatter {
    std::map<std::string, Filter>         filters;
    std::vector<Pipe>                     pipes;
    std::vector<LoadDependency>           loads;
    std::map<std::string, ActionTemplate> actions;
    Value                                 state = Value::object();

    // Every query id the document declares: filters, pipes and load targets.
    [[nodiscard]] auto queryIds() const -> std::set<std::string>;

    bool operator==(Frontmatter const&) const = default;
};

struct Document {
    std::string       version = "1.0.0";
    Frontmatter       frontmatter;
    NodeList          body;
    ComponentRegistry components;

    bool operator==(Document const&) const = default;
};

[[nodiscard]] auto frontmatterFromJson(Value const& json) -> Expected<Frontmatter>;
[[nodiscard]] auto frontmatterToJson(Frontmatter const& frontmatter) -> Value;

// {"version", "frontmatter", "body", "components": {"<name>": {"props", "body"}}}
[[nodiscard]] auto documentFromJson(Value const& json) -> Expected<Document>;
[[nodiscard]] auto documentToJson(Document const& document) -> Value;

/**
 * Structural checks run before anything is rendered:
 *  - pipes and loads read declared queries, pipes form no cycle
 *  - `queries.<id>` references in Each, If, Expr and prop expressions name a
 *    declared query
 *  - buttons name a declared action, component nodes a registered component,
 *    and components do not instantiate themselves
 * The first violation is returned.
 */
[[nodiscard]] auto validateDocument(Document const& document) -> Expected<void>;

// Query ids an expression reads through `queries.<id>` or `.queries.<id>`.
[[nodiscard]] auto referencedQueries(std::string_view expression) -> std::set<std::string>;

} // namespace HN
