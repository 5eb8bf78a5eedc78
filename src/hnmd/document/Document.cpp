#include <hnmd/document/Document.hpp>

#include <cctype>
#include <functional>
#include <utility>

namespace HN {

namespace {

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

auto section(Value const& json, char const* name) -> Expected<Value const*> {
    auto it = json.find(name);
    if (it == json.end() || it->is_null())
        return nullptr;
    if (!it->is_object())
        return std::unexpected(malformed(std::string{"frontmatter '"} + name + "' must be an object"));
    return &*it;
}

auto string_field(Value const& json, char const* name, std::string fallback) -> Expected<std::string> {
    auto it = json.find(name);
    if (it == json.end())
        return fallback;
    if (!it->is_string())
        return std::unexpected(malformed(std::string{"field '"} + name + "' must be a string"));
    return it->get<std::string>();
}

auto kind_field(Value const& json, std::uint32_t fallback) -> Expected<std::uint32_t> {
    auto it = json.find("kind");
    if (it == json.end())
        return fallback;
    if (!it->is_number_integer() || it->get<std::int64_t>() < 0)
        return std::unexpected(malformed("field 'kind' must be a non-negative integer"));
    return it->get<std::uint32_t>();
}

auto is_ident_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

auto check_queries(std::string_view expression, std::set<std::string> const& declared, std::string_view where) -> Expected<void> {
    for (auto const& id : referencedQueries(expression)) {
        if (!declared.contains(id))
            return std::unexpected(Error{Error::Code::UnknownQueryReference,
                                         std::string{where} + " reads undeclared query '" + id + "'"});
    }
    return {};
}

struct Validator {
    Document const&       document;
    std::set<std::string> declared;

    auto nodes(NodeList const& list) -> Expected<void> {
        for (auto const& node : list) {
            if (auto ok = this->node(node); !ok)
                return ok;
        }
        return {};
    }

    auto node(Node const& node) -> Expected<void> {
        if (auto const* element = node.as<ElementNode>())
            return this->nodes(element->children);
        if (auto const* each = node.as<EachNode>()) {
            if (auto ok = check_queries(each->from, this->declared, "each"); !ok)
                return ok;
            return this->nodes(each->body);
        }
        if (auto const* branch = node.as<IfNode>()) {
            if (auto ok = check_queries(branch->condition, this->declared, "if"); !ok)
                return ok;
            if (auto ok = this->nodes(branch->then); !ok)
                return ok;
            return this->nodes(branch->otherwise);
        }
        if (auto const* button = node.as<ButtonNode>()) {
            if (!button->action.empty() && !this->document.frontmatter.actions.contains(button->action))
                return std::unexpected(Error{Error::Code::UnknownActionReference, "button refers to undeclared action '" + button->action + "'"});
            return this->nodes(button->children);
        }
        if (auto const* expr = node.as<ExprNode>())
            return check_queries(expr->expression, this->declared, "expression");
        if (auto const* component = node.as<ComponentNode>()) {
            if (!this->document.components.contains(component->name))
                return std::unexpected(Error{Error::Code::UnknownComponentReference, "component '" + component->name + "' is not registered"});
            for (auto const& [name, expression] : component->props) {
                if (auto ok = check_queries(expression, this->declared, "prop '" + name + "'"); !ok)
                    return ok;
            }
        }
        return {};
    }
};

auto component_uses(NodeList const& list, std::set<std::string>& out) -> void {
    for (auto const& node : list) {
        if (auto const* element = node.as<ElementNode>())
            component_uses(element->children, out);
        else if (auto const* each = node.as<EachNode>())
            component_uses(each->body, out);
        else if (auto const* branch = node.as<IfNode>()) {
            component_uses(branch->then, out);
            component_uses(branch->otherwise, out);
        } else if (auto const* button = node.as<ButtonNode>())
            component_uses(button->children, out);
        else if (auto const* component = node.as<ComponentNode>())
            out.insert(component->name);
    }
}

} // namespace

auto ComponentRegistry::add(std::string name, ComponentDef definition) -> void {
    this->components.insert_or_assign(std::move(name), std::move(definition));
}

auto ComponentRegistry::find(std::string const& name) const -> ComponentDef const* {
    auto it = this->components.find(name);
    return it == this->components.end() ? nullptr : &it->second;
}

auto ComponentRegistry::contains(std::string const& name) const -> bool {
    return this->components.contains(name);
}

auto ComponentRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    for (auto const& [name, definition] : this->components)
        out.push_back(name);
    return out;
}

auto Frontmatter::queryIds() const -> std::set<std::string> {
    std::set<std::string> ids;
    for (auto const& [id, filter] : this->filters)
        ids.insert(id);
    for (auto const& pipe : this->pipes)
        ids.insert(pipe.id);
    for (auto const& load : this->loads)
        ids.insert(load.targetQuery);
    return ids;
}

auto referencedQueries(std::string_view expression) -> std::set<std::string> {
    constexpr std::string_view prefix = "queries.";
    std::set<std::string>      out;
    std::size_t                at = 0;
    while ((at = expression.find(prefix, at)) != std::string_view::npos) {
        bool boundary = at == 0 || !is_ident_char(expression[at - 1]);
        auto start    = at + prefix.size();
        auto end      = start;
        while (end < expression.size() && is_ident_char(expression[end]))
            ++end;
        if (boundary && end > start)
            out.emplace(expression.substr(start, end - start));
        at = end;
    }
    return out;
}

auto frontmatterFromJson(Value const& json) -> Expected<Frontmatter> {
    if (json.is_null())
        return Frontmatter{};
    if (!json.is_object())
        return std::unexpected(malformed("frontmatter must be a JSON object"));

    Frontmatter frontmatter;

    auto filters = section(json, "filters");
    if (!filters)
        return std::unexpected(filters.error());
    if (*filters) {
        for (auto const& [id, value] : (*filters)->items()) {
            auto filter = filterFromJson(value);
            if (!filter)
                return std::unexpected(Error{filter.error().code, "filter '" + id + "': " + filter.error().message.value_or("")});
            frontmatter.filters.emplace(id, std::move(*filter));
        }
    }

    auto pipes = section(json, "pipes");
    if (!pipes)
        return std::unexpected(pipes.error());
    if (*pipes) {
        for (auto const& [id, value] : (*pipes)->items()) {
            if (!value.is_object())
                return std::unexpected(malformed("pipe '" + id + "' must be an object"));
            auto from       = string_field(value, "from", "");
            auto expression = string_field(value, "jq", "");
            if (!from)
                return std::unexpected(from.error());
            if (!expression)
                return std::unexpected(expression.error());
            if (from->empty() || expression->empty())
                return std::unexpected(malformed("pipe '" + id + "' needs 'from' and 'jq'"));
            frontmatter.pipes.push_back(Pipe{id, std::move(*from), std::move(*expression)});
        }
    }

    auto loads = section(json, "loads");
    if (!loads)
        return std::unexpected(loads.error());
    if (*loads) {
        for (auto const& [id, value] : (*loads)->items()) {
            if (!value.is_object())
                return std::unexpected(malformed("load '" + id + "' must be an object"));
            auto from  = string_field(value, "from", "");
            auto field = string_field(value, "field", "pubkey");
            auto into  = string_field(value, "into", id);
            auto kind  = kind_field(value, 0);
            if (!from)
                return std::unexpected(from.error());
            if (!field)
                return std::unexpected(field.error());
            if (!into)
                return std::unexpected(into.error());
            if (!kind)
                return std::unexpected(kind.error());
            frontmatter.loads.push_back(LoadDependency{id, std::move(*from), *kind, std::move(*field), std::move(*into)});
        }
    }

    auto actions = section(json, "actions");
    if (!actions)
        return std::unexpected(actions.error());
    if (*actions) {
        for (auto const& [id, value] : (*actions)->items()) {
            if (!value.is_object())
                return std::unexpected(malformed("action '" + id + "' must be an object"));
            auto kind    = kind_field(value, 1);
            auto content = string_field(value, "content", "");
            if (!kind)
                return std::unexpected(kind.error());
            if (!content)
                return std::unexpected(content.error());
            ActionTemplate action{*kind, std::move(*content), {}};
            if (auto tags = value.find("tags"); tags != value.end()) {
                // Reuse the record decoder for the tag shape.
                auto decoded = recordFromJson(Value{{"id", id}, {"tags", *tags}});
                if (!decoded)
                    return std::unexpected(Error{decoded.error().code, "action '" + id + "': " + decoded.error().message.value_or("")});
                action.tags = std::move(decoded->tags);
            }
            frontmatter.actions.emplace(id, std::move(action));
        }
    }

    if (auto state = json.find("state"); state != json.end() && !state->is_null()) {
        if (!state->is_object())
            return std::unexpected(malformed("frontmatter 'state' must be an object"));
        frontmatter.state = *state;
    }
    return frontmatter;
}

auto frontmatterToJson(Frontmatter const& frontmatter) -> Value {
    Value json{{"filters", Value::object()}, {"pipes", Value::object()}, {"loads", Value::object()}, {"actions", Value::object()}, {"state", frontmatter.state}};
    for (auto const& [id, filter] : frontmatter.filters)
        json["filters"][id] = filterToJson(filter);
    for (auto const& pipe : frontmatter.pipes)
        json["pipes"][pipe.id] = Value{{"from", pipe.from}, {"jq", pipe.expression}};
    for (auto const& load : frontmatter.loads)
        json["loads"][load.id] = Value{{"from", load.sourceQuery}, {"kind", load.kind}, {"field", load.field}, {"into", load.targetQuery}};
    for (auto const& [id, action] : frontmatter.actions) {
        Value tags = Value::array();
        for (auto const& tag : action.tags)
            tags.push_back(tag);
        json["actions"][id] = Value{{"kind", action.kind}, {"content", action.content}, {"tags", std::move(tags)}};
    }
    return json;
}

auto documentFromJson(Value const& json) -> Expected<Document> {
    if (!json.is_object())
        return std::unexpected(malformed("document must be a JSON object"));

    Document document;
    if (auto version = json.find("version"); version != json.end() && version->is_string())
        document.version = version->get<std::string>();

    auto frontmatter = frontmatterFromJson(json.value("frontmatter", Value{}));
    if (!frontmatter)
        return std::unexpected(frontmatter.error());
    document.frontmatter = std::move(*frontmatter);

    auto body = nodesFromJson(json.value("body", Value::array()));
    if (!body)
        return std::unexpected(body.error());
    document.body = std::move(*body);

    if (auto components = json.find("components"); components != json.end()) {
        if (!components->is_object())
            return std::unexpected(malformed("'components' must be an object"));
        for (auto const& [name, value] : components->items()) {
            if (!value.is_object())
                return std::unexpected(malformed("component '" + name + "' must be an object"));
            ComponentDef definition;
            auto         componentBody = nodesFromJson(value.value("body", Value::array()));
            if (!componentBody)
                return std::unexpected(Error{componentBody.error().code, "component '" + name + "': " + componentBody.error().message.value_or("")});
            definition.body = std::move(*componentBody);
            if (auto props = value.find("props"); props != value.end() && props->is_object()) {
                for (auto const& [prop, schema] : props->items()) {
                    PropSchema parsed;
                    if (schema.is_string()) {
                        parsed.type = schema.get<std::string>();
                    } else if (schema.is_object()) {
                        parsed.type     = schema.value("type", std::string{"any"});
                        parsed.required = schema.value("required", false);
                        if (auto fallback = schema.find("default"); fallback != schema.end())
                            parsed.defaultValue = *fallback;
                    } else {
                        return std::unexpected(malformed("prop '" + prop + "' of component '" + name + "' must be a type name or an object"));
                    }
                    definition.props.emplace(prop, std::move(parsed));
                }
            }
            document.components.add(name, std::move(definition));
        }
    }
    return document;
}

auto documentToJson(Document const& document) -> Value {
    Value components = Value::object();
    for (auto const& name : document.components.names()) {
        auto const* definition = document.components.find(name);
        Value       props      = Value::object();
        for (auto const& [prop, schema] : definition->props) {
            Value entry{{"type", schema.type}, {"required", schema.required}};
            if (schema.defaultValue)
                entry["default"] = *schema.defaultValue;
            props[prop] = std::move(entry);
        }
        components[name] = Value{{"props", std::move(props)}, {"body", nodesToJson(definition->body)}};
    }
    return Value{{"version", document.version},
                 {"frontmatter", frontmatterToJson(document.frontmatter)},
                 {"body", nodesToJson(document.body)},
                 {"components", std::move(components)}};
}

auto validateDocument(Document const& document) -> Expected<void> {
    auto const& frontmatter = document.frontmatter;
    auto        declared    = frontmatter.queryIds();

    auto ordered = PipeEngine::Order(frontmatter.pipes);
    if (!ordered)
        return std::unexpected(ordered.error());
    for (auto const& pipe : frontmatter.pipes) {
        if (!declared.contains(pipe.from))
            return std::unexpected(Error{Error::Code::UnknownQueryReference, "pipe '" + pipe.id + "' reads undeclared query '" + pipe.from + "'"});
        if (auto ok = check_queries(pipe.expression, declared, "pipe '" + pipe.id + "'"); !ok)
            return ok;
    }

    std::set<std::string> rawQueries;
    for (auto const& [id, filter] : frontmatter.filters)
        rawQueries.insert(id);
    for (auto const& load : frontmatter.loads)
        rawQueries.insert(load.targetQuery);
    for (auto const& load : frontmatter.loads) {
        if (!rawQueries.contains(load.sourceQuery))
            return std::unexpected(Error{Error::Code::UnknownQueryReference, "load '" + load.id + "' reads undeclared query '" + load.sourceQuery + "'"});
        if (frontmatter.filters.contains(load.targetQuery))
            return std::unexpected(Error{Error::Code::InvalidConfiguration, "load '" + load.id + "' writes into filter query '" + load.targetQuery + "'"});
    }

    Validator validator{document, declared};
    if (auto ok = validator.nodes(document.body); !ok)
        return ok;
    for (auto const& name : document.components.names()) {
        if (auto ok = validator.nodes(document.components.find(name)->body); !ok)
            return std::unexpected(Error{ok.error().code, "component '" + name + "': " + ok.error().message.value_or("")});
    }

    // Components must not instantiate themselves, directly or through others.
    std::map<std::string, int>                         marks;
    std::function<Expected<void>(std::string const&)> visit = [&](std::string const& name) -> Expected<void> {
        auto& mark = marks[name];
        if (mark == 1)
            return std::unexpected(Error{Error::Code::InvalidConfiguration, "component '" + name + "' instantiates itself"});
        if (mark == 2)
            return {};
        mark = 1;
        std::set<std::string> uses;
        if (auto const* definition = document.components.find(name))
            component_uses(definition->body, uses);
        for (auto const& used : uses) {
            if (auto ok = visit(used); !ok)
                return ok;
        }
        marks[name] = 2;
        return {};
    };
    for (auto const& name : document.components.names()) {
        if (auto ok = visit(name); !ok)
            return ok;
    }
    return {};
}

} // namespace HN
