#include <hnmd/data/Filter.hpp>

#include <hnmd/log/TaggedLogger.hpp>
#include <hnmd/pipe/ExpressionEvaluator.hpp>

#include <algorithm>
#include <cctype>
#include <type_traits>

namespace HN {

namespace {

template <typename T>
auto contains(std::vector<T> const& values, T const& needle) -> bool {
    return std::find(values.begin(), values.end(), needle) != values.end();
}

auto resolve_keys(std::vector<std::string> const& entries,
                  Value const& context,
                  ExpressionEvaluator& evaluator,
                  std::string_view field) -> Expected<std::vector<std::string>> {
    std::vector<std::string> resolved;
    std::optional<Error>     lastError;
    for (auto const& entry : entries) {
        if (isHexKey(entry)) {
            resolved.push_back(entry);
            continue;
        }
        std::string_view expression = entry;
        if (expression.size() >= 2 && expression.front() == '{' && expression.back() == '}')
            expression = expression.substr(1, expression.size() - 2);
        auto value = evaluator.evaluate(expression, context);
        if (!value) {
            hn_log("Filter placeholder '" + entry + "' failed: " + describeError(value.error()), "Filter", "Error");
            lastError = value.error();
            continue;
        }
        if (value->is_string() && isHexKey(value->get<std::string>())) {
            resolved.push_back(value->get<std::string>());
        } else if (value->is_array()) {
            for (auto const& item : *value) {
                if (item.is_string() && isHexKey(item.get<std::string>()))
                    resolved.push_back(item.get<std::string>());
            }
        } else {
            hn_log("Filter placeholder '" + entry + "' did not produce a key", "Filter", "Error");
            lastError = Error{Error::Code::EvalError, "placeholder '" + entry + "' did not produce a hex key"};
        }
    }
    if (resolved.empty() && !entries.empty()) {
        // An empty constraint would widen the filter to every author.
        auto message = std::string{"no "} + std::string{field} + " placeholder resolved";
        if (lastError && lastError->message)
            message += ": " + *lastError->message;
        return std::unexpected(Error{Error::Code::EvalError, std::move(message)});
    }
    std::sort(resolved.begin(), resolved.end());
    resolved.erase(std::unique(resolved.begin(), resolved.end()), resolved.end());
    return resolved;
}

template <typename T>
auto read_list(Value const& value, std::string_view field) -> Expected<std::vector<T>> {
    if (!value.is_array())
        return std::unexpected(Error{Error::Code::MalformedInput, "filter field '" + std::string{field} + "' must be an array"});
    std::vector<T> out;
    for (auto const& item : value) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (!item.is_string())
                return std::unexpected(Error{Error::Code::MalformedInput, "filter field '" + std::string{field} + "' must contain strings"});
        } else {
            if (!item.is_number_integer())
                return std::unexpected(Error{Error::Code::MalformedInput, "filter field '" + std::string{field} + "' must contain integers"});
        }
        out.push_back(item.get<T>());
    }
    return out;
}

} // namespace

auto isHexKey(std::string_view text) -> bool {
    if (text.size() != 64)
        return false;
    return std::all_of(text.begin(), text.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

auto Filter::matches(Record const& record) const -> bool {
    if (this->kinds && !contains(*this->kinds, record.kind))
        return false;
    if (this->authors && !contains(*this->authors, record.pubkey))
        return false;
    if (this->ids && !contains(*this->ids, record.id))
        return false;
    if (this->since && record.created_at < *this->since)
        return false;
    if (this->until && record.created_at > *this->until)
        return false;
    for (auto const& [name, wanted] : this->tags) {
        auto present = record.tagValues(name);
        bool hit     = std::any_of(present.begin(), present.end(), [&](std::string const& v) { return contains(wanted, v); });
        if (!hit)
            return false;
    }
    return true;
}

auto Filter::hasPlaceholders() const -> bool {
    auto anyPlaceholder = [](std::vector<std::string> const& values) {
        return std::any_of(values.begin(), values.end(), [](std::string const& v) { return !isHexKey(v); });
    };
    if (this->authors && anyPlaceholder(*this->authors))
        return true;
    if (auto it = this->tags.find("p"); it != this->tags.end() && anyPlaceholder(it->second))
        return true;
    return false;
}

auto Filter::Compile(Filter const& filterTemplate, Value const& context, ExpressionEvaluator& evaluator) -> Expected<Filter> {
    Filter compiled = filterTemplate;
    if (filterTemplate.authors) {
        auto authors = resolve_keys(*filterTemplate.authors, context, evaluator, "author");
        if (!authors)
            return std::unexpected(authors.error());
        compiled.authors = std::move(*authors);
    }
    if (auto it = filterTemplate.tags.find("p"); it != filterTemplate.tags.end()) {
        auto pubkeys = resolve_keys(it->second, context, evaluator, "#p");
        if (!pubkeys)
            return std::unexpected(pubkeys.error());
        compiled.tags["p"] = std::move(*pubkeys);
    }
    if (compiled.since && compiled.until && *compiled.since > *compiled.until)
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "filter since is after until"});
    return compiled;
}

auto filterToJson(Filter const& filter) -> Value {
    Value json = Value::object();
    if (filter.kinds)
        json["kinds"] = *filter.kinds;
    if (filter.authors)
        json["authors"] = *filter.authors;
    if (filter.ids)
        json["ids"] = *filter.ids;
    for (auto const& [name, values] : filter.tags)
        json["#" + name] = values;
    if (filter.since)
        json["since"] = *filter.since;
    if (filter.until)
        json["until"] = *filter.until;
    if (filter.limit)
        json["limit"] = *filter.limit;
    return json;
}

auto filterFromJson(Value const& value) -> Expected<Filter> {
    if (!value.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "filter must be a JSON object"});

    Filter filter;
    for (auto const& [key, field] : value.items()) {
        if (key == "kinds") {
            auto kinds = read_list<std::uint32_t>(field, key);
            if (!kinds)
                return std::unexpected(kinds.error());
            filter.kinds = std::move(*kinds);
        } else if (key == "authors") {
            auto authors = read_list<std::string>(field, key);
            if (!authors)
                return std::unexpected(authors.error());
            filter.authors = std::move(*authors);
        } else if (key == "ids") {
            auto ids = read_list<std::string>(field, key);
            if (!ids)
                return std::unexpected(ids.error());
            filter.ids = std::move(*ids);
        } else if (key.size() == 2 && key[0] == '#') {
            auto values = read_list<std::string>(field, key);
            if (!values)
                return std::unexpected(values.error());
            filter.tags[key.substr(1)] = std::move(*values);
        } else if (key == "since" || key == "until") {
            if (!field.is_number_integer())
                return std::unexpected(Error{Error::Code::MalformedInput, "filter field '" + key + "' must be an integer"});
            (key == "since" ? filter.since : filter.until) = field.get<std::int64_t>();
        } else if (key == "limit") {
            if (!field.is_number_integer() || field.get<std::int64_t>() < 0)
                return std::unexpected(Error{Error::Code::MalformedInput, "filter limit must be a non-negative integer"});
            filter.limit = field.get<std::size_t>();
        } else {
            return std::unexpected(Error{Error::Code::MalformedInput, "unknown filter field '" + key + "'"});
        }
    }
    return filter;
}

} // namespace HN
