#include <hnmd/render/RenderContext.hpp>

namespace HN::Render {

auto RenderContext::toJson(Value const& locals) const -> Value {
    Value json{{"user", this->user}, {"state", this->state}, {"form", this->form}, {"queries", this->queries}};
    if (locals.is_object()) {
        for (auto const& [key, value] : locals.items())
            json[key] = value;
    }
    return json;
}

ScopedBindings::ScopedBindings(Value& context, Value const& locals) : context(context) {
    if (!locals.is_object() || !context.is_object())
        return;
    this->shadowed.reserve(locals.size());
    for (auto const& [key, value] : locals.items()) {
        auto it = context.find(key);
        if (it == context.end())
            this->shadowed.emplace_back(key, std::nullopt);
        else
            this->shadowed.emplace_back(key, std::move(*it));
        context[key] = value;
    }
}

ScopedBindings::~ScopedBindings() {
    for (auto it = this->shadowed.rbegin(); it != this->shadowed.rend(); ++it) {
        if (it->second)
            this->context[it->first] = std::move(*it->second);
        else
            this->context.erase(it->first);
    }
}

} // namespace HN::Render
