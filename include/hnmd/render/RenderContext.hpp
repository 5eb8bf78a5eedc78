#pragma once
#include <hnmd/core/Value.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace HN::Render {

// Everything an expression can read during a render pass.
struct RenderContext {
    Value                              user    = Value::object();
    Value                              state   = Value::object();
    std::map<std::string, std::string> form;
    Value                              queries = Value::object();

    // {"user", "state", "form", "queries"} with every local added at the top
    // level so `note.content` resolves without a prefix.
    [[nodiscard]] auto toJson(Value const& locals = Value::object()) const -> Value;
};

// Binds locals into a context object for the lifetime of the guard and
// restores whatever they shadowed afterwards.
class ScopedBindings {
public:
    ScopedBindings(Value& context, Value const& locals);
    ~ScopedBindings();

    ScopedBindings(ScopedBindings const&)            = delete;
    ScopedBindings& operator=(ScopedBindings const&) = delete;

private:
    Value&                                                    context;
    std::vector<std::pair<std::string, std::optional<Value>>> shadowed;
};

} // namespace HN::Render
