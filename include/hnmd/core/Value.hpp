#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace HN {

// Opaque structurally-typed payload exchanged with the expression evaluator,
// the data source and the widget layer.
using Value = nlohmann::json;

// jq truthiness: only null and false are falsy.
[[nodiscard]] inline auto isTruthy(Value const& value) -> bool {
    if (value.is_null())
        return false;
    if (value.is_boolean())
        return value.get<bool>();
    return true;
}

// nlohmann::json keeps object keys ordered, so dump() is canonical.
[[nodiscard]] inline auto canonicalText(Value const& value) -> std::string {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

struct Fnv1a64 {
    std::uint64_t value = 1469598103934665603ull;

    void mix_bytes(void const* data, std::size_t size) {
        auto const* bytes = static_cast<unsigned char const*>(data);
        for (std::size_t i = 0; i < size; ++i) {
            value ^= static_cast<std::uint64_t>(bytes[i]);
            value *= 1099511628211ull;
        }
    }

    template <typename T>
    void mix_value(T const& v) {
        mix_bytes(&v, sizeof(v));
    }

    void mix_string(std::string const& s) {
        mix_bytes(s.data(), s.size());
        value ^= static_cast<std::uint64_t>(s.size());
        value *= 1099511628211ull;
    }
};

} // namespace HN
