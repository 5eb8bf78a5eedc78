#pragma once
#include <hnmd/core/Value.hpp>
#include <hnmd/data/Record.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace HN {

// A versioned result set. Raw queries hold ordered records, derived queries
// hold the value produced by their pipe.
struct Query {
    enum class Kind {
        Raw,
        Derived
    };

    std::string                id;
    Kind                       kind = Kind::Raw;
    std::vector<Record>        items;
    Value                      value;
    std::uint64_t              version = 0;
    std::optional<std::size_t> limit;

    // The JSON form seen by expressions: an array of records for raw queries,
    // the pipe result (null until first computed) for derived ones.
    [[nodiscard]] auto toJson() const -> Value;
};

[[nodiscard]] auto queryKindToString(Query::Kind kind) -> std::string_view;

} // namespace HN
