#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/core/Value.hpp>
#include <hnmd/data/Record.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace HN {

struct ExpressionEvaluator;

/**
 * Filter: declarative request descriptor for records.
 *
 * A filter read from the frontmatter is a template: author and `#p` entries that
 * are not literal 64-character hex keys are expressions over the runtime context.
 * Compile() resolves them and returns the immutable filter handed to the data
 * source. Tag constraints are keyed by their single-letter name without '#'.
 */
struct Filter {
    std::optional<std::vector<std::uint32_t>>       kinds;
    std::optional<std::vector<std::string>>         authors;
    std::optional<std::vector<std::string>>         ids;
    std::map<std::string, std::vector<std::string>> tags;
    std::optional<std::int64_t>                     since;
    std::optional<std::int64_t>                     until;
    std::optional<std::size_t>                      limit;

    [[nodiscard]] auto matches(Record const& record) const -> bool;
    [[nodiscard]] auto hasPlaceholders() const -> bool;

    [[nodiscard]] static auto Compile(Filter const& filterTemplate,
                                      Value const& context,
                                      ExpressionEvaluator& evaluator) -> Expected<Filter>;

    bool operator==(Filter const&) const = default;
};

[[nodiscard]] auto isHexKey(std::string_view text) -> bool;

[[nodiscard]] auto filterToJson(Filter const& filter) -> Value;
[[nodiscard]] auto filterFromJson(Value const& value) -> Expected<Filter>;

} // namespace HN
