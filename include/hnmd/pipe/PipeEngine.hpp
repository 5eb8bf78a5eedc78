#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/pipe/ExpressionEvaluator.hpp>
#include <hnmd/query/QueryStore.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace HN {

// A named transform: `expression` is evaluated against the JSON of every
// query and its result becomes the derived query `id`. `from` is the primary
// input and fixes the run order; it may be another pipe.
struct Pipe {
    std::string id;
    std::string from;
    std::string expression;

    bool operator==(Pipe const&) const = default;
};

struct PipeRunReport {
    std::size_t              evaluated = 0;
    std::size_t              changed   = 0;
    std::vector<std::string> failed;
};

/**
 * PipeEngine: keeps derived queries in step with their inputs.
 *
 * Pipes run in dependency order so a pipe reading another pipe sees the
 * value computed in the same pass. A pipe is evaluated when the version of
 * any query it can see (every raw query and every pipe ordered before it)
 * differs from the versions it last ran against. A failing pipe
 * keeps its previous value; the failure is logged and reported, never thrown.
 */
class PipeEngine {
public:
    PipeEngine(QueryStore& store, ExpressionEvaluator& evaluator);

    // Dependency order of pipes; InvalidConfiguration on duplicate ids or a cycle.
    [[nodiscard]] static auto Order(std::vector<Pipe> const& pipes) -> Expected<std::vector<Pipe>>;

    // Replaces the pipe set, declaring a derived query per pipe. Every `from`
    // must name a declared query or another pipe.
    auto configure(std::vector<Pipe> const& pipes) -> Expected<void>;

    auto recomputeStale() -> PipeRunReport;
    auto recompute(std::string const& pipeId) -> Expected<bool>;

    [[nodiscard]] auto pipes() const -> std::vector<Pipe>;

private:
    using InputVersions = std::vector<std::pair<std::string, std::uint64_t>>;

    auto inputVersions(std::size_t position, QuerySnapshot const& snapshot) const -> InputVersions;
    auto run(Pipe const& pipe, QuerySnapshot const& inputs) -> Expected<bool>;

    QueryStore&          store;
    ExpressionEvaluator& evaluator;

    mutable std::mutex                   mutex;
    std::vector<Pipe>                    ordered;
    std::map<std::string, InputVersions> seenInputs;
};

} // namespace HN
