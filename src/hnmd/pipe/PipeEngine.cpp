#include <hnmd/pipe/PipeEngine.hpp>

#include <hnmd/log/TaggedLogger.hpp>

#include <algorithm>
#include <set>

namespace HN {

PipeEngine::PipeEngine(QueryStore& store, ExpressionEvaluator& evaluator)
    : store(store), evaluator(evaluator) {}

auto PipeEngine::Order(std::vector<Pipe> const& pipes) -> Expected<std::vector<Pipe>> {
    std::map<std::string, Pipe const*> byId;
    for (auto const& pipe : pipes) {
        if (!byId.emplace(pipe.id, &pipe).second)
            return std::unexpected(Error{Error::Code::InvalidConfiguration, "pipe '" + pipe.id + "' is declared twice"});
    }

    enum class Mark { Unvisited, Visiting, Done };
    std::map<std::string, Mark> marks;
    std::vector<Pipe>           out;
    out.reserve(pipes.size());

    // Depth-first over the `from` chain; a pipe is emitted after its input.
    for (auto const& pipe : pipes) {
        std::vector<Pipe const*> chain;
        Pipe const*              current = &pipe;
        while (current && marks[current->id] == Mark::Unvisited) {
            marks[current->id] = Mark::Visiting;
            chain.push_back(current);
            auto next = byId.find(current->from);
            current   = next == byId.end() ? nullptr : next->second;
        }
        if (current && marks[current->id] == Mark::Visiting)
            return std::unexpected(Error{Error::Code::InvalidConfiguration, "pipe '" + current->id + "' depends on itself"});
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            marks[(*it)->id] = Mark::Done;
            out.push_back(**it);
        }
    }
    return out;
}

auto PipeEngine::configure(std::vector<Pipe> const& pipes) -> Expected<void> {
    auto ordered = Order(pipes);
    if (!ordered)
        return std::unexpected(ordered.error());

    std::set<std::string> pipeIds;
    for (auto const& pipe : *ordered)
        pipeIds.insert(pipe.id);
    for (auto const& pipe : *ordered) {
        if (!pipeIds.contains(pipe.from) && !this->store.contains(pipe.from))
            return std::unexpected(Error{Error::Code::UnknownQueryReference, "pipe '" + pipe.id + "' reads undeclared query '" + pipe.from + "'"});
    }
    for (auto const& pipe : *ordered) {
        if (auto declared = this->store.declareDerived(pipe.id); !declared)
            return declared;
    }

    std::lock_guard<std::mutex> lock(this->mutex);
    for (auto const& pipe : *ordered) {
        auto previous = std::find_if(this->ordered.begin(), this->ordered.end(), [&](Pipe const& p) { return p.id == pipe.id; });
        if (previous == this->ordered.end() || *previous != pipe)
            this->seenInputs.erase(pipe.id);
    }
    this->ordered = std::move(*ordered);
    hn_log("PipeEngine::configure " + std::to_string(this->ordered.size()) + " pipes", "PipeEngine");
    return {};
}

auto PipeEngine::recomputeStale() -> PipeRunReport {
    std::lock_guard<std::mutex> lock(this->mutex);
    PipeRunReport               report;
    for (std::size_t position = 0; position < this->ordered.size(); ++position) {
        auto const& pipe     = this->ordered[position];
        auto        snapshot = this->store.snapshot();
        if (!snapshot.contains(pipe.from))
            continue;
        auto inputs = this->inputVersions(position, snapshot);
        auto seen   = this->seenInputs.find(pipe.id);
        if (seen != this->seenInputs.end() && seen->second == inputs)
            continue;

        ++report.evaluated;
        auto changed              = this->run(pipe, snapshot);
        this->seenInputs[pipe.id] = std::move(inputs);
        if (!changed)
            report.failed.push_back(pipe.id);
        else if (*changed)
            ++report.changed;
    }
    return report;
}

auto PipeEngine::recompute(std::string const& pipeId) -> Expected<bool> {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto it = std::find_if(this->ordered.begin(), this->ordered.end(), [&](Pipe const& p) { return p.id == pipeId; });
    if (it == this->ordered.end())
        return std::unexpected(Error{Error::Code::UnknownQueryReference, "no pipe named '" + pipeId + "'"});
    auto snapshot            = this->store.snapshot();
    this->seenInputs[it->id] = this->inputVersions(static_cast<std::size_t>(it - this->ordered.begin()), snapshot);
    return this->run(*it, snapshot);
}

auto PipeEngine::pipes() const -> std::vector<Pipe> {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->ordered;
}

// Versions of every query visible to the pipe at `position`: all queries
// except that pipe and the pipes ordered after it.
auto PipeEngine::inputVersions(std::size_t position, QuerySnapshot const& snapshot) const -> InputVersions {
    std::set<std::string> hidden;
    for (auto i = position; i < this->ordered.size(); ++i)
        hidden.insert(this->ordered[i].id);

    InputVersions versions;
    versions.reserve(snapshot.size());
    for (auto const& [queryId, query] : snapshot.entries()) {
        if (!hidden.contains(queryId))
            versions.emplace_back(queryId, query->version);
    }
    return versions;
}

auto PipeEngine::run(Pipe const& pipe, QuerySnapshot const& inputs) -> Expected<bool> {
    auto transform = [&](QuerySnapshot const& snapshot) { return this->evaluator.evaluate(pipe.expression, snapshot.toJson()); };
    auto changed   = this->store.recomputeDerived(pipe.id, transform, inputs);
    if (!changed)
        hn_log("PipeEngine pipe '" + pipe.id + "' failed: " + describeError(changed.error()), "PipeEngine", "Error");
    return changed;
}

} // namespace HN
