#include <hnmd/render/Reconciler.hpp>

#include <hnmd/log/TaggedLogger.hpp>
#include <hnmd/render/RenderContext.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace HN::Render {

namespace {

struct EvaluatedLeaves {
    bool                         any = false;
    std::vector<Expected<Value>> values;
    std::optional<std::uint64_t> hash; // unset on any failure
};

auto evaluate_leaves(MountedNode const& position, Value& context, ExpressionEvaluator& evaluator) -> EvaluatedLeaves {
    EvaluatedLeaves out;
    auto const      leaves = collectExpressions(position.node);
    if (leaves.empty())
        return out;

    out.any = true;
    out.values.reserve(leaves.size());
    ScopedBindings bound(context, position.scope);
    Fnv1a64        hash;
    bool           failed = false;
    for (auto const* leaf : leaves) {
        auto value = evaluator.evaluate(leaf->expression, context);
        if (value) {
            hash.mix_string(canonicalText(*value));
        } else {
            hn_log("Expression '" + leaf->expression + "' failed: " + describeError(value.error()), "Reconcile", "Error");
            failed = true;
        }
        out.values.push_back(std::move(value));
    }
    if (!failed)
        out.hash = hash.value;
    return out;
}

auto reconcile_arena(ReconcileArena const& old, MountedList const& next, Value& context, ExpressionEvaluator& evaluator) -> ReconcileResult;

// Diffs every scope placeholder of a mounted position. Only a kept position
// carries its previous child arenas forward; otherwise the children start
// over from empty states while keeping the slot generations they reached.
auto reconcile_nested(RenderState const* prior, bool keep, MountedNode const& position, Value& context, ExpressionEvaluator& evaluator,
                      std::vector<ReconcileArena>& arenas, std::vector<EditList>& edits) -> void {
    arenas.reserve(position.expansions.size());
    edits.reserve(position.expansions.size());
    for (std::size_t k = 0; k < position.expansions.size(); ++k) {
        ReconcileArena base;
        if (prior && k < prior->nested.size()) {
            if (keep)
                base = prior->nested[k];
            else
                base.generations = prior->nested[k].generations;
        }
        auto result = reconcile_arena(base, position.expansions[k], context, evaluator);
        arenas.push_back(std::move(result.arena));
        edits.push_back(std::move(result.edits));
    }
}

auto reconcile_arena(ReconcileArena const& old, MountedList const& next, Value& context, ExpressionEvaluator& evaluator) -> ReconcileResult {
    ReconcileResult result;
    auto&           arena = result.arena;
    arena.generations     = old.generations;
    if (arena.generations.size() < next.size())
        arena.generations.resize(next.size(), 0);
    arena.states.reserve(next.size());

    EditList updates;
    EditList additions;
    for (std::size_t index = 0; index < next.size(); ++index) {
        auto const& position  = next[index];
        auto        evaluated = evaluate_leaves(position, context, evaluator);

        RenderState state;
        state.lastNode      = position.node;
        state.lastBindings  = position.bindings;
        state.exprValueHash = evaluated.hash;

        EditOp op;
        op.index = index;

        RenderState const* prior = index < old.states.size() ? &old.states[index] : nullptr;
        bool               keep  = false;
        if (prior) {
            bool const same = prior->lastNode == position.node && prior->lastBindings == position.bindings;
            keep            = same && (!evaluated.any || (evaluated.hash && prior->exprValueHash == evaluated.hash));
            if (keep) {
                op.kind = EditKind::Keep;
            } else {
                op.kind = EditKind::Rebuild;
                ++arena.generations[index];
            }
        } else {
            op.kind = EditKind::Add;
        }
        if (!keep) {
            op.node   = position;
            op.values = std::move(evaluated.values);
        }
        op.generation    = arena.generations[index];
        state.generation = arena.generations[index];

        reconcile_nested(prior, keep, position, context, evaluator, state.nested, op.nested);
        arena.states.push_back(std::move(state));
        (prior ? updates : additions).push_back(std::move(op));
    }

    auto& edits = result.edits;
    edits.reserve(updates.size() + additions.size() + (old.states.size() > next.size() ? old.states.size() - next.size() : 0));
    std::move(updates.begin(), updates.end(), std::back_inserter(edits));
    for (std::size_t index = old.states.size(); index > next.size(); --index) {
        EditOp op;
        op.kind       = EditKind::Remove;
        op.index      = index - 1;
        op.generation = arena.generations[index - 1];
        edits.push_back(std::move(op));
    }
    std::move(additions.begin(), additions.end(), std::back_inserter(edits));
    return result;
}

} // namespace

auto editKindToString(EditKind kind) -> std::string_view {
    switch (kind) {
        case EditKind::Keep:
            return "Keep";
        case EditKind::Rebuild:
            return "Rebuild";
        case EditKind::Add:
            return "Add";
        case EditKind::Remove:
            return "Remove";
    }
    return "Unknown";
}

auto Reconcile(ReconcileArena const& old, MountedList const& next, Value const& context, ExpressionEvaluator& evaluator) -> ReconcileResult {
    Value scratch = context;
    auto  result  = reconcile_arena(old, next, scratch, evaluator);
    [[maybe_unused]] auto const summary = summarize(result.edits);
    hn_log("Reconcile keeps=" + std::to_string(summary.keeps) + " rebuilds=" + std::to_string(summary.rebuilds) + " adds="
                   + std::to_string(summary.adds) + " removes=" + std::to_string(summary.removes),
           "Reconcile");
    return result;
}

auto summarize(EditList const& edits) -> EditSummary {
    EditSummary summary;
    for (auto const& op : edits) {
        switch (op.kind) {
            case EditKind::Keep:
                ++summary.keeps;
                break;
            case EditKind::Rebuild:
                ++summary.rebuilds;
                break;
            case EditKind::Add:
                ++summary.adds;
                break;
            case EditKind::Remove:
                ++summary.removes;
                break;
        }
        for (auto const& list : op.nested) {
            auto inner = summarize(list);
            summary.keeps += inner.keeps;
            summary.rebuilds += inner.rebuilds;
            summary.adds += inner.adds;
            summary.removes += inner.removes;
        }
    }
    return summary;
}

} // namespace HN::Render
