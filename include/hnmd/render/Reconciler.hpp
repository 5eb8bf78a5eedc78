#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/core/Value.hpp>
#include <hnmd/document/Node.hpp>
#include <hnmd/pipe/ExpressionEvaluator.hpp>
#include <hnmd/render/SnapshotBuilder.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace HN::Render {

struct ReconcileArena;

// What the reconciler remembers about one mounted position.
struct RenderState {
    Node                         lastNode;
    Value                        lastBindings = Value::object();
    std::uint64_t                generation   = 0;
    std::optional<std::uint64_t> exprValueHash; // unset when the node has no expressions or one failed
    std::vector<ReconcileArena>  nested;        // one per scope placeholder of lastNode
};

// Generational arena for one list scope. `generations` grows with the
// widest list ever seen and never shrinks, so a slot that is removed and
// added again keeps counting from where it was.
struct ReconcileArena {
    std::vector<RenderState>   states;
    std::vector<std::uint64_t> generations;
};

enum class EditKind {
    Keep,
    Rebuild,
    Add,
    Remove
};

[[nodiscard]] auto editKindToString(EditKind kind) -> std::string_view;

struct EditOp;
using EditList = std::vector<EditOp>;

// One operation against the widget layer's children of a list scope. Ops are
// ordered so that an op at index k may assume every earlier op was applied.
struct EditOp {
    EditKind                     kind  = EditKind::Keep;
    std::size_t                  index = 0;
    std::uint64_t                generation = 0;
    std::optional<MountedNode>   node;   // Rebuild and Add
    std::vector<Expected<Value>> values; // Rebuild and Add: one result per expression leaf, document order
    std::vector<EditList>        nested; // Keep, Rebuild and Add: one list per scope placeholder
};

struct ReconcileResult {
    ReconcileArena arena;
    EditList       edits;
};

struct EditSummary {
    std::size_t keeps    = 0;
    std::size_t rebuilds = 0;
    std::size_t adds     = 0;
    std::size_t removes  = 0;

    [[nodiscard]] auto onlyKeeps() const -> bool { return rebuilds == 0 && adds == 0 && removes == 0; }
    bool operator==(EditSummary const&) const = default;
};

/**
 * Positional diff of `next` against the arena of the previous pass.
 *
 * Index by index: a position missing from the old list is Add, one missing
 * from the new list is Remove. A position whose node or bindings changed is
 * Rebuild. Otherwise, if the node holds expression leaves they are evaluated
 * against `context` (with the position's scope bound) and the combined value
 * hash decides between Keep and Rebuild; a failed evaluation always rebuilds.
 * Scope placeholders are diffed one level down and reported on their owner.
 *
 * Ops come out as Keep/Rebuild in index order, then Remove from the tail,
 * then Add in ascending order. Rebuild bumps the slot generation, Keep and
 * Add leave it alone.
 */
[[nodiscard]] auto Reconcile(ReconcileArena const& old, MountedList const& next, Value const& context, ExpressionEvaluator& evaluator)
    -> ReconcileResult;

// Counts across the list and every nested list.
[[nodiscard]] auto summarize(EditList const& edits) -> EditSummary;

} // namespace HN::Render
