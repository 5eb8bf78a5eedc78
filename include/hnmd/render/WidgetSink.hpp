#pragma once
#include <hnmd/pipe/PipeEngine.hpp>
#include <hnmd/render/Reconciler.hpp>

#include <chrono>
#include <cstdint>

namespace HN::Render {

struct RenderPassReport {
    std::uint64_t             pass          = 0; // counts up from 1 over the runtime's lifetime
    std::uint64_t             storeRevision = 0; // QueryStore revision the pass rendered
    bool                      reload        = false;
    EditSummary               summary;
    PipeRunReport             pipes;
    std::chrono::microseconds buildTime{0};
    std::chrono::microseconds reconcileTime{0};
};

/**
 * WidgetSink: the widget layer's end of a render pass.
 *
 * apply() is called on the render thread, once per pass, with the edits for
 * the top-level list scope. Nested lists on each op target the children of
 * that op's scope placeholders.
 */
struct WidgetSink {
    virtual ~WidgetSink() = default;

    virtual auto apply(EditList const& edits, RenderPassReport const& report) -> void = 0;
};

} // namespace HN::Render
