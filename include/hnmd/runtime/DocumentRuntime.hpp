#pragma once
#include <hnmd/core/Error.hpp>
#include <hnmd/core/Value.hpp>
#include <hnmd/data/Record.hpp>
#include <hnmd/document/Document.hpp>
#include <hnmd/loader/LoaderCache.hpp>
#include <hnmd/pipe/ExpressionEvaluator.hpp>
#include <hnmd/pipe/PipeEngine.hpp>
#include <hnmd/query/QueryStore.hpp>
#include <hnmd/render/Reconciler.hpp>
#include <hnmd/render/RenderContext.hpp>
#include <hnmd/render/WidgetSink.hpp>
#include <hnmd/runtime/RuntimeOptions.hpp>
#include <hnmd/source/DataSource.hpp>
#include <hnmd/subscription/SubscriptionManager.hpp>
#include <hnmd/task/TaskPool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

namespace HN {

/**
 * DocumentRuntime: wires one document to its data and its widget layer.
 *
 * Owns the query store, the loader cache, the data context (a TaskPool) and
 * the single render thread. Every change to a raw query, and every local
 * mutation, requests a render; requests that arrive within the debounce
 * window share one pass. A pass recomputes stale pipes, builds the mounted
 * tree from one store snapshot, reconciles it against the previous pass and
 * hands the edits to the WidgetSink.
 *
 * Filters whose author placeholders read queries are compiled again on every
 * pass and reopened when the compiled filter changes. A failed filter keeps
 * its items and is reopened by a later pass, with the delay between attempts
 * doubling from the stream poll interval.
 */
class DocumentRuntime {
public:
    // Validates the document; structural errors are returned here and nothing starts.
    [[nodiscard]] static auto Create(Document document,
                                     DataSource& source,
                                     ExpressionEvaluator& evaluator,
                                     Render::WidgetSink& sink,
                                     RuntimeOptions options = {},
                                     Value user = Value::object()) -> Expected<std::unique_ptr<DocumentRuntime>>;

    ~DocumentRuntime();

    DocumentRuntime(DocumentRuntime const&)            = delete;
    DocumentRuntime& operator=(DocumentRuntime const&) = delete;

    auto start() -> Expected<void>;
    // Cancels subscriptions and stops the render thread. Loads already in
    // flight are given the fetch timeout to land in the cache.
    auto stop() -> void;

    // Hot reload. On error the running document is left untouched.
    auto reload(Document document) -> Expected<void>;

    // Runs a pass on the calling thread.
    auto renderNow() -> Render::RenderPassReport;
    auto requestRender() -> void;

    auto setState(std::string const& key, Value value) -> void;
    auto setFormField(std::string const& name, std::string value) -> void;

    // Draft record for the action: `{expr}` spans in content and tag values are
    // replaced by their values against the current context. id and sig are left
    // empty for the publisher.
    [[nodiscard]] auto materialiseAction(std::string const& actionId) const -> Expected<Record>;

    // Blocks until at least `count` passes have completed.
    auto waitForPasses(std::uint64_t count, std::chrono::milliseconds timeout) -> bool;

    [[nodiscard]] auto passCount() const -> std::uint64_t;
    [[nodiscard]] auto isRunning() const -> bool { return this->running.load(); }
    [[nodiscard]] auto renderContext() const -> Render::RenderContext;
    [[nodiscard]] auto document() const -> std::shared_ptr<Document const>;

    [[nodiscard]] auto queries() -> QueryStore& { return this->store; }
    [[nodiscard]] auto loaderCache() -> LoaderCache& { return this->cache; }
    [[nodiscard]] auto subscriptions() -> SubscriptionManager& { return this->manager; }

private:
    struct StoreListener;

    DocumentRuntime(Document document, DataSource& source, ExpressionEvaluator& evaluator, Render::WidgetSink& sink, RuntimeOptions options, Value user);

    auto declareQueries(Document const& document) -> Expected<void>;
    auto syncFilters(Document const& document, Value const& context, bool placeholdersOnly) -> Expected<void>;
    auto syncLoads(Document const& previous, Document const& next) -> Expected<void>;
    auto retryDue(std::string const& queryId) -> bool;
    auto runPass(bool reload) -> Render::RenderPassReport;
    auto renderLoop(std::stop_token token) -> void;
    auto onQueryChanged(std::string const& queryId) -> void;
    auto contextWith(QuerySnapshot const& snapshot) const -> Render::RenderContext;

    DataSource&          source;
    ExpressionEvaluator& evaluator;
    Render::WidgetSink&  sink;
    RuntimeOptions       options;

    QueryStore          store;
    LoaderCache         cache;
    TaskPool            pool;
    SubscriptionManager manager;
    PipeEngine          pipeEngine;

    mutable std::mutex              contextMutex;
    std::shared_ptr<Document const> current;
    Render::RenderContext           context;

    struct FilterRetry {
        std::uint32_t                         attempts = 0;
        std::chrono::steady_clock::time_point notBefore;
    };

    std::mutex                         passMutex;
    Render::ReconcileArena             arena;
    std::map<std::string, FilterRetry> filterRetries;

    mutable std::mutex          passCountMutex;
    std::condition_variable     passCountCv;
    std::uint64_t               passes = 0;

    std::mutex                  renderMutex;
    std::condition_variable_any renderCv;
    bool                        renderRequested = false;
    std::atomic<bool>           running{false};
    std::jthread                renderThread;

    std::shared_ptr<StoreListener> listener;
};

} // namespace HN
