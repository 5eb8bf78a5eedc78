#include <hnmd/runtime/DocumentRuntime.hpp>

#include <hnmd/log/TaggedLogger.hpp>
#include <hnmd/render/SnapshotBuilder.hpp>

#include <algorithm>
#include <optional>
#include <set>
#include <utility>

namespace HN {

struct DocumentRuntime::StoreListener : ChangeSink {
    explicit StoreListener(DocumentRuntime* owner) : owner(owner) {}

    void queryChanged(const std::string& queryId, std::uint64_t) override {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->owner)
            this->owner->onQueryChanged(queryId);
    }

    void detach() {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->owner = nullptr;
    }

    std::mutex       mutex;
    DocumentRuntime* owner;
};

namespace {

auto elapsed_since(std::chrono::steady_clock::time_point start) -> std::chrono::microseconds {
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
}

auto interpolate(std::string const& text, Value const& context, ExpressionEvaluator& evaluator) -> Expected<std::string> {
    std::string out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto open = text.find('{', pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);
        auto close = text.find('}', open + 1);
        if (close == std::string::npos)
            return std::unexpected(Error{Error::Code::MalformedInput, "unterminated '{' in action template"});
        auto value = evaluator.evaluate(text.substr(open + 1, close - open - 1), context);
        if (!value)
            return std::unexpected(value.error());
        out += value->is_string() ? value->get<std::string>() : canonicalText(*value);
        pos = close + 1;
    }
    return out;
}

} // namespace

auto DocumentRuntime::Create(Document document,
                             DataSource& source,
                             ExpressionEvaluator& evaluator,
                             Render::WidgetSink& sink,
                             RuntimeOptions options,
                             Value user) -> Expected<std::unique_ptr<DocumentRuntime>> {
    if (auto valid = validateDocument(document); !valid) {
        hn_log("DocumentRuntime::Create rejected document: " + describeError(valid.error()), "Runtime", "Error");
        return std::unexpected(valid.error());
    }
    return std::unique_ptr<DocumentRuntime>(new DocumentRuntime(std::move(document), source, evaluator, sink, options, std::move(user)));
}

DocumentRuntime::DocumentRuntime(Document document, DataSource& source, ExpressionEvaluator& evaluator, Render::WidgetSink& sink, RuntimeOptions options, Value user)
    : source(source),
      evaluator(evaluator),
      sink(sink),
      options(options),
      pool(options.workers),
      manager(source, this->store, this->cache, this->pool, SubscriptionOptions{options.fetchTimeout, options.streamPoll}),
      pipeEngine(this->store, evaluator),
      listener(std::make_shared<StoreListener>(this)) {
    this->context.user  = std::move(user);
    this->context.state = document.frontmatter.state;
    this->current       = std::make_shared<Document const>(std::move(document));
    this->store.subscribe(std::weak_ptr<ChangeSink>(this->listener));
}

DocumentRuntime::~DocumentRuntime() {
    this->listener->detach();
    this->stop();
}

auto DocumentRuntime::start() -> Expected<void> {
    if (this->running.load())
        return std::unexpected(Error{Error::Code::InvalidState, "runtime already started"});

    {
        std::lock_guard<std::mutex> passLock(this->passMutex);
        auto                        doc = this->document();
        if (auto declared = this->declareQueries(*doc); !declared)
            return declared;
        if (auto synced = this->syncFilters(*doc, this->contextWith(this->store.snapshot()).toJson(), false); !synced)
            return synced;
        if (auto loads = this->syncLoads(Document{}, *doc); !loads)
            return loads;
        if (auto configured = this->pipeEngine.configure(doc->frontmatter.pipes); !configured)
            return configured;
    }

    hn_log("DocumentRuntime::start", "Runtime");
    this->running = true;
    this->renderThread = std::jthread([this](std::stop_token token) { this->renderLoop(std::move(token)); });
    this->requestRender();
    return {};
}

auto DocumentRuntime::stop() -> void {
    if (!this->running.exchange(false))
        return;
    hn_log("DocumentRuntime::stop", "Runtime");
    this->manager.closeAll();
    if (this->renderThread.joinable()) {
        this->renderThread.request_stop();
        this->renderCv.notify_all();
        this->renderThread.join();
    }
    if (!this->manager.waitIdle(this->options.fetchTimeout))
        hn_log("DocumentRuntime::stop loads still running after the fetch timeout", "Runtime");
}

auto DocumentRuntime::reload(Document next) -> Expected<void> {
    if (auto valid = validateDocument(next); !valid) {
        hn_log("DocumentRuntime::reload rejected document: " + describeError(valid.error()), "Runtime", "Error");
        return std::unexpected(valid.error());
    }

    {
        std::lock_guard<std::mutex> passLock(this->passMutex);
        auto                        previous = this->document();
        if (auto declared = this->declareQueries(next); !declared)
            return declared;
        if (auto ordered = PipeEngine::Order(next.frontmatter.pipes); !ordered)
            return std::unexpected(ordered.error());

        auto const& nextFilters = next.frontmatter.filters;
        for (auto const& [queryId, filter] : this->manager.requestedFilters()) {
            if (!nextFilters.contains(queryId)) {
                this->filterRetries.erase(queryId);
                if (auto closed = this->manager.closeFilter(queryId); !closed)
                    hn_log("DocumentRuntime::reload closing " + queryId + ": " + describeError(closed.error()), "Runtime", "Error");
            }
        }

        auto shared = std::make_shared<Document const>(std::move(next));
        {
            std::lock_guard<std::mutex> lock(this->contextMutex);
            for (auto const& [key, value] : shared->frontmatter.state.items()) {
                if (!this->context.state.contains(key))
                    this->context.state[key] = value;
            }
            this->current = shared;
        }

        if (this->running.load()) {
            if (auto synced = this->syncFilters(*shared, this->contextWith(this->store.snapshot()).toJson(), false); !synced)
                return synced;
            if (auto loads = this->syncLoads(*previous, *shared); !loads)
                return loads;
        }
        if (auto configured = this->pipeEngine.configure(shared->frontmatter.pipes); !configured)
            return configured;
    }

    hn_log("DocumentRuntime::reload applied", "Runtime");
    this->runPass(true);
    return {};
}

auto DocumentRuntime::renderNow() -> Render::RenderPassReport {
    return this->runPass(false);
}

auto DocumentRuntime::requestRender() -> void {
    {
        std::lock_guard<std::mutex> lock(this->renderMutex);
        this->renderRequested = true;
    }
    this->renderCv.notify_all();
}

auto DocumentRuntime::setState(std::string const& key, Value value) -> void {
    {
        std::lock_guard<std::mutex> lock(this->contextMutex);
        this->context.state[key] = std::move(value);
    }
    this->requestRender();
}

auto DocumentRuntime::setFormField(std::string const& name, std::string value) -> void {
    {
        std::lock_guard<std::mutex> lock(this->contextMutex);
        this->context.form[name] = std::move(value);
    }
    this->requestRender();
}

auto DocumentRuntime::materialiseAction(std::string const& actionId) const -> Expected<Record> {
    auto doc = this->document();
    auto it  = doc->frontmatter.actions.find(actionId);
    if (it == doc->frontmatter.actions.end())
        return std::unexpected(Error{Error::Code::UnknownActionReference, "unknown action '" + actionId + "'"});

    auto const  ctx     = this->contextWith(this->store.snapshot());
    auto const  json    = ctx.toJson();
    auto const& action  = it->second;
    auto        content = interpolate(action.content, json, this->evaluator);
    if (!content)
        return std::unexpected(content.error());

    Record draft;
    draft.kind       = action.kind;
    draft.content    = std::move(*content);
    draft.created_at = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    if (ctx.user.is_object() && ctx.user.contains("pubkey") && ctx.user["pubkey"].is_string())
        draft.pubkey = ctx.user["pubkey"].get<std::string>();
    for (auto const& tag : action.tags) {
        Tag resolved;
        resolved.reserve(tag.size());
        for (auto const& part : tag) {
            auto value = interpolate(part, json, this->evaluator);
            if (!value)
                return std::unexpected(value.error());
            resolved.push_back(std::move(*value));
        }
        draft.tags.push_back(std::move(resolved));
    }
    hn_log("DocumentRuntime::materialiseAction " + actionId, "Runtime");
    return draft;
}

auto DocumentRuntime::waitForPasses(std::uint64_t count, std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(this->passCountMutex);
    return this->passCountCv.wait_for(lock, timeout, [&] { return this->passes >= count; });
}

auto DocumentRuntime::passCount() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(this->passCountMutex);
    return this->passes;
}

auto DocumentRuntime::renderContext() const -> Render::RenderContext {
    return this->contextWith(this->store.snapshot());
}

auto DocumentRuntime::document() const -> std::shared_ptr<Document const> {
    std::lock_guard<std::mutex> lock(this->contextMutex);
    return this->current;
}

auto DocumentRuntime::declareQueries(Document const& document) -> Expected<void> {
    for (auto const& [queryId, filter] : document.frontmatter.filters) {
        if (auto declared = this->store.declareRaw(queryId, filter.limit); !declared)
            return declared;
    }
    for (auto const& load : document.frontmatter.loads) {
        if (auto declared = this->store.declareRaw(load.targetQuery); !declared)
            return declared;
    }
    for (auto const& pipe : document.frontmatter.pipes) {
        if (auto declared = this->store.declareDerived(pipe.id); !declared)
            return declared;
    }
    return {};
}

auto DocumentRuntime::syncFilters(Document const& document, Value const& context, bool placeholdersOnly) -> Expected<void> {
    auto const requested = this->manager.requestedFilters();
    for (auto const& [queryId, filterTemplate] : document.frontmatter.filters) {
        bool const dynamic  = filterTemplate.hasPlaceholders();
        auto const previous = requested.find(queryId);
        auto const state    = previous == requested.end() ? std::optional<SubscriptionState>{} : this->manager.state(queryId);
        bool const failed   = state == SubscriptionState::Failed;
        if (placeholdersOnly && !dynamic && !failed)
            continue;
        auto compiled = Filter::Compile(filterTemplate, context, this->evaluator);
        if (!compiled) {
            if (!dynamic)
                return std::unexpected(compiled.error());
            hn_log("Filter " + queryId + " not compiled yet: " + describeError(compiled.error()), "Runtime");
            continue;
        }
        if (previous != requested.end() && previous->second == *compiled) {
            if (!failed) {
                if (state == SubscriptionState::Active)
                    this->filterRetries.erase(queryId);
                continue;
            }
            if (!this->retryDue(queryId))
                continue;
            hn_log("Filter " + queryId + " retrying after failure", "Runtime");
        } else {
            this->filterRetries.erase(queryId);
        }
        if (auto opened = this->manager.openFilter(queryId, *compiled); !opened)
            hn_log("Filter " + queryId + " could not be opened: " + describeError(opened.error()), "Runtime", "Error");
    }
    return {};
}

auto DocumentRuntime::syncLoads(Document const& previous, Document const& next) -> Expected<void> {
    std::set<std::string> kept;
    for (auto const& load : next.frontmatter.loads)
        kept.insert(load.id);
    for (auto const& load : previous.frontmatter.loads) {
        if (!kept.contains(load.id))
            this->manager.removeLoadDependency(load.id);
    }
    for (auto const& load : next.frontmatter.loads) {
        if (auto added = this->manager.addLoadDependency(load); !added)
            return added;
    }
    return {};
}

auto DocumentRuntime::retryDue(std::string const& queryId) -> bool {
    auto const now   = std::chrono::steady_clock::now();
    auto&      retry = this->filterRetries[queryId];
    if (now < retry.notBefore)
        return false;
    auto const delay = this->options.streamPoll * (1LL << std::min<std::uint32_t>(retry.attempts, 10));
    retry.notBefore  = now + std::min<std::chrono::milliseconds>(delay, this->options.fetchTimeout);
    ++retry.attempts;
    return true;
}

auto DocumentRuntime::contextWith(QuerySnapshot const& snapshot) const -> Render::RenderContext {
    Render::RenderContext ctx;
    {
        std::lock_guard<std::mutex> lock(this->contextMutex);
        ctx = this->context;
    }
    ctx.queries = snapshot.toJson();
    return ctx;
}

auto DocumentRuntime::runPass(bool reload) -> Render::RenderPassReport {
    std::lock_guard<std::mutex> passLock(this->passMutex);

    Render::RenderPassReport report;
    report.reload = reload;
    report.pipes  = this->pipeEngine.recomputeStale();

    auto const snapshot  = this->store.snapshot();
    auto const doc       = this->document();
    auto const ctx       = this->contextWith(snapshot);
    auto const ctxJson   = ctx.toJson();
    report.storeRevision = snapshot.revision();

    if (this->running.load()) {
        if (auto synced = this->syncFilters(*doc, ctxJson, true); !synced)
            hn_log("DocumentRuntime::runPass filter sync failed: " + describeError(synced.error()), "Runtime", "Error");
    }

    auto                    buildStart = std::chrono::steady_clock::now();
    Render::SnapshotBuilder builder(this->evaluator, doc->components);
    auto const              mounted = builder.build(doc->body, ctx);
    report.buildTime                = elapsed_since(buildStart);

    auto reconcileStart  = std::chrono::steady_clock::now();
    auto result          = Render::Reconcile(this->arena, mounted, ctxJson, this->evaluator);
    report.reconcileTime = elapsed_since(reconcileStart);
    report.summary       = Render::summarize(result.edits);
    this->arena          = std::move(result.arena);

    {
        std::lock_guard<std::mutex> lock(this->passCountMutex);
        report.pass = this->passes + 1;
    }
    hn_log("DocumentRuntime::runPass " + std::to_string(report.pass) + " at revision " + std::to_string(report.storeRevision), "Runtime");
    this->sink.apply(result.edits, report);
    {
        std::lock_guard<std::mutex> lock(this->passCountMutex);
        this->passes = report.pass;
    }
    this->passCountCv.notify_all();
    return report;
}

auto DocumentRuntime::renderLoop(std::stop_token token) -> void {
#ifdef HN_LOG_DEBUG
    set_thread_name("Render");
#endif
    while (!token.stop_requested()) {
        {
            std::unique_lock<std::mutex> lock(this->renderMutex);
            if (!this->renderCv.wait(lock, token, [this] { return this->renderRequested; }))
                break;
        }
        if (this->options.renderDebounce > std::chrono::milliseconds::zero()) {
            std::unique_lock<std::mutex> lock(this->renderMutex);
            this->renderCv.wait_for(lock, token, this->options.renderDebounce, [] { return false; });
            if (token.stop_requested())
                break;
        }
        {
            std::lock_guard<std::mutex> lock(this->renderMutex);
            this->renderRequested = false;
        }
        this->runPass(false);
    }
    hn_log("DocumentRuntime::renderLoop exit", "Runtime");
}

auto DocumentRuntime::onQueryChanged(std::string const& queryId) -> void {
    auto const snapshot = this->store.snapshot();
    if (auto const* query = snapshot.find(queryId); query && query->kind == Query::Kind::Derived)
        return;
    this->requestRender();
}

} // namespace HN
