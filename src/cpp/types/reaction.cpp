#include <sigraph/types/reaction.h>
#include <sigraph/util/errors.h>
#include <sigraph/util/scope.h>

namespace sigraph {

Reaction::Reaction(ReactiveContext &context, reaction_fn fn, std::string label, construct_tag)
    : ReactiveBase(context, NodeKind::REACTION, std::move(label)), _fn{std::move(fn)} {
    bind_dependent(this);
    run();
}

Reaction::~Reaction() { dispose(); }

void Reaction::pause() {
    if (is_live()) { _active = false; }
}

void Reaction::resume() {
    if (!is_live() || _active) { return; }
    _active = true;
    run();
}

bool Reaction::mark_stale() {
    // Nothing reads a reaction, there is nothing to carry downstream.
    return false;
}

bool Reaction::refresh() {
    if (is_active()) { run(); }
    return false;
}

void Reaction::run() {
    if (!is_live()) { return; }
    if (_running) {
        _rerun_requested = true;
        return;
    }

    const auto limit = context().settings().max_reaction_reruns;
    std::size_t reruns{0};
    do {
        _rerun_requested = false;
        run_once();
        if (_rerun_requested && ++reruns > limit) {
            _rerun_requested = false;
            throw_error<ReactionCycleError>("Reaction {} re-triggered itself more than {} times",
                                            static_cast<const ReactiveBase &>(*this), limit);
        }
    } while (_rerun_requested && is_active());
}

void Reaction::run_once() {
    auto &ctx = context();
    ctx.notify_before_reaction_run(*this);

    _running = true;
    auto reset = make_scope_exit([this] { _running = false; });

    if (auto cleanup = std::exchange(_cleanup, nullptr)) { cleanup(); }
    ctx.graph().unlink_sources(node());

    cleanup_fn next;
    {
        ReaderScope scope{ctx, node(), true};
        next = _fn();
    }
    ++_run_count;

    if (is_live()) {
        _cleanup = std::move(next);
    } else if (next) {
        // Disposed from inside its own body, nothing will run this cleanup later.
        next();
    }

    ctx.notify_after_reaction_run(*this);
}

void Reaction::do_dispose() {
    _active = false;
    {
        auto release = make_scope_exit([this] { release_node(); });
        if (auto cleanup = std::exchange(_cleanup, nullptr)) { cleanup(); }
    }
    context().notify_dispose(*this);
}

// ========== EffectRoot ==========

EffectRoot::~EffectRoot() { dispose(); }

void EffectRoot::start() { _reaction = std::make_unique<Reaction>(*_context, _fn); }

void EffectRoot::stop() {
    if (_reaction != nullptr) { _reaction->dispose(); }
}

void EffectRoot::restart() {
    if (_disposed) { return; }
    stop();
    _reaction.reset();
    start();
}

void EffectRoot::dispose() {
    if (_disposed) { return; }
    _disposed = true;
    stop();
    _reaction.reset();
    _fn = nullptr;
}

} // namespace sigraph
