#include <sigraph/runtime/reactive_context.h>

#include <algorithm>

namespace sigraph {

ReactiveContext::ReactiveContext(ContextSettings settings) : _settings{settings} {
    _disposal_tracker.enable(_settings.track_disposals);
}

ReactiveContext &ReactiveContext::current() {
    thread_local ReactiveContext context;
    return context;
}

void ReactiveContext::configure(const ContextSettings &settings) {
    _settings = settings;
    _disposal_tracker.enable(_settings.track_disposals);
}

TurnScheduler &ReactiveContext::turn_scheduler() {
    if (_turn_scheduler != nullptr) { return *_turn_scheduler; }
    return _turn_queue;
}

void ReactiveContext::track(NodeId source) {
    if (_frames.empty()) { return; }
    auto &frame = _frames.back();
    if (!frame.reader.valid() || frame.reader == source) { return; }
    if (frame.eager) {
        _graph.link(source, frame.reader);
        return;
    }
    if (std::find(frame.reads.begin(), frame.reads.end(), source) == frame.reads.end()) {
        frame.reads.push_back(source);
    }
}

bool ReactiveContext::tracking() const { return !_frames.empty() && _frames.back().reader.valid(); }

void ReactiveContext::invalidate(NodeId source) { _graph.invalidate(std::span<const NodeId>{&source, 1}); }

void ReactiveContext::schedule(Notifier &notifier) {
    if (_scheduler.batching()) {
        _scheduler.enqueue(notifier);
        return;
    }
    if (_settings.auto_batch) {
        _scheduler.enqueue(notifier);
        _scheduler.schedule_auto_flush();
        return;
    }
    if (notifier.notify()) {
        const NodeId node = notifier.notifier_node();
        propagate(std::span<const NodeId>{&node, 1});
    }
}

void ReactiveContext::propagate(std::span<const NodeId> changed) {
    if (changed.empty()) { return; }
    NodeSet changed_set(changed.begin(), changed.end());
    for (NodeId id : _graph.downstream(changed)) {
        // Earlier refreshes may have disposed or destroyed later nodes.
        auto *dependent = _graph.dependent(id);
        if (dependent == nullptr) { continue; }
        const auto &sources = _graph.sources(id);
        const bool affected =
            std::any_of(sources.begin(), sources.end(), [&](NodeId source) { return changed_set.contains(source); });
        if (affected && dependent->refresh()) { changed_set.insert(id); }
    }
}

std::size_t ReactiveContext::push_frame(NodeId reader, bool eager) {
    _frames.push_back(ReaderFrame{reader, {}, eager});
    return _frames.size() - 1;
}

void ReactiveContext::pop_frame(std::size_t index) {
    // Frames are strictly nested, popping anything but the top would lose a reader.
    if (index + 1 == _frames.size()) { _frames.pop_back(); }
}

// ========== Observers ==========

void ReactiveContext::add_observer(reactive_observer_s_ptr observer) {
    if (observer != nullptr) { _observers.push_back(std::move(observer)); }
}

void ReactiveContext::remove_observer(const reactive_observer_s_ptr &observer) {
    _observers.erase(std::remove(_observers.begin(), _observers.end(), observer), _observers.end());
}

void ReactiveContext::notify_signal_write(const ReactiveBase &node) {
    if (_observers.empty()) { return; }
    for (auto &observer : _observers) { observer->on_signal_write(node); }
}

void ReactiveContext::notify_before_recompute(const ReactiveBase &node) {
    if (_observers.empty()) { return; }
    for (auto &observer : _observers) { observer->on_before_recompute(node); }
}

void ReactiveContext::notify_after_recompute(const ReactiveBase &node) {
    if (_observers.empty()) { return; }
    for (auto &observer : _observers) { observer->on_after_recompute(node); }
}

void ReactiveContext::notify_before_reaction_run(const ReactiveBase &node) {
    if (_observers.empty()) { return; }
    for (auto &observer : _observers) { observer->on_before_reaction_run(node); }
}

void ReactiveContext::notify_after_reaction_run(const ReactiveBase &node) {
    if (_observers.empty()) { return; }
    for (auto &observer : _observers) { observer->on_after_reaction_run(node); }
}

void ReactiveContext::notify_before_flush(std::size_t pending) {
    if (_observers.empty()) { return; }
    for (auto &observer : _observers) { observer->on_before_flush(pending); }
}

void ReactiveContext::notify_after_flush(std::size_t delivered) {
    if (_observers.empty()) { return; }
    for (auto &observer : _observers) { observer->on_after_flush(delivered); }
}

void ReactiveContext::notify_flush_error(const std::exception &error) {
    if (_observers.empty()) { return; }
    for (auto &observer : _observers) { observer->on_flush_error(error); }
}

void ReactiveContext::notify_dispose(const ReactiveBase &node) {
    if (_observers.empty()) { return; }
    for (auto &observer : _observers) { observer->on_dispose(node); }
}

// ========== Scopes ==========

ReaderScope::ReaderScope(ReactiveContext &context, NodeId reader, bool eager)
    : _context{context}, _index{context.push_frame(reader, eager)} {}

ReaderScope::~ReaderScope() { _context.pop_frame(_index); }

std::vector<NodeId> ReaderScope::take_reads() { return std::move(_context._frames[_index].reads); }

UntrackedScope::UntrackedScope(ReactiveContext &context)
    : _context{context}, _index{context.push_frame(NodeId{}, false)} {}

UntrackedScope::~UntrackedScope() { _context.pop_frame(_index); }

} // namespace sigraph
