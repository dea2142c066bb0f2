#include <sigraph/runtime/batch_scheduler.h>
#include <sigraph/runtime/reactive_context.h>
#include <sigraph/util/scope.h>

#include <algorithm>
#include <exception>

namespace sigraph {

BatchScheduler::BatchScheduler(ReactiveContext &context) : _context{context} {}

void BatchScheduler::begin() { ++_depth; }

void BatchScheduler::end() {
    if (_depth == 0) { return; }
    if (--_depth == 0) { flush(); }
}

void BatchScheduler::abandon() {
    if (_depth == 0) { return; }
    if (--_depth > 0) { return; }
    try {
        flush();
    } catch (const std::exception &) {
        // Reported through on_flush_error already, the caller is handed the exception of the batch body.
        if (!_pending.empty()) { schedule_auto_flush(); }
    }
}

void BatchScheduler::enqueue(Notifier &notifier) { _pending.insert(&notifier); }

void BatchScheduler::cancel(Notifier &notifier) {
    _pending.erase(&notifier);
    std::replace(_in_flight.begin(), _in_flight.end(), &notifier, static_cast<Notifier *>(nullptr));
}

bool BatchScheduler::is_pending(const Notifier &notifier) const {
    return _pending.contains(const_cast<Notifier *>(&notifier));
}

std::size_t BatchScheduler::flush() {
    if (_flushing || _depth > 0) { return 0; }
    _flushing = true;
    auto reset = make_scope_exit([this] { _flushing = false; });

    std::size_t delivered{0};
    // Subscribers and reactions may write again while we deliver, keep going until nothing is left.
    while (!_pending.empty()) { delivered += deliver_pending(); }
    return delivered;
}

std::size_t BatchScheduler::deliver_pending() {
    _in_flight.assign(_pending.begin(), _pending.end());
    _pending.clear();
    _context.notify_before_flush(_in_flight.size());

    std::vector<NodeId> changed;
    std::size_t next{0};
    auto requeue = make_scope_exit([this, &next] {
        for (; next < _in_flight.size(); ++next) {
            if (_in_flight[next] != nullptr) { _pending.insert(_in_flight[next]); }
        }
        _in_flight.clear();
    });

    try {
        while (next < _in_flight.size()) {
            auto *notifier = _in_flight[next++];
            if (notifier != nullptr && notifier->notify()) { changed.push_back(notifier->notifier_node()); }
        }
        requeue.release();
        _in_flight.clear();
        _context.propagate(changed);
    } catch (const std::exception &e) {
        _context.notify_flush_error(e);
        throw;
    }

    _context.notify_after_flush(changed.size());
    return changed.size();
}

void BatchScheduler::schedule_auto_flush() {
    if (_auto_flush_posted || _depth > 0) { return; }
    _auto_flush_posted = true;
    std::weak_ptr<bool> alive{_alive};
    _context.turn_scheduler().post([this, alive] {
        if (alive.expired()) { return; }
        _auto_flush_posted = false;
        flush();
    });
}

} // namespace sigraph
