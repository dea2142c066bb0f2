#include <sigraph/runtime/disposal_tracker.h>
#include <sigraph/util/lifecycle.h>

#include <algorithm>
#include <vector>

namespace sigraph {

void DisposalTracker::track(Disposable &disposable) {
    if (_enabled) { _tracked.insert(&disposable); }
}

void DisposalTracker::untrack(Disposable &disposable) { _tracked.erase(&disposable); }

bool DisposalTracker::is_tracked(const Disposable &disposable) const {
    return _tracked.contains(const_cast<Disposable *>(&disposable));
}

std::size_t DisposalTracker::active_count() const {
    return static_cast<std::size_t>(
        std::count_if(_tracked.begin(), _tracked.end(), [](const Disposable *d) { return !d->is_disposed(); }));
}

std::size_t DisposalTracker::dispose_all() {
    // Disposing runs user cleanups which may destroy other tracked objects, so work from a snapshot and re-check.
    const std::vector<Disposable *> snapshot(_tracked.begin(), _tracked.end());
    std::size_t disposed{0};
    for (auto *disposable : snapshot) {
        if (!_tracked.contains(disposable) || !disposable->is_live()) { continue; }
        disposable->dispose();
        ++disposed;
    }
    return disposed;
}

} // namespace sigraph
