#include <sigraph/util/lifecycle.h>

namespace sigraph {
    void Disposable::dispose() { dispose_component(*this); }

    bool Disposable::is_disposed() const { return _disposed; }

    bool Disposable::is_disposing() const { return _transitioning && !_disposed; }

    bool Disposable::is_live() const { return !_disposed && !_transitioning; }

    DisposeTransitionGuard::DisposeTransitionGuard(Disposable &component) : _component{component} {
        _component._transitioning = true;
    }

    DisposeTransitionGuard::~DisposeTransitionGuard() {
        _component._transitioning = false;
        _component._disposed = true;
    }

    void dispose_component(Disposable &component) {
        if (component.is_disposed() || component.is_disposing()) { return; }
        DisposeTransitionGuard guard{component};
        component.do_dispose();
    }
} // namespace sigraph
