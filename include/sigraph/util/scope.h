// Exit guard for the engine state flags (reader frames, running and flushing flags, edge release).
#ifndef SIGRAPH_UTIL_SCOPE_H
#define SIGRAPH_UTIL_SCOPE_H

#include <utility>

namespace sigraph {
    /**
     * Runs the exit action when the enclosing scope is left, normally or by an exception, unless release() was
     * called first. The guard is pinned to its scope: it can be neither copied nor moved, make_scope_exit relies on
     * guaranteed copy elision.
     */
    template<class F>
    class scope_exit {
    public:
        explicit scope_exit(F &&f) noexcept : fn_(std::move(f)) {
        }

        scope_exit(const scope_exit &) = delete;

        scope_exit &operator=(const scope_exit &) = delete;

        ~scope_exit() {
            if (active_) { fn_(); }
        }

        void release() noexcept { active_ = false; }

    private:
        F fn_;
        bool active_{true};
    };

    template<class F>
    [[nodiscard]] scope_exit<F> make_scope_exit(F &&f) { return scope_exit<F>(std::forward<F>(f)); }
} // namespace sigraph

#endif // SIGRAPH_UTIL_SCOPE_H
