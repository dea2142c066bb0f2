#pragma once

#include <sigraph/sigraph_base.h>

#include <ankerl/unordered_dense.h>

#include <cstddef>

namespace sigraph {

/**
 * @brief Debug registry of the reactive objects of a context, used to find leaks.
 *
 * Objects register when constructed while tracking is enabled and deregister when destroyed. A tracked object that
 * is still live when it should not be is a leak; dispose_all() tears every such object down.
 */
struct SIGRAPH_EXPORT DisposalTracker {
    void enable(bool value = true) { _enabled = value; }

    [[nodiscard]] bool enabled() const { return _enabled; }

    /**
     * @brief Register an object, ignored while tracking is disabled.
     */
    void track(Disposable &disposable);

    void untrack(Disposable &disposable);

    [[nodiscard]] bool is_tracked(const Disposable &disposable) const;

    /**
     * @brief Registered objects, disposed or not.
     */
    [[nodiscard]] std::size_t tracked_count() const { return _tracked.size(); }

    /**
     * @brief Registered objects that are not disposed yet.
     */
    [[nodiscard]] std::size_t active_count() const;

    /**
     * @brief Dispose every registered object that is still live, in registration order.
     * @return The number of objects disposed.
     */
    std::size_t dispose_all();

private:
    bool _enabled{false};
    ankerl::unordered_dense::set<Disposable *> _tracked;
};

} // namespace sigraph
