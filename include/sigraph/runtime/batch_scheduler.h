#pragma once

/**
 * @file batch_scheduler.h
 * @brief Deferral and de-duplication of change notifications.
 *
 * While a batch is open, notifiers written to are collected in the pending set instead of notifying. When the
 * outermost batch closes, flush() notifies each distinct pending notifier once and then propagates the union of
 * the changes through the dependency graph in a single topological pass, so every dependent runs at most once for
 * the whole batch.
 *
 * With ContextSettings::auto_batch, writes made outside an explicit batch are collected the same way and one
 * flush is posted to the context's TurnScheduler. Explicit batches take precedence: nothing is posted while one is
 * open, and closing it drains everything pending, auto-batched writes included. The posted flush then finds nothing
 * to do.
 */

#include <sigraph/sigraph_base.h>
#include <sigraph/types/notifiable.h>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace sigraph {

struct SIGRAPH_EXPORT BatchScheduler {
    explicit BatchScheduler(ReactiveContext &context);

    BatchScheduler(const BatchScheduler &) = delete;

    BatchScheduler &operator=(const BatchScheduler &) = delete;

    // ========== Batch Scope ==========

    void begin();

    /**
     * @brief Close a batch, flushing when the outermost one closes.
     */
    void end();

    /**
     * @brief Close a batch that is unwinding with an exception.
     *
     * When the outermost batch closes the pending set is drained as in end(). The exception already in flight wins:
     * if a subscriber throws during that drain, observers get on_flush_error, the notifiers not yet delivered stay
     * pending and one flush is posted to the turn scheduler for them.
     */
    void abandon();

    [[nodiscard]] bool batching() const { return _depth > 0; }

    [[nodiscard]] std::size_t depth() const { return _depth; }

    // ========== Pending Set ==========

    void enqueue(Notifier &notifier);

    /**
     * @brief Drop a notifier from the pending set, and from a flush in progress. Called when it is disposed.
     */
    void cancel(Notifier &notifier);

    [[nodiscard]] bool is_pending(const Notifier &notifier) const;

    [[nodiscard]] std::size_t pending_count() const { return _pending.size(); }

    [[nodiscard]] bool flushing() const { return _flushing; }

    // ========== Delivery ==========

    /**
     * @brief Deliver everything pending. Does nothing inside a batch or an ongoing flush.
     *
     * If a subscriber throws, observers get on_flush_error, the notifiers not yet delivered are put back in the
     * pending set, and the exception propagates.
     *
     * @return The number of notifiers whose value actually changed.
     */
    std::size_t flush();

    /**
     * @brief Post one flush to the turn scheduler, unless one is posted already or a batch is open.
     */
    void schedule_auto_flush();

    [[nodiscard]] bool auto_flush_posted() const { return _auto_flush_posted; }

private:
    std::size_t deliver_pending();

    ReactiveContext &_context;
    std::size_t _depth{0};
    ankerl::unordered_dense::set<Notifier *> _pending;
    std::vector<Notifier *> _in_flight;
    bool _flushing{false};
    bool _auto_flush_posted{false};
    // Posted flushes hold this weakly, the host scheduler may outlive the context.
    std::shared_ptr<bool> _alive{std::make_shared<bool>(true)};
};

} // namespace sigraph
