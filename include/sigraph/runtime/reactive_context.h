#pragma once

/**
 * @file reactive_context.h
 * @brief The evaluation context every reactive object lives in.
 *
 * A context owns the dependency graph, the reader stack used to record reads, the batch scheduler with its pending
 * set, the turn queue and the disposal tracker. Nothing in it is synchronised: a context belongs to one logical task.
 * ReactiveContext::current() hands out one context per thread, objects may also be bound to an explicit context.
 */

#include <sigraph/sigraph_base.h>
#include <sigraph/runtime/batch_scheduler.h>
#include <sigraph/runtime/dependency_graph.h>
#include <sigraph/runtime/disposal_tracker.h>
#include <sigraph/runtime/observers/reactive_observer.h>
#include <sigraph/runtime/turn_queue.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <type_traits>
#include <vector>

namespace sigraph {

struct SIGRAPH_EXPORT ContextSettings {
    /**
     * Defer notification of writes made outside an explicit batch to the next turn of the TurnScheduler.
     */
    bool auto_batch{false};
    /**
     * Consecutive self-triggered re-runs a reaction may do before ReactionCycleError is raised.
     */
    std::size_t max_reaction_reruns{100};
    /**
     * Register every reactive object with the DisposalTracker.
     */
    bool track_disposals{false};
};

struct SIGRAPH_EXPORT ReactiveContext {
    using ptr = ReactiveContext *;

    explicit ReactiveContext(ContextSettings settings = {});

    ReactiveContext(const ReactiveContext &) = delete;

    ReactiveContext &operator=(const ReactiveContext &) = delete;

    /**
     * @brief The context of the calling thread, created on first use.
     */
    static ReactiveContext &current();

    // ========== Configuration ==========

    [[nodiscard]] const ContextSettings &settings() const { return _settings; }

    void configure(const ContextSettings &settings);

    // ========== Owned Services ==========

    [[nodiscard]] DependencyGraph &graph() { return _graph; }

    [[nodiscard]] const DependencyGraph &graph() const { return _graph; }

    [[nodiscard]] BatchScheduler &scheduler() { return _scheduler; }

    [[nodiscard]] DisposalTracker &disposal_tracker() { return _disposal_tracker; }

    [[nodiscard]] TurnQueue &turn_queue() { return _turn_queue; }

    /**
     * @brief The scheduler auto-batch flushes are posted to: the host's when set, the turn queue otherwise.
     */
    [[nodiscard]] TurnScheduler &turn_scheduler();

    /**
     * @brief Route posted flushes to the host's scheduler, nullptr restores the built-in turn queue.
     */
    void set_turn_scheduler(TurnScheduler *scheduler) { _turn_scheduler = scheduler; }

    [[nodiscard]] std::uint64_t next_object_id() { return ++_last_object_id; }

    // ========== Dependency Tracking ==========

    /**
     * @brief Record a read of source by the innermost reader, if any.
     *
     * Deferred frames (Computed) collect the reads and reconcile their edges when the frame ends. Eager frames
     * (Reaction) link each read straight away, so reads made before an exception stay tracked. Untracked frames and
     * reads of the reader itself are ignored.
     */
    void track(NodeId source);

    /**
     * @brief True while a reader frame that records reads is innermost.
     */
    [[nodiscard]] bool tracking() const;

    [[nodiscard]] std::size_t reader_depth() const { return _frames.size(); }

    // ========== Change Propagation ==========

    /**
     * @brief Synchronously mark every Computed downstream of source stale.
     */
    void invalidate(NodeId source);

    /**
     * @brief Route a notifier whose value was written: pending set inside a batch or with auto batching,
     * immediate delivery otherwise.
     */
    void schedule(Notifier &notifier);

    /**
     * @brief Deliver changed notifiers to their dependents in topological order.
     *
     * Each dependent downstream of changed is refreshed once, and only when one of its sources changed. A Computed
     * whose refresh reports a change extends the changed set for the nodes after it.
     */
    void propagate(std::span<const NodeId> changed);

    /**
     * @brief Drain the pending set now, see BatchScheduler::flush.
     */
    std::size_t flush() { return _scheduler.flush(); }

    // ========== Observers ==========

    void add_observer(reactive_observer_s_ptr observer);

    void remove_observer(const reactive_observer_s_ptr &observer);

    [[nodiscard]] bool has_observers() const { return !_observers.empty(); }

    void notify_signal_write(const ReactiveBase &node);

    void notify_before_recompute(const ReactiveBase &node);

    void notify_after_recompute(const ReactiveBase &node);

    void notify_before_reaction_run(const ReactiveBase &node);

    void notify_after_reaction_run(const ReactiveBase &node);

    void notify_before_flush(std::size_t pending);

    void notify_after_flush(std::size_t delivered);

    void notify_flush_error(const std::exception &error);

    void notify_dispose(const ReactiveBase &node);

private:
    friend class ReaderScope;
    friend class UntrackedScope;

    struct ReaderFrame {
        NodeId reader;
        std::vector<NodeId> reads;
        bool eager{false};
    };

    std::size_t push_frame(NodeId reader, bool eager);

    void pop_frame(std::size_t index);

    ContextSettings _settings;
    DependencyGraph _graph;
    DisposalTracker _disposal_tracker;
    TurnQueue _turn_queue;
    TurnScheduler *_turn_scheduler{nullptr};
    BatchScheduler _scheduler{*this};
    std::vector<ReaderFrame> _frames;
    std::vector<reactive_observer_s_ptr> _observers;
    std::uint64_t _last_object_id{0};
};

/**
 * @brief RAII reader frame: reads made while the scope is innermost are attributed to reader.
 */
class SIGRAPH_EXPORT ReaderScope {
public:
    ReaderScope(ReactiveContext &context, NodeId reader, bool eager);

    ~ReaderScope();

    ReaderScope(const ReaderScope &) = delete;

    ReaderScope &operator=(const ReaderScope &) = delete;

    /**
     * @brief The de-duplicated reads recorded so far, in read order. Only deferred frames record them.
     */
    [[nodiscard]] std::vector<NodeId> take_reads();

private:
    ReactiveContext &_context;
    std::size_t _index;
};

/**
 * @brief RAII frame with no reader, reads made under it register nothing.
 */
class SIGRAPH_EXPORT UntrackedScope {
public:
    explicit UntrackedScope(ReactiveContext &context);

    ~UntrackedScope();

    UntrackedScope(const UntrackedScope &) = delete;

    UntrackedScope &operator=(const UntrackedScope &) = delete;

private:
    ReactiveContext &_context;
    std::size_t _index;
};

// ========== Free Functions ==========

/**
 * @brief Run fn as one batch: notifications are deferred until the outermost batch closes, then each written
 * notifier notifies once.
 *
 * Nested batches flush once, when the outermost one exits. If fn throws, the depth is restored and the writes it
 * made are still delivered when the outermost batch unwinds; the exception from fn is the one that propagates.
 *
 * @return Whatever fn returns.
 */
template<typename Fn>
auto batch(ReactiveContext &context, Fn &&fn) {
    auto &scheduler = context.scheduler();
    scheduler.begin();
    if constexpr (std::is_void_v<std::invoke_result_t<Fn &>>) {
        try {
            std::invoke(fn);
        } catch (...) {
            scheduler.abandon();
            throw;
        }
        scheduler.end();
    } else {
        auto result = [&] {
            try {
                return std::invoke(fn);
            } catch (...) {
                scheduler.abandon();
                throw;
            }
        }();
        scheduler.end();
        return result;
    }
}

template<typename Fn>
auto batch(Fn &&fn) {
    return batch(ReactiveContext::current(), std::forward<Fn>(fn));
}

/**
 * @brief Run fn without recording any reads into the current reader.
 */
template<typename Fn>
decltype(auto) untrack(ReactiveContext &context, Fn &&fn) {
    UntrackedScope scope{context};
    return std::invoke(fn);
}

template<typename Fn>
decltype(auto) untrack(Fn &&fn) {
    return untrack(ReactiveContext::current(), std::forward<Fn>(fn));
}

[[nodiscard]] inline bool tracking() { return ReactiveContext::current().tracking(); }

inline std::size_t flush() { return ReactiveContext::current().flush(); }

} // namespace sigraph
