#pragma once

#include <sigraph/sigraph_base.h>

#include <cstddef>
#include <deque>
#include <functional>

namespace sigraph {

/**
 * @brief The host's cooperative scheduler, as seen by the engine.
 *
 * A posted task must run after the current synchronous call stack unwinds and before the next externally
 * triggered event. The auto-batch flush is the only thing the engine posts.
 */
struct SIGRAPH_EXPORT TurnScheduler {
    using task_type = std::function<void()>;

    virtual ~TurnScheduler() = default;

    virtual void post(task_type task) = 0;
};

/**
 * @brief Default TurnScheduler: a FIFO the host drains with run_pending() once per turn.
 */
struct SIGRAPH_EXPORT TurnQueue final : TurnScheduler {
    void post(task_type task) override;

    /**
     * @brief Run the tasks queued before the call, in order.
     *
     * Tasks posted while draining wait for the next call. If a task throws, the exception propagates and the tasks
     * behind it stay queued.
     *
     * @return The number of tasks run.
     */
    std::size_t run_pending();

    [[nodiscard]] std::size_t size() const { return _tasks.size(); }

    [[nodiscard]] bool empty() const { return _tasks.empty(); }

private:
    std::deque<task_type> _tasks;
};

} // namespace sigraph
