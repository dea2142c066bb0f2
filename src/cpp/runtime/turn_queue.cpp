#include <sigraph/runtime/turn_queue.h>

#include <utility>

namespace sigraph {

void TurnQueue::post(task_type task) {
    if (task) { _tasks.push_back(std::move(task)); }
}

std::size_t TurnQueue::run_pending() {
    std::size_t ran{0};
    for (auto remaining = _tasks.size(); remaining > 0 && !_tasks.empty(); --remaining) {
        auto task = std::move(_tasks.front());
        _tasks.pop_front();
        ++ran;
        task();
    }
    return ran;
}

} // namespace sigraph
