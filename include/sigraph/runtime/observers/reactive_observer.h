//
// Life-cycle hooks of the reactive engine.
//

#ifndef SIGRAPH_REACTIVE_OBSERVER_H
#define SIGRAPH_REACTIVE_OBSERVER_H

#include <sigraph/sigraph_base.h>

#include <cstddef>
#include <exception>
#include <memory>

namespace sigraph {
    /**
     * Observers are registered on a ReactiveContext and are told about every write, recompute, reaction run, flush
     * and disposal in it. All hooks default to doing nothing.
     */
    struct SIGRAPH_EXPORT ReactiveObserver {
        using s_ptr = std::shared_ptr<ReactiveObserver>;

        virtual ~ReactiveObserver() = default;

        virtual void on_signal_write(const ReactiveBase &) {
        };

        virtual void on_before_recompute(const ReactiveBase &) {
        };

        virtual void on_after_recompute(const ReactiveBase &) {
        };

        virtual void on_before_reaction_run(const ReactiveBase &) {
        };

        virtual void on_after_reaction_run(const ReactiveBase &) {
        };

        virtual void on_before_flush(std::size_t /*pending*/) {
        };

        virtual void on_after_flush(std::size_t /*delivered*/) {
        };

        // Called before the error leaves the flush.
        virtual void on_flush_error(const std::exception &) {
        };

        virtual void on_dispose(const ReactiveBase &) {
        };
    };
} // namespace sigraph

#endif // SIGRAPH_REACTIVE_OBSERVER_H
