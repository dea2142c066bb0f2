
#pragma once

#include <sigraph/sigraph_base.h>
#include <sigraph/types/node_id.h>

namespace sigraph
{
    enum class NotifierKind : std::uint8_t {
        SIGNAL = 0,
        COMPUTED = 1
    };

    /**
     * Anything that pushes change notifications to its own subscribers. The batch scheduler's pending set holds these.
     */
    struct Notifier {
        virtual ~Notifier() = default;

        /**
         * Deliver the change accumulated since the last delivery to the direct subscribers.
         * Returns false when there was nothing to deliver, or the value ended up equal to the one last delivered.
         */
        virtual bool notify() = 0;

        [[nodiscard]] virtual NotifierKind notifier_kind() const = 0;

        [[nodiscard]] virtual NodeId notifier_node() const = 0;
    };

    /**
     * A reader registered in the DependencyGraph (Computed or Reaction).
     */
    struct Dependent {
        virtual ~Dependent() = default;

        /**
         * Invalidation pass, called synchronously on every upstream write.
         * Returns true when the mark is new and must be carried further downstream.
         */
        virtual bool mark_stale() = 0;

        /**
         * Delivery pass, called in topological order once the upstream change is delivered.
         * Returns true when the dependent's own value changed.
         */
        virtual bool refresh() = 0;
    };
}
