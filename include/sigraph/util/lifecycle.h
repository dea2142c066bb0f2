//
// Disposal life-cycle shared by every reactive object.
//

#ifndef SIGRAPH_LIFECYCLE_H
#define SIGRAPH_LIFECYCLE_H

#include <sigraph/sigraph_base.h>

namespace sigraph {
    struct Disposable;

    void SIGRAPH_EXPORT dispose_component(Disposable &component);

    struct DisposeTransitionGuard;

    /**
     * The disposal life-cycle is deliberately one-way:
     *
     * * The component is constructed live and takes part in the reactive graph straight away.
     *
     * * dispose() tears it down exactly once. While the teardown runs is_disposing() is true, afterwards
     *   is_disposed() is true. Calls made while disposing or after disposal are ignored, so dispose() is
     *   idempotent and safe to call re-entrantly (for example from a cleanup that disposes its owner).
     *
     * * A disposed component is inert: every public operation becomes a silent no-op and it never notifies again.
     *   It is still a valid object and is only released when its owner destroys it.
     */
    struct SIGRAPH_EXPORT Disposable {
        virtual ~Disposable() = default;

        /**
         * Tear the component down, see dispose_component.
         */
        void dispose();

        [[nodiscard]] bool is_disposed() const;

        [[nodiscard]] bool is_disposing() const;

        /**
         * Neither disposed nor in the middle of disposing.
         */
        [[nodiscard]] bool is_live() const;

    protected:
        /**
         * Release the resources held by the component. Called once only, from dispose_component.
         */
        virtual void do_dispose() = 0;

    private:
        bool _disposed{false};
        bool _transitioning{false};

        friend DisposeTransitionGuard;

        friend void dispose_component(Disposable &component);
    };

    struct DisposeTransitionGuard {
        explicit DisposeTransitionGuard(Disposable &component);

        ~DisposeTransitionGuard();

    private:
        Disposable &_component;
    };
} // namespace sigraph

#endif // SIGRAPH_LIFECYCLE_H
