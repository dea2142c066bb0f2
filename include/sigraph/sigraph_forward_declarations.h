//
// Forward declarations for the reactive engine types.
//

#ifndef SIGRAPH_FORWARD_DECLARATIONS_H
#define SIGRAPH_FORWARD_DECLARATIONS_H

#include <cstdint>
#include <memory>

namespace sigraph {
    struct Disposable;
    struct ReactiveBase;
    struct Notifier;
    struct Dependent;

    struct ReactiveContext;
    struct ContextSettings;
    class DependencyGraph;
    struct BatchScheduler;
    struct TurnScheduler;
    struct TurnQueue;
    struct DisposalTracker;
    struct ReactiveObserver;

    class Subscription;
    class Reaction;
    class EffectRoot;
    class NamedCollection;

    using SubscriptionId = std::uint64_t;

    using reactive_observer_s_ptr = std::shared_ptr<ReactiveObserver>;
} // namespace sigraph

#endif // SIGRAPH_FORWARD_DECLARATIONS_H
