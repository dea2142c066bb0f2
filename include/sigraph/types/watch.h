#pragma once

#include <sigraph/sigraph_base.h>
#include <sigraph/types/computed.h>
#include <sigraph/types/signal.h>
#include <sigraph/types/subscription.h>

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace sigraph {

template<typename T, typename Eq, typename Fn>
Subscription watch(Signal<T, Eq> &signal, Fn &&callback) {
    return signal.subscribe(std::forward<Fn>(callback));
}

template<typename T, typename Eq, typename Fn>
Subscription watch(Computed<T, Eq> &computed, Fn &&callback) {
    return computed.subscribe(std::forward<Fn>(callback));
}

namespace detail {

template<typename T, typename SignalPtr, typename Fn>
Subscription watch_all(const std::vector<SignalPtr> &signals, Fn &&callback) {
    static_assert(std::is_invocable_v<std::decay_t<Fn> &, const std::vector<T> &, const std::vector<T> &>,
                  "A multi-signal watcher takes (values, previous_values)");
    auto shared = std::make_shared<std::decay_t<Fn>>(std::forward<Fn>(callback));

    std::vector<Subscription> parts;
    parts.reserve(signals.size());
    for (std::size_t index = 0; index < signals.size(); ++index) {
        parts.push_back(signals[index]->subscribe([signals, shared, index](const T &, const T &previous) {
            std::vector<T> values;
            values.reserve(signals.size());
            for (const auto &signal : signals) { values.push_back(signal->peek()); }
            auto previous_values = values;
            previous_values[index] = previous;
            (*shared)(std::as_const(values), std::as_const(previous_values));
        }));
    }
    return Subscription::combine(std::move(parts));
}

} // namespace detail

/**
 * @brief Call callback(values, previous_values) whenever any of the signals changes.
 *
 * values holds the current value of every signal, in order; previous_values is the same with the entry of the
 * signal that changed replaced by its previous value. Inside a batch each changed signal triggers its own call.
 *
 * @note Every callback reads all the signals: unsubscribe before destroying any of them, or use the shared_ptr
 * overload.
 */
template<typename T, typename Eq, typename Fn>
Subscription watch(const std::vector<Signal<T, Eq> *> &signals, Fn &&callback) {
    return detail::watch_all<T>(signals, std::forward<Fn>(callback));
}

/**
 * @brief As above, the subscription keeps every signal alive until it is unsubscribed.
 */
template<typename T, typename Eq, typename Fn>
Subscription watch(const std::vector<std::shared_ptr<Signal<T, Eq>>> &signals, Fn &&callback) {
    return detail::watch_all<T>(signals, std::forward<Fn>(callback));
}

} // namespace sigraph
