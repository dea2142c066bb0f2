#pragma once

/**
 * @file signal.h
 * @brief Mutable reactive cell.
 *
 * A Signal holds one value. Reading it with get() inside a Computed or Reaction records a dependency, writing it
 * with set() compares the new value with the current one (see equality.h) and, when they differ, marks every
 * downstream Computed stale and notifies: straight away outside a batch, once at the end of the outermost batch
 * inside one.
 *
 * Subscribers receive (value, previous). Inside a batch, previous is the value before the first write of the batch,
 * and a batch that ends with the value it started with notifies nobody.
 *
 * After dispose() the Signal is inert: writes are ignored, reads return the last value without tracking, and
 * subscribe() returns an empty Subscription.
 */

#include <sigraph/sigraph_base.h>
#include <sigraph/types/equality.h>
#include <sigraph/types/reactive_base.h>
#include <sigraph/types/subscription.h>

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace sigraph {

template<typename T, typename Eq = ValueEquals<T>>
class Signal final : public ReactiveBase, public Notifier {
public:
    using value_type = T;
    using equals_type = Eq;
    using subscriber_list_type = SubscriberList<const T &, const T &>;
    using ptr = Signal *;
    using s_ptr = std::shared_ptr<Signal>;

    explicit Signal(T initial = T{}) : Signal(ReactiveContext::current(), std::move(initial)) {}

    Signal(ReactiveContext &context, T initial, std::string label = {})
        : ReactiveBase(context, NodeKind::SIGNAL, std::move(label)), _value(std::move(initial)),
          _subscribers{std::make_shared<subscriber_list_type>()} {}

    ~Signal() override { dispose(); }

    /**
     * @brief The current value, recorded as a dependency of the innermost reader.
     */
    [[nodiscard]] const T &get() const {
        if (is_live()) { context().track(node()); }
        return _value;
    }

    /**
     * @brief The current value, without recording a dependency.
     */
    [[nodiscard]] const T &peek() const { return _value; }

    void set(T value) {
        if (!is_live() || _equals(_value, value)) { return; }
        // Keep the value from before the first write since the last delivery, it is what subscribers compare to.
        if (!_pending_previous.has_value()) { _pending_previous.emplace(std::move(_value)); }
        _value = std::move(value);

        auto &ctx = context();
        ctx.notify_signal_write(*this);
        ctx.invalidate(node());
        ctx.schedule(*this);
    }

    /**
     * @brief set(fn(current)).
     */
    template<typename Fn>
    void update(Fn &&fn) {
        if (!is_live()) { return; }
        set(std::invoke(std::forward<Fn>(fn), std::as_const(_value)));
    }

    /**
     * @brief Call callback on every change with (value, previous), or with (value) if it takes one argument.
     */
    template<typename Fn>
    Subscription subscribe(Fn &&callback) {
        if (!is_live()) { return {}; }
        SubscriptionId id;
        if constexpr (std::is_invocable_v<Fn &, const T &, const T &>) {
            id = _subscribers->add(std::forward<Fn>(callback));
        } else {
            static_assert(std::is_invocable_v<Fn &, const T &>,
                          "A subscriber takes (value, previous) or (value)");
            id = _subscribers->add(
                [cb = std::forward<Fn>(callback)](const T &value, const T &) mutable { cb(value); });
        }
        return Subscription{_subscribers, id};
    }

    [[nodiscard]] std::size_t subscriber_count() const { return _subscribers->size(); }

    // ========== Notifier ==========

    bool notify() override {
        if (!_pending_previous.has_value()) { return false; }
        T previous = std::move(*_pending_previous);
        _pending_previous.reset();
        if (!is_live() || _equals(_value, previous)) { return false; }
        _subscribers->notify(_value, previous);
        return true;
    }

    [[nodiscard]] NotifierKind notifier_kind() const override { return NotifierKind::SIGNAL; }

    [[nodiscard]] NodeId notifier_node() const override { return node(); }

protected:
    void do_dispose() override {
        auto &ctx = context();
        ctx.scheduler().cancel(*this);
        _subscribers->clear();
        _pending_previous.reset();
        release_node();
        ctx.notify_dispose(*this);
    }

private:
    T _value;
    std::optional<T> _pending_previous;
    std::shared_ptr<subscriber_list_type> _subscribers;
    [[no_unique_address]] Eq _equals{};
};

/**
 * @brief A Signal that only drops writes of the identical value (see ShallowEquals).
 */
template<typename T>
using RawSignal = Signal<T, ShallowEquals<T>>;

} // namespace sigraph
