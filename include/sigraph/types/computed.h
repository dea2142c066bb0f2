#pragma once

/**
 * @file computed.h
 * @brief Memoised derived value.
 *
 * A Computed caches the result of its compute function together with the set of reactive objects the function read
 * (its source edges in the dependency graph). A write upstream marks it stale at once; the function runs again on
 * the next read, or before the Computed notifies if something subscribes to it or reads it. A Computed nobody
 * subscribes to or reads stays lazy.
 *
 * Every recompute reconciles the source edges with the reads of that run: sources no longer read are unlinked,
 * new ones linked, so a conditionally read branch holds no edge while it is not taken.
 *
 * If the compute function throws, the exception reaches the reader (or the write that triggered the recompute), the
 * cached value and the edges stay as they were and the Computed stays stale, the next read retries.
 */

#include <sigraph/sigraph_base.h>
#include <sigraph/types/equality.h>
#include <sigraph/types/reactive_base.h>
#include <sigraph/types/subscription.h>
#include <sigraph/util/errors.h>
#include <sigraph/util/scope.h>

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace sigraph {

template<typename T, typename Eq = ValueEquals<T>>
class Computed final : public ReactiveBase, public Notifier, public Dependent {
public:
    using value_type = T;
    using equals_type = Eq;
    using compute_fn = std::function<T()>;
    using subscriber_list_type = SubscriberList<const T &, const T &>;
    using ptr = Computed *;
    using s_ptr = std::shared_ptr<Computed>;

    /**
     * @brief Evaluates fn once before returning, an exception from it leaves the constructor.
     */
    explicit Computed(compute_fn fn) : Computed(ReactiveContext::current(), std::move(fn)) {}

    Computed(ReactiveContext &context, compute_fn fn, std::string label = {})
        : ReactiveBase(context, NodeKind::COMPUTED, std::move(label)), _fn{std::move(fn)},
          _subscribers{std::make_shared<subscriber_list_type>()} {
        bind_dependent(this);
        recompute();
    }

    ~Computed() override { dispose(); }

    /**
     * @brief The up to date value, recorded as a dependency of the innermost reader.
     */
    [[nodiscard]] const T &get() {
        if (is_live()) {
            if (_dirty) { recompute(); }
            // An unobserved read is the first value a new reader sees, nothing older is owed to anyone.
            if (!observed()) { _pending_previous.reset(); }
            context().track(node());
        }
        return *_value;
    }

    /**
     * @brief The up to date value, without recording a dependency.
     */
    [[nodiscard]] const T &peek() {
        if (is_live() && _dirty) { recompute(); }
        return *_value;
    }

    /**
     * @brief The value of the last successful evaluation, stale or not.
     */
    [[nodiscard]] const T &cached() const { return *_value; }

    [[nodiscard]] bool is_dirty() const { return _dirty; }

    template<typename Fn>
    Subscription subscribe(Fn &&callback) {
        if (!is_live()) { return {}; }
        if (!observed()) { _pending_previous.reset(); }
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

    /**
     * @brief Recompute if stale and tell subscribers, when the value differs from the one last delivered.
     */
    bool notify() override {
        if (!is_live()) { return false; }
        if (_dirty) { recompute(); }
        if (!_pending_previous.has_value()) { return false; }
        T previous = std::move(*_pending_previous);
        _pending_previous.reset();
        if (_equals(*_value, previous)) { return false; }
        _subscribers->notify(*_value, previous);
        return true;
    }

    [[nodiscard]] NotifierKind notifier_kind() const override { return NotifierKind::COMPUTED; }

    [[nodiscard]] NodeId notifier_node() const override { return node(); }

    // ========== Dependent ==========

    bool mark_stale() override {
        if (!is_live() || _dirty) { return false; }
        _dirty = true;
        return true;
    }

    bool refresh() override {
        if (!is_live()) { return false; }
        if (!observed()) { return false; }
        return notify();
    }

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
    /**
     * @brief True while a subscriber or a reader holds on to the value, only then is a previous value kept.
     */
    [[nodiscard]] bool observed() const {
        return !_subscribers->empty() || !context().graph().readers(node()).empty();
    }

    void recompute() {
        if (_computing) { throw_error("Cycle detected while computing {}", static_cast<const ReactiveBase &>(*this)); }
        auto &ctx = context();
        ctx.notify_before_recompute(*this);

        _computing = true;
        auto reset = make_scope_exit([this] { _computing = false; });

        std::optional<T> fresh;
        std::vector<NodeId> reads;
        {
            ReaderScope scope{ctx, node(), false};
            fresh.emplace(_fn());
            reads = scope.take_reads();
        }
        ctx.graph().replace_sources(node(), reads);

        if (!observed()) {
            _pending_previous.reset();
        } else if (!_pending_previous.has_value() && _value.has_value()) {
            _pending_previous = std::move(_value);
        }
        _value = std::move(fresh);
        _dirty = false;

        ctx.notify_after_recompute(*this);
    }

    compute_fn _fn;
    std::optional<T> _value;
    std::optional<T> _pending_previous;
    std::shared_ptr<subscriber_list_type> _subscribers;
    bool _dirty{true};
    bool _computing{false};
    [[no_unique_address]] Eq _equals{};
};

} // namespace sigraph
