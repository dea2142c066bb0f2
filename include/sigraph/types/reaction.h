#pragma once

#include <sigraph/sigraph_base.h>
#include <sigraph/types/reactive_base.h>

#include <concepts>
#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace sigraph {

/**
 * @brief Eager side effect that re-runs whenever something it read changes.
 *
 * Each run:
 * 1. runs the cleanup left by the previous run, if any;
 * 2. drops every source edge;
 * 3. runs the body as the innermost reader, linking each read as it happens;
 * 4. keeps the cleanup the body returned (the body may return a callable or nothing).
 *
 * The reaction runs once when constructed. Any change of a source re-runs the whole body once per propagation.
 * A change arriving while the body itself runs is remembered and the body runs again straight after, up to
 * ContextSettings::max_reaction_reruns times in a row.
 *
 * Exceptions from the body propagate to whatever triggered the run, reads made before the throw stay linked.
 */
class SIGRAPH_EXPORT Reaction final : public ReactiveBase, public Dependent {
public:
    using cleanup_fn = std::function<void()>;
    using reaction_fn = std::function<cleanup_fn()>;
    using ptr = Reaction *;
    using u_ptr = std::unique_ptr<Reaction>;

    template<typename Fn>
        requires std::invocable<Fn &>
    explicit Reaction(Fn &&fn) : Reaction(ReactiveContext::current(), std::forward<Fn>(fn)) {}

    template<typename Fn>
        requires std::invocable<Fn &>
    Reaction(ReactiveContext &context, Fn &&fn, std::string label = {})
        : Reaction(context, make_reaction_fn(std::forward<Fn>(fn)), std::move(label), construct_tag{}) {}

    ~Reaction() override;

    /**
     * @brief Stop future runs without tearing anything down.
     */
    void pause();

    /**
     * @brief Re-activate a paused reaction and run it once. Does nothing if it was not paused.
     */
    void resume();

    [[nodiscard]] bool is_active() const { return _active && is_live(); }

    [[nodiscard]] bool is_running() const { return _running; }

    [[nodiscard]] bool has_cleanup() const { return static_cast<bool>(_cleanup); }

    [[nodiscard]] std::size_t run_count() const { return _run_count; }

    /**
     * @brief Normalise a body returning nothing, or something callable, to reaction_fn.
     */
    template<typename Fn>
    static reaction_fn make_reaction_fn(Fn &&fn) {
        using result_type = std::invoke_result_t<Fn &>;
        if constexpr (std::is_same_v<std::remove_cvref_t<Fn>, reaction_fn>) {
            return std::forward<Fn>(fn);
        } else if constexpr (std::is_void_v<result_type>) {
            return [f = std::forward<Fn>(fn)]() mutable -> cleanup_fn {
                std::invoke(f);
                return {};
            };
        } else {
            static_assert(std::is_constructible_v<cleanup_fn, result_type>,
                          "A reaction body returns nothing or a cleanup callable");
            return [f = std::forward<Fn>(fn)]() mutable -> cleanup_fn { return cleanup_fn{std::invoke(f)}; };
        }
    }

    // ========== Dependent ==========

    bool mark_stale() override;

    bool refresh() override;

protected:
    void do_dispose() override;

private:
    struct construct_tag {};

    Reaction(ReactiveContext &context, reaction_fn fn, std::string label, construct_tag);

    void run();

    void run_once();

    reaction_fn _fn;
    cleanup_fn _cleanup;
    bool _active{true};
    bool _running{false};
    bool _rerun_requested{false};
    std::size_t _run_count{0};
};

/**
 * @brief Owner of a Reaction that can be stopped and started again.
 *
 * stop() disposes the current reaction (running its cleanup), restart() creates a fresh one from the same body.
 * dispose() stops for good.
 */
class SIGRAPH_EXPORT EffectRoot {
public:
    template<typename Fn>
        requires std::invocable<Fn &>
    explicit EffectRoot(Fn &&fn) : EffectRoot(ReactiveContext::current(), std::forward<Fn>(fn)) {}

    template<typename Fn>
        requires std::invocable<Fn &>
    EffectRoot(ReactiveContext &context, Fn &&fn)
        : _context{&context}, _fn{Reaction::make_reaction_fn(std::forward<Fn>(fn))} {
        start();
    }

    ~EffectRoot();

    EffectRoot(const EffectRoot &) = delete;

    EffectRoot &operator=(const EffectRoot &) = delete;

    void stop();

    void restart();

    void dispose();

    [[nodiscard]] bool is_running() const { return _reaction != nullptr && _reaction->is_live(); }

    [[nodiscard]] bool is_disposed() const { return _disposed; }

    [[nodiscard]] Reaction *reaction() const { return _reaction.get(); }

private:
    void start();

    ReactiveContext *_context;
    Reaction::reaction_fn _fn;
    Reaction::u_ptr _reaction;
    bool _disposed{false};
};

} // namespace sigraph
