/**
 * @file test_disposal_tracker.cpp
 * @brief Unit tests for the leak tracking registry.
 */

#include <catch2/catch_test_macros.hpp>

#include <sigraph/runtime/disposal_tracker.h>
#include <sigraph/types/computed.h>
#include <sigraph/types/reaction.h>
#include <sigraph/types/signal.h>

#include <memory>

using namespace sigraph;

TEST_CASE("DisposalTracker - nothing is tracked while disabled", "[disposal_tracker]") {
    ReactiveContext ctx;
    Signal<int> s{ctx, 0};
    CHECK_FALSE(ctx.disposal_tracker().is_tracked(s));
    CHECK(ctx.disposal_tracker().tracked_count() == 0);
}

TEST_CASE("DisposalTracker - counts live and disposed objects", "[disposal_tracker]") {
    ReactiveContext ctx{ContextSettings{.track_disposals = true}};
    auto &tracker = ctx.disposal_tracker();

    Signal<int> a{ctx, 1};
    Computed<int> b{ctx, [&] { return a.get() + 1; }};
    Reaction r{ctx, [&] { (void) b.get(); }};
    CHECK(tracker.tracked_count() == 3);
    CHECK(tracker.active_count() == 3);
    CHECK(tracker.is_tracked(b));

    r.dispose();
    CHECK(tracker.tracked_count() == 3);
    CHECK(tracker.active_count() == 2);
}

TEST_CASE("DisposalTracker - destroyed objects deregister", "[disposal_tracker]") {
    ReactiveContext ctx{ContextSettings{.track_disposals = true}};
    auto &tracker = ctx.disposal_tracker();

    auto s = std::make_unique<Signal<int>>(ctx, 0);
    CHECK(tracker.tracked_count() == 1);
    s.reset();
    CHECK(tracker.tracked_count() == 0);
    CHECK(tracker.active_count() == 0);
}

TEST_CASE("DisposalTracker - dispose_all tears down every live object", "[disposal_tracker]") {
    ReactiveContext ctx{ContextSettings{.track_disposals = true}};
    auto &tracker = ctx.disposal_tracker();

    Signal<int> a{ctx, 0};
    int cleanups{0};
    int runs{0};
    Reaction r{ctx, [&] {
        (void) a.get();
        ++runs;
        return [&] { ++cleanups; };
    }};
    Signal<int> already{ctx, 0};
    already.dispose();

    CHECK(tracker.dispose_all() == 2);
    CHECK(tracker.active_count() == 0);
    CHECK(cleanups == 1);
    CHECK(a.is_disposed());
    CHECK(r.is_disposed());

    a.set(1);
    CHECK(runs == 1);
    CHECK(tracker.dispose_all() == 0);
}

TEST_CASE("DisposalTracker - a cleanup destroying another tracked object is tolerated", "[disposal_tracker]") {
    ReactiveContext ctx{ContextSettings{.track_disposals = true}};
    auto &tracker = ctx.disposal_tracker();

    auto owned = std::make_unique<Signal<int>>(ctx, 0);
    Reaction r{ctx, [&] { return [&] { owned.reset(); }; }};
    CHECK(tracker.tracked_count() == 2);

    const auto disposed = tracker.dispose_all();
    CHECK(owned == nullptr);
    CHECK(r.is_disposed());
    CHECK(disposed >= 1);
    CHECK(tracker.tracked_count() == 1);
}

TEST_CASE("DisposalTracker - can be switched on later", "[disposal_tracker]") {
    ReactiveContext ctx;
    Signal<int> before{ctx, 0};
    ctx.configure(ContextSettings{.track_disposals = true});
    Signal<int> after{ctx, 0};

    CHECK_FALSE(ctx.disposal_tracker().is_tracked(before));
    CHECK(ctx.disposal_tracker().is_tracked(after));
}
