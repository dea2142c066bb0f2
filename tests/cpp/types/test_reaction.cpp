/**
 * @file test_reaction.cpp
 * @brief Unit tests for Reaction and EffectRoot.
 */

#include <catch2/catch_test_macros.hpp>

#include <sigraph/types/computed.h>
#include <sigraph/types/reaction.h>
#include <sigraph/types/signal.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace sigraph;

TEST_CASE("Reaction - runs at construction and on every change", "[reaction]") {
    ReactiveContext ctx;
    Signal<int> a{ctx, 1};
    std::vector<int> seen;
    Reaction effect{ctx, [&] { seen.push_back(a.get()); }};
    CHECK(seen == std::vector<int>{1});

    a.set(2);
    a.set(3);
    CHECK(seen == std::vector<int>{1, 2, 3});
    CHECK(effect.run_count() == 3);
}

TEST_CASE("Reaction - dependencies are re-tracked on every run", "[reaction]") {
    ReactiveContext ctx;
    Signal<bool> use_a{ctx, true};
    Signal<int> a{ctx, 1};
    Signal<int> b{ctx, 2};
    int runs{0};
    Reaction effect{ctx, [&] {
        ++runs;
        (void) (use_a.get() ? a.get() : b.get());
    }};
    CHECK(ctx.graph().sources(effect.node()).size() == 2);

    b.set(20);
    CHECK(runs == 1);

    use_a.set(false);
    CHECK(runs == 2);
    CHECK(ctx.graph().readers(a.node()).empty());

    a.set(10);
    CHECK(runs == 2);
    b.set(30);
    CHECK(runs == 3);
    CHECK(ctx.graph().is_consistent());
}

TEST_CASE("Reaction - cleanup runs once before each re-run and once at disposal", "[reaction]") {
    ReactiveContext ctx;
    Signal<int> a{ctx, 0};
    std::vector<std::string> log;
    Reaction effect{ctx, [&] {
        const int value = a.get();
        log.push_back("run " + std::to_string(value));
        return [&log, value] { log.push_back("cleanup " + std::to_string(value)); };
    }};
    CHECK(effect.has_cleanup());

    a.set(1);
    effect.dispose();
    effect.dispose();
    a.set(2);

    CHECK(log == std::vector<std::string>{"run 0", "cleanup 0", "run 1", "cleanup 1"});
}

TEST_CASE("Reaction - disposal releases every edge", "[reaction]") {
    ReactiveContext ctx;
    Signal<int> a{ctx, 0};
    Signal<int> b{ctx, 0};
    int runs{0};
    Reaction effect{ctx, [&] {
        ++runs;
        (void) a.get();
        (void) b.get();
    }};
    CHECK(ctx.graph().readers(a.node()).size() == 1);

    effect.dispose();
    CHECK(ctx.graph().readers(a.node()).empty());
    CHECK(ctx.graph().readers(b.node()).empty());
    a.set(1);
    CHECK(runs == 1);
}

TEST_CASE("Reaction - pause and resume", "[reaction]") {
    ReactiveContext ctx;
    Signal<int> a{ctx, 0};
    std::vector<int> seen;
    Reaction effect{ctx, [&] { seen.push_back(a.get()); }};

    effect.pause();
    CHECK_FALSE(effect.is_active());
    a.set(1);
    a.set(2);
    CHECK(seen == std::vector<int>{0});
    // Paused reactions keep their dependencies
    CHECK(ctx.graph().readers(a.node()).size() == 1);

    effect.resume();
    CHECK(seen == std::vector<int>{0, 2});
    effect.resume();
    CHECK(seen == std::vector<int>{0, 2});

    a.set(3);
    CHECK(seen == std::vector<int>{0, 2, 3});
}

TEST_CASE("Reaction - exceptions propagate to the write and keep earlier reads", "[reaction]") {
    ReactiveContext ctx;
    Signal<int> a{ctx, 0};
    Signal<int> b{ctx, 0};
    Reaction effect{ctx, [&] {
        if (a.get() > 0) { throw std::runtime_error("bad"); }
        (void) b.get();
    }};

    CHECK_THROWS_AS(a.set(1), std::runtime_error);
    CHECK_FALSE(effect.is_running());
    CHECK(ctx.graph().readers(a.node()).size() == 1);
    CHECK(ctx.graph().readers(b.node()).empty());
    CHECK(ctx.reader_depth() == 0);

    a.set(0);
    CHECK(ctx.graph().readers(b.node()).size() == 1);
}

TEST_CASE("Reaction - a self-triggering reaction re-runs until it settles", "[reaction]") {
    ReactiveContext ctx;
    Signal<int> a{ctx, 0};
    Reaction effect{ctx, [&] {
        if (a.get() < 5) { a.set(a.peek() + 1); }
    }};
    CHECK(a.peek() == 5);
    CHECK(effect.run_count() == 6);
}

TEST_CASE("Reaction - endless self-triggering is reported", "[reaction]") {
    ReactiveContext ctx{ContextSettings{.max_reaction_reruns = 10}};
    Signal<int> a{ctx, 0};
    CHECK_THROWS_AS(Reaction(ctx, [&] { a.set(a.get() + 1); }), ReactionCycleError);
    CHECK(a.peek() == 11);
}

TEST_CASE("Reaction - disposing itself from its body", "[reaction]") {
    ReactiveContext ctx;
    Signal<int> a{ctx, 0};
    int cleanups{0};
    Reaction *self{nullptr};
    Reaction effect{ctx, [&] {
        if (a.get() > 0 && self != nullptr) { self->dispose(); }
        return [&] { ++cleanups; };
    }};
    self = &effect;

    a.set(1);
    CHECK(effect.is_disposed());
    // One for the first run, one for the run that disposed
    CHECK(cleanups == 2);
    a.set(2);
    CHECK(cleanups == 2);
}

TEST_CASE("Reaction - does not re-run when a computed it reads is unchanged", "[reaction]") {
    ReactiveContext ctx;
    Signal<std::string> name{ctx, "ada"};
    Computed<std::size_t> length{ctx, [&] { return name.get().size(); }};
    int runs{0};
    Reaction effect{ctx, [&] {
        (void) length.get();
        ++runs;
    }};

    name.set("bob");
    CHECK(runs == 1);
    name.set("carol");
    CHECK(runs == 2);
}

TEST_CASE("Reaction - created after a lazy read of a computed it re-runs on change", "[reaction]") {
    ReactiveContext ctx;
    Signal<int> a{ctx, 1};
    Computed<int> c{ctx, [&] { return a.get() * 2; }};
    a.set(5);
    CHECK(c.get() == 10);

    std::vector<int> observed;
    Reaction effect{ctx, [&] { observed.push_back(c.get()); }};
    a.set(1);
    CHECK(observed == std::vector<int>{10, 2});
    CHECK(effect.run_count() == 2);
}

TEST_CASE("EffectRoot - stop, restart and dispose", "[reaction][effect_root]") {
    ReactiveContext ctx;
    Signal<int> a{ctx, 0};
    std::vector<std::string> log;
    EffectRoot root{ctx, [&] {
        log.push_back("run " + std::to_string(a.get()));
        return [&] { log.push_back("cleanup"); };
    }};
    CHECK(root.is_running());

    root.stop();
    CHECK_FALSE(root.is_running());
    a.set(1);

    root.restart();
    CHECK(root.is_running());
    a.set(2);

    root.dispose();
    CHECK(root.is_disposed());
    root.restart();
    a.set(3);

    CHECK(log == std::vector<std::string>{"run 0", "cleanup", "run 1", "cleanup", "run 2", "cleanup"});
}
