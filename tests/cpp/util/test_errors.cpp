#include <catch2/catch_test_macros.hpp>

#include <sigraph/util/errors.h>
#include <sigraph/util/scope.h>

#include <stdexcept>
#include <string>

using namespace sigraph;

TEST_CASE("throw_error formats the message", "[errors]") {
    try {
        throw_error("bad value {} for {}", 42, "x");
        FAIL("throw_error returned");
    } catch (const ReactiveError &e) {
        CHECK(std::string{e.what()} == "bad value 42 for x");
    }
}

TEST_CASE("throw_error appends the source location to a plain message", "[errors]") {
    try {
        throw_error<ValidationError>("rejected");
        FAIL("throw_error returned");
    } catch (const ValidationError &e) {
        const std::string what{e.what()};
        CHECK(what.starts_with("rejected\nFile: "));
        CHECK(what.find("test_errors.cpp") != std::string::npos);
    }
}

TEST_CASE("engine errors share the ReactiveError base", "[errors]") {
    CHECK_THROWS_AS(throw_error<ReactionCycleError>("loop {}", 1), ReactiveError);
    CHECK_THROWS_AS(throw_error<ValidationError>("no {}", 2), ReactiveError);
    CHECK_THROWS_AS(throw_error<std::invalid_argument>("arg {}", 3), std::invalid_argument);
}

TEST_CASE("scope_exit runs unless released", "[errors][scope]") {
    int calls{0};
    {
        auto guard = make_scope_exit([&] { ++calls; });
    }
    CHECK(calls == 1);
    {
        auto guard = make_scope_exit([&] { ++calls; });
        guard.release();
    }
    CHECK(calls == 1);
    try {
        auto guard = make_scope_exit([&] { ++calls; });
        throw std::runtime_error("unwind");
    } catch (const std::runtime_error &) {}
    CHECK(calls == 2);
}
