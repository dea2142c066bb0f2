/**
 * @file test_json_path.cpp
 * @brief Unit tests for path lookups into JSON signals.
 */

#include <catch2/catch_test_macros.hpp>

#include <sigraph/types/json_path.h>
#include <sigraph/types/named_collection.h>
#include <sigraph/types/reaction.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace sigraph;
using nlohmann::json;

namespace {

json sample() {
    return json::parse(R"({
        "user": {
            "name": "ada",
            "addresses": [{"city": "London"}, {"city": "Paris"}]
        },
        "count": 3
    })");
}

}  // namespace

TEST_CASE("value_at_path - objects and arrays", "[json_path]") {
    const auto doc = sample();
    CHECK(value_at_path(doc, "count") == 3);
    CHECK(value_at_path(doc, "user.name") == "ada");
    CHECK(value_at_path(doc, "user.addresses.1.city") == "Paris");
    CHECK(value_at_path(doc, "") == doc);
}

TEST_CASE("value_at_path - missing segments give null", "[json_path]") {
    const auto doc = sample();
    CHECK(value_at_path(doc, "user.age").is_null());
    CHECK(value_at_path(doc, "user.addresses.5.city").is_null());
    CHECK(value_at_path(doc, "user.addresses.first").is_null());
    CHECK(value_at_path(doc, "user.addresses.-1").is_null());
    CHECK(value_at_path(doc, "count.deeper").is_null());
}

TEST_CASE("watch_path - only changes at the path are reported", "[json_path]") {
    ReactiveContext ctx;
    Signal<json> doc{ctx, sample()};
    std::vector<std::pair<json, json>> seen;
    auto sub = watch_path(doc, "user.name", [&](const json &value, const json &previous) {
        seen.emplace_back(value, previous);
    });

    doc.update([](const json &current) {
        auto next = current;
        next["count"] = 4;
        return next;
    });
    CHECK(seen.empty());

    doc.update([](const json &current) {
        auto next = current;
        next["user"]["name"] = "bob";
        return next;
    });
    REQUIRE(seen.size() == 1);
    CHECK(seen[0].first == "bob");
    CHECK(seen[0].second == "ada");

    doc.set(json::object());
    REQUIRE(seen.size() == 2);
    CHECK(seen[1].first.is_null());
    CHECK(seen[1].second == "bob");

    sub.unsubscribe();
    doc.set(sample());
    CHECK(seen.size() == 2);
}

TEST_CASE("derived_path - follows the value and notifies only on change", "[json_path]") {
    ReactiveContext ctx;
    Signal<json> doc{ctx, sample()};
    auto city = derived_path(doc, "user.addresses.0.city");
    CHECK(city->get() == "London");

    std::vector<json> seen;
    Reaction effect{ctx, [&] { seen.push_back(city->get()); }};

    doc.update([](const json &current) {
        auto next = current;
        next["count"] = 10;
        return next;
    });
    CHECK(seen.size() == 1);

    doc.update([](const json &current) {
        auto next = current;
        next["user"]["addresses"][0]["city"] = "Rome";
        return next;
    });
    CHECK(seen == std::vector<json>{"London", "Rome"});
}

TEST_CASE("derived_path - shares ownership of a collection signal", "[json_path]") {
    ReactiveContext ctx;
    NamedCollection state{ctx};
    auto doc = state.set("doc", sample());
    auto name = derived_path(doc, "user.name");
    std::weak_ptr<Signal<json>> alive{doc};

    state.erase("doc");
    doc->set(json{{"user", {{"name", "bob"}}}});
    doc.reset();

    CHECK_FALSE(alive.expired());
    CHECK(name->get() == "bob");
}
