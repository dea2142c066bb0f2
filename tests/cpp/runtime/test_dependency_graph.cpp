/**
 * @file test_dependency_graph.cpp
 * @brief Unit tests for the DependencyGraph arena.
 */

#include <catch2/catch_test_macros.hpp>

#include <sigraph/runtime/dependency_graph.h>

#include <algorithm>
#include <vector>

using namespace sigraph;

namespace {

struct MockDependent : Dependent {
    int marks{0};
    bool stale{false};

    bool mark_stale() override {
        ++marks;
        if (stale) { return false; }
        stale = true;
        return true;
    }

    bool refresh() override { return false; }
};

std::ptrdiff_t position(const std::vector<NodeId> &order, NodeId id) {
    return std::find(order.begin(), order.end(), id) - order.begin();
}

}  // namespace

// ============================================================================
// Nodes
// ============================================================================

TEST_CASE("DependencyGraph - released slots are reused with a new generation", "[runtime][graph]") {
    DependencyGraph graph;
    const auto a = graph.add_node(NodeKind::SIGNAL);
    CHECK(graph.contains(a));
    CHECK(graph.node_count() == 1);
    CHECK(graph.kind(a) == NodeKind::SIGNAL);

    graph.remove_node(a);
    CHECK_FALSE(graph.contains(a));
    CHECK(graph.node_count() == 0);

    const auto b = graph.add_node(NodeKind::COMPUTED);
    CHECK(b.index == a.index);
    CHECK(b.generation != a.generation);
    CHECK_FALSE(graph.contains(a));
    CHECK(graph.contains(b));

    // Releasing a stale id must not touch the new occupant
    graph.remove_node(a);
    CHECK(graph.contains(b));
}

TEST_CASE("DependencyGraph - unknown ids", "[runtime][graph]") {
    DependencyGraph graph;
    CHECK_FALSE(graph.contains(NodeId{}));
    CHECK(graph.sources(NodeId{}).empty());
    CHECK(graph.readers(NodeId{3, 0}).empty());
    CHECK(graph.dependent(NodeId{}) == nullptr);
    CHECK_THROWS(graph.kind(NodeId{}));
}

// ============================================================================
// Edges
// ============================================================================

TEST_CASE("DependencyGraph - edges are mirrored", "[runtime][graph]") {
    DependencyGraph graph;
    const auto s = graph.add_node(NodeKind::SIGNAL);
    const auto c = graph.add_node(NodeKind::COMPUTED);

    CHECK(graph.link(s, c));
    CHECK_FALSE(graph.link(s, c));
    CHECK_FALSE(graph.link(c, c));
    CHECK(graph.edge_count() == 1);
    CHECK(graph.sources(c) == std::vector<NodeId>{s});
    CHECK(graph.readers(s) == std::vector<NodeId>{c});
    CHECK(graph.is_consistent());

    CHECK(graph.unlink(s, c));
    CHECK_FALSE(graph.unlink(s, c));
    CHECK(graph.edge_count() == 0);
    CHECK(graph.readers(s).empty());
    CHECK(graph.is_consistent());
}

TEST_CASE("DependencyGraph - removing a node drops its edges both ways", "[runtime][graph]") {
    DependencyGraph graph;
    const auto s = graph.add_node(NodeKind::SIGNAL);
    const auto c = graph.add_node(NodeKind::COMPUTED);
    const auto r = graph.add_node(NodeKind::REACTION);
    graph.link(s, c);
    graph.link(c, r);
    graph.link(s, r);
    REQUIRE(graph.edge_count() == 3);

    graph.remove_node(c);
    CHECK(graph.edge_count() == 1);
    CHECK(graph.readers(s) == std::vector<NodeId>{r});
    CHECK(graph.sources(r) == std::vector<NodeId>{s});
    CHECK(graph.is_consistent());
}

TEST_CASE("DependencyGraph - replace_sources only touches the difference", "[runtime][graph]") {
    DependencyGraph graph;
    const auto a = graph.add_node(NodeKind::SIGNAL);
    const auto b = graph.add_node(NodeKind::SIGNAL);
    const auto c = graph.add_node(NodeKind::SIGNAL);
    const auto reader = graph.add_node(NodeKind::COMPUTED);

    const std::vector<NodeId> first{a, b};
    graph.replace_sources(reader, first);
    CHECK(graph.sources(reader) == first);

    const std::vector<NodeId> second{b, c};
    graph.replace_sources(reader, second);
    CHECK(graph.readers(a).empty());
    CHECK(graph.readers(b) == std::vector<NodeId>{reader});
    CHECK(graph.readers(c) == std::vector<NodeId>{reader});
    CHECK(graph.edge_count() == 2);
    CHECK(graph.is_consistent(reader));

    graph.unlink_sources(reader);
    CHECK(graph.sources(reader).empty());
    CHECK(graph.edge_count() == 0);
    CHECK(graph.is_consistent());
}

// ============================================================================
// Propagation
// ============================================================================

TEST_CASE("DependencyGraph - invalidate marks transitively and stops at marked nodes", "[runtime][graph]") {
    DependencyGraph graph;
    MockDependent left, right, bottom;
    const auto s = graph.add_node(NodeKind::SIGNAL);
    const auto l = graph.add_node(NodeKind::COMPUTED);
    const auto r = graph.add_node(NodeKind::COMPUTED);
    const auto b = graph.add_node(NodeKind::COMPUTED);
    graph.set_dependent(l, &left);
    graph.set_dependent(r, &right);
    graph.set_dependent(b, &bottom);
    graph.link(s, l);
    graph.link(s, r);
    graph.link(l, b);
    graph.link(r, b);

    const std::vector<NodeId> changed{s};
    graph.invalidate(changed);
    CHECK(left.stale);
    CHECK(right.stale);
    CHECK(bottom.stale);
    // Reached through both arms, only the first mark is new
    CHECK(bottom.marks == 2);

    graph.invalidate(changed);
    CHECK(left.marks == 2);
    CHECK(bottom.marks == 2);
}

TEST_CASE("DependencyGraph - downstream is topologically ordered", "[runtime][graph]") {
    DependencyGraph graph;
    const auto s = graph.add_node(NodeKind::SIGNAL);
    const auto l = graph.add_node(NodeKind::COMPUTED);
    const auto r = graph.add_node(NodeKind::COMPUTED);
    const auto b = graph.add_node(NodeKind::COMPUTED);
    const auto effect = graph.add_node(NodeKind::REACTION);
    const auto unrelated = graph.add_node(NodeKind::SIGNAL);
    graph.link(s, l);
    graph.link(s, r);
    graph.link(l, b);
    graph.link(r, b);
    graph.link(b, effect);
    graph.link(s, effect);

    const std::vector<NodeId> changed{s};
    const auto order = graph.downstream(changed);
    REQUIRE(order.size() == 4);
    CHECK(position(order, s) == static_cast<std::ptrdiff_t>(order.size()));
    CHECK(position(order, unrelated) == static_cast<std::ptrdiff_t>(order.size()));
    CHECK(position(order, l) < position(order, b));
    CHECK(position(order, r) < position(order, b));
    CHECK(position(order, b) < position(order, effect));
}
