#pragma once

/**
 * @file dependency_graph.h
 * @brief Arena of reactive nodes with index-based reader/source edges.
 *
 * Every Signal, Computed and Reaction owns one node. A reader (Computed or Reaction) that read a source during its
 * last run holds one edge to it; the edge is stored twice, once in the reader's source list and once in the source's
 * reader list. Keeping both lists mirrored is the subscription invariant of the engine: a source-side entry without
 * its reader-side twin is a leak, the reverse is a missed update. is_consistent() checks it mechanically.
 */

#include <sigraph/sigraph_base.h>
#include <sigraph/types/node_id.h>
#include <sigraph/types/notifiable.h>

#include <cstddef>
#include <span>
#include <vector>

namespace sigraph {

class SIGRAPH_EXPORT DependencyGraph {
public:
    DependencyGraph() = default;

    DependencyGraph(const DependencyGraph &) = delete;
    DependencyGraph &operator=(const DependencyGraph &) = delete;

    // ========== Node Management ==========

    /**
     * @brief Allocate a node, reusing a released slot when one is available.
     */
    [[nodiscard]] NodeId add_node(NodeKind kind);

    /**
     * @brief Attach the reader callbacks of a Computed or Reaction node.
     */
    void set_dependent(NodeId id, Dependent *dependent);

    /**
     * @brief Release a node and every edge touching it, in both directions.
     * @note Releasing an unknown or already released id is a no-op.
     */
    void remove_node(NodeId id);

    [[nodiscard]] bool contains(NodeId id) const;

    [[nodiscard]] NodeKind kind(NodeId id) const;

    [[nodiscard]] Dependent *dependent(NodeId id) const;

    // ========== Edge Management ==========

    /**
     * @brief Record that reader depends on source.
     * @return false if either node is gone, the edge exists already, or source == reader.
     */
    bool link(NodeId source, NodeId reader);

    /**
     * @brief Remove the edge between source and reader.
     * @return false if there was no such edge.
     */
    bool unlink(NodeId source, NodeId reader);

    /**
     * @brief Remove every edge where id is the reader.
     */
    void unlink_sources(NodeId reader);

    /**
     * @brief Make the reader's sources exactly fresh.
     *
     * Sources no longer present are unlinked, new ones are linked, edges present in both are left untouched.
     * Entries of fresh that are no longer in the graph are skipped.
     */
    void replace_sources(NodeId reader, std::span<const NodeId> fresh);

    [[nodiscard]] const std::vector<NodeId> &sources(NodeId reader) const;

    [[nodiscard]] const std::vector<NodeId> &readers(NodeId source) const;

    // ========== Propagation ==========

    /**
     * @brief Invalidation pass: call mark_stale on every dependent reachable from changed.
     *
     * The walk continues through a dependent only when mark_stale reports a new mark, a node already stale has its
     * own downstream stale as well.
     */
    void invalidate(std::span<const NodeId> changed);

    /**
     * @brief Every node reachable from changed through reader edges, in topological order.
     * @note The roots themselves are not part of the result.
     */
    [[nodiscard]] std::vector<NodeId> downstream(std::span<const NodeId> changed) const;

    // ========== Diagnostics ==========

    /**
     * @brief Check that every edge of id is mirrored on the other end.
     */
    [[nodiscard]] bool is_consistent(NodeId id) const;

    [[nodiscard]] bool is_consistent() const;

    [[nodiscard]] std::size_t node_count() const { return _live_nodes; }

    [[nodiscard]] std::size_t edge_count() const { return _edges; }

private:
    struct NodeRecord {
        NodeKind kind{NodeKind::SIGNAL};
        std::uint32_t generation{0};
        bool live{false};
        Dependent *dependent{nullptr};
        std::vector<NodeId> sources;
        std::vector<NodeId> readers;
    };

    [[nodiscard]] NodeRecord *find(NodeId id);

    [[nodiscard]] const NodeRecord *find(NodeId id) const;

    std::vector<NodeRecord> _nodes;
    std::vector<std::uint32_t> _free_slots;
    std::size_t _live_nodes{0};
    std::size_t _edges{0};
};

} // namespace sigraph
