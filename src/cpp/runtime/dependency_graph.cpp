#include <sigraph/runtime/dependency_graph.h>
#include <sigraph/util/errors.h>

#include <algorithm>
#include <utility>

namespace sigraph {

namespace {

const std::vector<NodeId> EMPTY_EDGES{};

bool erase_edge(std::vector<NodeId> &edges, NodeId id) {
    auto it = std::find(edges.begin(), edges.end(), id);
    if (it == edges.end()) { return false; }
    edges.erase(it);
    return true;
}

bool has_edge(const std::vector<NodeId> &edges, NodeId id) {
    return std::find(edges.begin(), edges.end(), id) != edges.end();
}

}  // namespace

NodeId DependencyGraph::add_node(NodeKind kind) {
    std::uint32_t index;
    if (!_free_slots.empty()) {
        index = _free_slots.back();
        _free_slots.pop_back();
    } else {
        if (_nodes.size() >= NodeId::INVALID_INDEX) {
            throw_error("Dependency graph is full ({} nodes)", _nodes.size());
        }
        index = static_cast<std::uint32_t>(_nodes.size());
        _nodes.emplace_back();
    }

    auto &record = _nodes[index];
    record.kind = kind;
    record.live = true;
    record.dependent = nullptr;
    ++_live_nodes;
    return NodeId{index, record.generation};
}

void DependencyGraph::set_dependent(NodeId id, Dependent *dependent) {
    if (auto *record = find(id)) { record->dependent = dependent; }
}

void DependencyGraph::remove_node(NodeId id) {
    auto *record = find(id);
    if (record == nullptr) { return; }

    // Detach from the other end of every edge first, the lists of this record are dropped wholesale below.
    for (NodeId source : record->sources) {
        if (auto *other = find(source)) { erase_edge(other->readers, id); }
    }
    for (NodeId reader : record->readers) {
        if (auto *other = find(reader)) { erase_edge(other->sources, id); }
    }
    _edges -= record->sources.size() + record->readers.size();

    record->sources.clear();
    record->readers.clear();
    record->dependent = nullptr;
    record->live = false;
    ++record->generation;
    _free_slots.push_back(id.index);
    --_live_nodes;
}

bool DependencyGraph::contains(NodeId id) const { return find(id) != nullptr; }

NodeKind DependencyGraph::kind(NodeId id) const {
    const auto *record = find(id);
    if (record == nullptr) { throw_error("Unknown node {}", id); }
    return record->kind;
}

Dependent *DependencyGraph::dependent(NodeId id) const {
    const auto *record = find(id);
    return record != nullptr ? record->dependent : nullptr;
}

bool DependencyGraph::link(NodeId source, NodeId reader) {
    if (source == reader) { return false; }
    auto *source_record = find(source);
    auto *reader_record = find(reader);
    if (source_record == nullptr || reader_record == nullptr) { return false; }
    if (has_edge(reader_record->sources, source)) { return false; }

    reader_record->sources.push_back(source);
    source_record->readers.push_back(reader);
    ++_edges;
    return true;
}

bool DependencyGraph::unlink(NodeId source, NodeId reader) {
    auto *reader_record = find(reader);
    if (reader_record == nullptr || !erase_edge(reader_record->sources, source)) { return false; }
    if (auto *source_record = find(source)) { erase_edge(source_record->readers, reader); }
    --_edges;
    return true;
}

void DependencyGraph::unlink_sources(NodeId reader) {
    auto *reader_record = find(reader);
    if (reader_record == nullptr) { return; }
    for (NodeId source : reader_record->sources) {
        if (auto *source_record = find(source)) { erase_edge(source_record->readers, reader); }
    }
    _edges -= reader_record->sources.size();
    reader_record->sources.clear();
}

void DependencyGraph::replace_sources(NodeId reader, std::span<const NodeId> fresh) {
    auto *reader_record = find(reader);
    if (reader_record == nullptr) { return; }

    const std::vector<NodeId> previous = reader_record->sources;
    for (NodeId source : previous) {
        if (std::find(fresh.begin(), fresh.end(), source) == fresh.end()) { unlink(source, reader); }
    }
    for (NodeId source : fresh) {
        if (!has_edge(previous, source)) { link(source, reader); }
    }
}

const std::vector<NodeId> &DependencyGraph::sources(NodeId reader) const {
    const auto *record = find(reader);
    return record != nullptr ? record->sources : EMPTY_EDGES;
}

const std::vector<NodeId> &DependencyGraph::readers(NodeId source) const {
    const auto *record = find(source);
    return record != nullptr ? record->readers : EMPTY_EDGES;
}

void DependencyGraph::invalidate(std::span<const NodeId> changed) {
    std::vector<NodeId> stack(changed.begin(), changed.end());
    while (!stack.empty()) {
        const NodeId current = stack.back();
        stack.pop_back();
        // Copy, mark_stale must not touch edges but the walk should not depend on that.
        const std::vector<NodeId> readers_of = readers(current);
        for (NodeId reader : readers_of) {
            auto *dep = dependent(reader);
            if (dep != nullptr && dep->mark_stale()) { stack.push_back(reader); }
        }
    }
}

std::vector<NodeId> DependencyGraph::downstream(std::span<const NodeId> changed) const {
    // Iterative depth first search over reader edges; reversed post-order is a topological order of the reachable
    // sub-graph, so every node comes after all of its reachable sources.
    std::vector<NodeId> post_order;
    NodeSet visited;
    std::vector<std::pair<NodeId, std::size_t>> stack;

    for (NodeId root : changed) { visited.insert(root); }

    for (NodeId root : changed) {
        stack.emplace_back(root, 0);
        while (!stack.empty()) {
            auto &[node, next] = stack.back();
            const auto &readers_of = readers(node);
            if (next < readers_of.size()) {
                const NodeId reader = readers_of[next++];
                if (visited.insert(reader).second) { stack.emplace_back(reader, 0); }
                continue;
            }
            if (!std::any_of(changed.begin(), changed.end(), [&](NodeId id) { return id == node; })) {
                post_order.push_back(node);
            }
            stack.pop_back();
        }
    }

    std::reverse(post_order.begin(), post_order.end());
    return post_order;
}

bool DependencyGraph::is_consistent(NodeId id) const {
    const auto *record = find(id);
    if (record == nullptr) { return false; }
    for (NodeId source : record->sources) {
        const auto *other = find(source);
        if (other == nullptr || std::count(other->readers.begin(), other->readers.end(), id) != 1) { return false; }
    }
    for (NodeId reader : record->readers) {
        const auto *other = find(reader);
        if (other == nullptr || std::count(other->sources.begin(), other->sources.end(), id) != 1) { return false; }
    }
    return true;
}

bool DependencyGraph::is_consistent() const {
    std::size_t edges{0};
    for (std::uint32_t index = 0; index < _nodes.size(); ++index) {
        const auto &record = _nodes[index];
        if (!record.live) { continue; }
        if (!is_consistent(NodeId{index, record.generation})) { return false; }
        edges += record.sources.size();
    }
    return edges == _edges;
}

DependencyGraph::NodeRecord *DependencyGraph::find(NodeId id) {
    return const_cast<NodeRecord *>(std::as_const(*this).find(id));
}

const DependencyGraph::NodeRecord *DependencyGraph::find(NodeId id) const {
    if (!id.valid() || id.index >= _nodes.size()) { return nullptr; }
    const auto &record = _nodes[id.index];
    if (!record.live || record.generation != id.generation) { return nullptr; }
    return &record;
}

} // namespace sigraph
