#pragma once

/**
 * @file node_id.h
 * @brief Index handles into the DependencyGraph arena.
 */

#include <ankerl/unordered_dense.h>
#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <string_view>

namespace sigraph {

/**
 * @brief Generation-checked index of a node in the DependencyGraph arena.
 *
 * The index addresses the arena slot, the generation is bumped every time the slot is released so an id that
 * outlived its node never resolves to the slot's next occupant.
 */
struct NodeId {
    static constexpr std::uint32_t INVALID_INDEX = std::numeric_limits<std::uint32_t>::max();

    std::uint32_t index{INVALID_INDEX};
    std::uint32_t generation{0};

    [[nodiscard]] constexpr bool valid() const { return index != INVALID_INDEX; }

    [[nodiscard]] constexpr std::uint64_t key() const {
        return (static_cast<std::uint64_t>(generation) << 32) | index;
    }

    friend constexpr bool operator==(NodeId lhs, NodeId rhs) = default;
};

struct NodeIdHash {
    using is_avalanching = void;

    [[nodiscard]] std::uint64_t operator()(NodeId id) const noexcept {
        return ankerl::unordered_dense::hash<std::uint64_t>{}(id.key());
    }
};

using NodeSet = ankerl::unordered_dense::set<NodeId, NodeIdHash>;

enum class NodeKind : std::uint8_t {
    SIGNAL = 0,
    COMPUTED = 1,
    REACTION = 2
};

[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::SIGNAL: return "signal";
        case NodeKind::COMPUTED: return "computed";
        case NodeKind::REACTION: return "reaction";
    }
    return "unknown";
}

} // namespace sigraph

template<>
struct fmt::formatter<sigraph::NodeId> {
    constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const sigraph::NodeId &id, FormatContext &ctx) const {
        if (!id.valid()) { return fmt::format_to(ctx.out(), "<none>"); }
        return fmt::format_to(ctx.out(), "{}.{}", id.index, id.generation);
    }
};
