#pragma once

#include <sigraph/sigraph_base.h>
#include <sigraph/runtime/reactive_context.h>
#include <sigraph/types/node_id.h>
#include <sigraph/types/notifiable.h>
#include <sigraph/util/lifecycle.h>

#include <cstdint>
#include <string>

namespace sigraph {

/**
 * @brief Common part of Signal, Computed and Reaction: the owning context, the graph node and the identity used by
 * observers and the trace.
 *
 * Reactive objects are pinned: the graph and the pending set refer to them by address, so they can be neither
 * copied nor moved. Hold them by value in a stable location or through a smart pointer.
 */
struct SIGRAPH_EXPORT ReactiveBase : Disposable {
    ReactiveBase(ReactiveContext &context, NodeKind kind, std::string label = {});

    ~ReactiveBase() override;

    ReactiveBase(const ReactiveBase &) = delete;

    ReactiveBase &operator=(const ReactiveBase &) = delete;

    ReactiveBase(ReactiveBase &&) = delete;

    ReactiveBase &operator=(ReactiveBase &&) = delete;

    /**
     * @brief Monotonic per-context identity, stable for the life of the object.
     */
    [[nodiscard]] std::uint64_t id() const { return _id; }

    [[nodiscard]] NodeId node() const { return _node; }

    [[nodiscard]] NodeKind kind() const { return _kind; }

    [[nodiscard]] const std::string &label() const { return _label; }

    void set_label(std::string label) { _label = std::move(label); }

    [[nodiscard]] ReactiveContext &context() const { return *_context; }

protected:
    /**
     * @brief Attach the reader callbacks, called from the constructor of Computed and Reaction.
     */
    void bind_dependent(Dependent *dependent);

    /**
     * @brief Remove the node and all its edges from the graph. Idempotent.
     */
    void release_node();

private:
    ReactiveContext *_context;
    NodeId _node;
    NodeKind _kind;
    std::uint64_t _id;
    std::string _label;
};

} // namespace sigraph

template<>
struct fmt::formatter<sigraph::ReactiveBase> {
    constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const sigraph::ReactiveBase &node, FormatContext &ctx) const {
        if (node.label().empty()) { return fmt::format_to(ctx.out(), "{}#{}", sigraph::to_string(node.kind()), node.id()); }
        return fmt::format_to(ctx.out(), "{}#{}:{}", sigraph::to_string(node.kind()), node.id(), node.label());
    }
};
