#include <sigraph/types/reactive_base.h>

namespace sigraph {

ReactiveBase::ReactiveBase(ReactiveContext &context, NodeKind kind, std::string label)
    : _context{&context}, _node{context.graph().add_node(kind)}, _kind{kind}, _id{context.next_object_id()},
      _label{std::move(label)} {
    _context->disposal_tracker().track(*this);
}

ReactiveBase::~ReactiveBase() {
    release_node();
    _context->disposal_tracker().untrack(*this);
}

void ReactiveBase::bind_dependent(Dependent *dependent) { _context->graph().set_dependent(_node, dependent); }

void ReactiveBase::release_node() { _context->graph().remove_node(_node); }

} // namespace sigraph
