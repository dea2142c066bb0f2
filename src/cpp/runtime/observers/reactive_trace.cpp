#include <sigraph/runtime/observers/reactive_trace.h>
#include <sigraph/types/reactive_base.h>

#include <fmt/format.h>
#include <iostream>

namespace sigraph {

    // Static member initialization
    bool ReactiveTrace::_use_logger = true;

    ReactiveTrace::ReactiveTrace(const std::optional<std::string> &filter, bool signals, bool computeds,
                                 bool reactions, bool flushes)
        : _filter(filter), _signals(signals), _computeds(computeds), _reactions(reactions), _flushes(flushes) {
    }

    void ReactiveTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void ReactiveTrace::_print(const std::string &msg) {
        std::string formatted = fmt::format("[{}] {}", ++_sequence, msg);
        if (_use_logger) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    void ReactiveTrace::_print_node(const ReactiveBase &node, const std::string &msg) {
        _print(fmt::format("{} {}", node, msg));
    }

    bool ReactiveTrace::_should_log(const ReactiveBase &node) const {
        switch (node.kind()) {
            case NodeKind::SIGNAL:
                if (!_signals) { return false; }
                break;
            case NodeKind::COMPUTED:
                if (!_computeds) { return false; }
                break;
            case NodeKind::REACTION:
                if (!_reactions) { return false; }
                break;
        }
        if (!_filter.has_value()) {
            return true;
        }
        return fmt::format("{}", node).find(_filter.value()) != std::string::npos;
    }

    void ReactiveTrace::on_signal_write(const ReactiveBase &node) {
        if (_should_log(node)) {
            _print_node(node, "write");
        }
    }

    void ReactiveTrace::on_before_recompute(const ReactiveBase &node) {
        if (_should_log(node)) {
            _print_node(node, ">> recompute");
        }
    }

    void ReactiveTrace::on_after_recompute(const ReactiveBase &node) {
        if (_should_log(node)) {
            _print_node(node, "<< recompute");
        }
    }

    void ReactiveTrace::on_before_reaction_run(const ReactiveBase &node) {
        if (_should_log(node)) {
            _print_node(node, ">> run");
        }
    }

    void ReactiveTrace::on_after_reaction_run(const ReactiveBase &node) {
        if (_should_log(node)) {
            _print_node(node, "<< run");
        }
    }

    void ReactiveTrace::on_before_flush(std::size_t pending) {
        if (_flushes) {
            _print(fmt::format(">> flush {} pending", pending));
        }
    }

    void ReactiveTrace::on_after_flush(std::size_t delivered) {
        if (_flushes) {
            _print(fmt::format("<< flush {} delivered", delivered));
        }
    }

    void ReactiveTrace::on_flush_error(const std::exception &error) {
        if (_flushes) {
            _print(fmt::format("!! flush error: {}", error.what()));
        }
    }

    void ReactiveTrace::on_dispose(const ReactiveBase &node) {
        if (_should_log(node)) {
            _print_node(node, "disposed");
        }
    }

} // namespace sigraph
