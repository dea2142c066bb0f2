#include <sigraph/types/json_path.h>

#include <charconv>
#include <utility>

namespace sigraph {

namespace {

const nlohmann::json *step(const nlohmann::json &node, std::string_view segment) {
    if (node.is_object()) {
        auto it = node.find(std::string{segment});
        return it != node.end() ? &*it : nullptr;
    }
    if (node.is_array()) {
        std::size_t index{0};
        const auto *end = segment.data() + segment.size();
        auto [ptr, ec] = std::from_chars(segment.data(), end, index);
        if (ec != std::errc{} || ptr != end || index >= node.size()) { return nullptr; }
        return &node[index];
    }
    return nullptr;
}

}  // namespace

nlohmann::json value_at_path(const nlohmann::json &root, std::string_view path) {
    const nlohmann::json *current = &root;
    while (!path.empty()) {
        const auto dot = path.find('.');
        const auto segment = path.substr(0, dot);
        current = step(*current, segment);
        if (current == nullptr) { return nullptr; }
        path = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);
    }
    return *current;
}

Subscription watch_path(Signal<nlohmann::json> &signal, std::string path, path_callback callback) {
    auto last = std::make_shared<nlohmann::json>(value_at_path(signal.peek(), path));
    return signal.subscribe(
        [path = std::move(path), last, callback = std::move(callback)](const nlohmann::json &value,
                                                                        const nlohmann::json &) {
            auto current = value_at_path(value, path);
            if (current == *last) { return; }
            auto previous = std::exchange(*last, current);
            callback(current, previous);
        });
}

std::unique_ptr<Computed<nlohmann::json>> derived_path(Signal<nlohmann::json> &signal, std::string path) {
    return std::make_unique<Computed<nlohmann::json>>(
        signal.context(), [&signal, path = std::move(path)] { return value_at_path(signal.get(), path); });
}

std::unique_ptr<Computed<nlohmann::json>> derived_path(std::shared_ptr<Signal<nlohmann::json>> signal,
                                                       std::string path) {
    auto &context = signal->context();
    return std::make_unique<Computed<nlohmann::json>>(
        context, [signal = std::move(signal), path = std::move(path)] { return value_at_path(signal->get(), path); });
}

} // namespace sigraph
