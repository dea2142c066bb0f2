#include <sigraph/types/named_collection.h>
#include <sigraph/util/errors.h>

#include <stdexcept>
#include <utility>

namespace sigraph {

NamedCollection::NamedCollection() : NamedCollection(ReactiveContext::current()) {}

NamedCollection::NamedCollection(ReactiveContext &context) : _context{&context} {}

NamedCollection::~NamedCollection() {
    for (auto &[key, entry] : _entries) { entry.on_change.unsubscribe(); }
}

NamedCollection::signal_s_ptr NamedCollection::set(const std::string &key, nlohmann::json value) {
    if (_disposed) { return nullptr; }
    validate(key, value);
    write(key, std::move(value));
    return _entries.find(key)->second.signal;
}

NamedCollection::signal_s_ptr NamedCollection::get(const std::string &key) const {
    auto it = _entries.find(key);
    return it != _entries.end() ? it->second.signal : nullptr;
}

bool NamedCollection::has(const std::string &key) const { return _entries.contains(key); }

bool NamedCollection::erase(const std::string &key) {
    auto it = _entries.find(key);
    if (it == _entries.end()) { return false; }
    it->second.on_change.unsubscribe();
    _entries.erase(it);
    return true;
}

void NamedCollection::clear() {
    for (auto &[key, entry] : _entries) { entry.on_change.unsubscribe(); }
    _entries.clear();
}

std::vector<std::string> NamedCollection::keys() const {
    std::vector<std::string> result;
    result.reserve(_entries.size());
    for (const auto &[key, entry] : _entries) { result.push_back(key); }
    return result;
}

nlohmann::json NamedCollection::to_json() const {
    auto result = nlohmann::json::object();
    for (const auto &[key, entry] : _entries) { result[key] = entry.signal->peek(); }
    return result;
}

void NamedCollection::from_json(const nlohmann::json &object) {
    if (_disposed) { return; }
    if (!object.is_object()) {
        throw_error<std::invalid_argument>("NamedCollection::from_json expects a JSON object, got {}",
                                           object.type_name());
    }
    for (const auto &item : object.items()) { validate(item.key(), item.value()); }
    batch(*_context, [&] {
        for (const auto &item : object.items()) { write(item.key(), item.value()); }
    });
}

std::string NamedCollection::to_json_string(int indent) const { return to_json().dump(indent); }

void NamedCollection::from_json_string(std::string_view text) { from_json(nlohmann::json::parse(text)); }

void NamedCollection::add_validator(const std::string &key, validator_fn validator) {
    if (validator) { _validators[key].push_back(std::move(validator)); }
}

void NamedCollection::set_on_change(change_fn on_change) { *_on_change = std::move(on_change); }

void NamedCollection::dispose() {
    if (_disposed) { return; }
    _disposed = true;
    for (auto &[key, entry] : _entries) {
        entry.on_change.unsubscribe();
        entry.signal->dispose();
    }
    _entries.clear();
    _validators.clear();
}

void NamedCollection::validate(const std::string &key, const nlohmann::json &value) const {
    auto it = _validators.find(key);
    if (it == _validators.end()) { return; }
    for (const auto &validator : it->second) {
        if (auto error = validator(value)) { throw_error<ValidationError>("Invalid value for '{}': {}", key, *error); }
    }
}

void NamedCollection::write(const std::string &key, nlohmann::json value) {
    if (auto it = _entries.find(key); it != _entries.end()) {
        it->second.signal->set(std::move(value));
        return;
    }

    auto signal = std::make_shared<signal_type>(*_context, std::move(value), key);
    std::weak_ptr<change_fn> on_change{_on_change};
    auto subscription = signal->subscribe([key, on_change](const nlohmann::json &current, const nlohmann::json &) {
        if (auto fn = on_change.lock(); fn && *fn) { (*fn)(key, current); }
    });
    _entries.emplace(key, Entry{std::move(signal), std::move(subscription)});
}

} // namespace sigraph
