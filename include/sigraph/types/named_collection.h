#pragma once

/**
 * @file named_collection.h
 * @brief Keyed set of JSON signals, the unit that is serialised across process and network boundaries.
 *
 * Writing an existing key writes into the Signal already stored under it, it never replaces the Signal, so anyone
 * subscribed to it keeps receiving updates. from_json() follows the same rule and only creates Signals for keys it
 * has not seen, all its writes happen in one batch.
 */

#include <sigraph/sigraph_base.h>
#include <sigraph/types/signal.h>
#include <sigraph/types/subscription.h>

#include <ankerl/unordered_dense.h>
#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sigraph {

class SIGRAPH_EXPORT NamedCollection {
public:
    using signal_type = Signal<nlohmann::json>;
    using signal_s_ptr = std::shared_ptr<signal_type>;
    /**
     * Returns an error message to reject the value, nothing to accept it.
     */
    using validator_fn = std::function<std::optional<std::string>(const nlohmann::json &)>;
    using change_fn = std::function<void(const std::string &, const nlohmann::json &)>;

    NamedCollection();

    explicit NamedCollection(ReactiveContext &context);

    ~NamedCollection();

    NamedCollection(const NamedCollection &) = delete;

    NamedCollection &operator=(const NamedCollection &) = delete;

    // ========== Entries ==========

    /**
     * @brief Write value under key, creating the Signal on first use.
     * @throws ValidationError if a validator of key rejects the value, nothing is written then.
     * @return The Signal stored under key, nullptr once the collection is disposed.
     */
    signal_s_ptr set(const std::string &key, nlohmann::json value);

    /**
     * @brief The Signal stored under key, nullptr if there is none.
     */
    [[nodiscard]] signal_s_ptr get(const std::string &key) const;

    [[nodiscard]] bool has(const std::string &key) const;

    /**
     * @brief Remove key. The Signal itself is left alone, holders of it keep a working Signal.
     */
    bool erase(const std::string &key);

    void clear();

    [[nodiscard]] std::size_t size() const { return _entries.size(); }

    [[nodiscard]] bool empty() const { return _entries.empty(); }

    /**
     * @brief Keys in insertion order.
     */
    [[nodiscard]] std::vector<std::string> keys() const;

    // ========== Serialisation ==========

    /**
     * @brief Flat object of the current values, read without tracking.
     */
    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Write every member of object, in one batch.
     *
     * All members are validated before anything is written.
     *
     * @throws std::invalid_argument if object is not a JSON object.
     * @throws ValidationError if a validator rejects a member.
     */
    void from_json(const nlohmann::json &object);

    [[nodiscard]] std::string to_json_string(int indent = -1) const;

    /**
     * @brief Parse text and apply it with from_json. Parse errors propagate as nlohmann::json::parse_error.
     */
    void from_json_string(std::string_view text);

    // ========== Hooks ==========

    void add_validator(const std::string &key, validator_fn validator);

    /**
     * @brief Called with (key, value) after the Signal of key notified a change.
     */
    void set_on_change(change_fn on_change);

    // ========== Life-cycle ==========

    /**
     * @brief Dispose every Signal and empty the collection. Later calls are ignored.
     */
    void dispose();

    [[nodiscard]] bool is_disposed() const { return _disposed; }

private:
    struct Entry {
        signal_s_ptr signal;
        Subscription on_change;
    };

    void validate(const std::string &key, const nlohmann::json &value) const;

    void write(const std::string &key, nlohmann::json value);

    ReactiveContext *_context;
    ankerl::unordered_dense::map<std::string, Entry> _entries;
    ankerl::unordered_dense::map<std::string, std::vector<validator_fn>> _validators;
    std::shared_ptr<change_fn> _on_change{std::make_shared<change_fn>()};
    bool _disposed{false};
};

} // namespace sigraph
