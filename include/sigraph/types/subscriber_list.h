#pragma once

#include <sigraph/sigraph_base.h>

#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

namespace sigraph {

/**
 * Type erased view of a SubscriberList, all a Subscription needs to detach itself.
 */
struct SubscriberListBase {
    virtual ~SubscriberListBase() = default;

    virtual bool remove(SubscriptionId id) = 0;

    [[nodiscard]] virtual bool contains(SubscriptionId id) const = 0;
};

/**
 * @brief Ordered list of subscriber callbacks.
 *
 * Callbacks are called in subscription order. Notification walks a snapshot, so callbacks may subscribe or
 * unsubscribe freely; a callback removed during the walk is not called again, one added during it is first called
 * on the next notification.
 */
template<typename... Args>
class SubscriberList final : public SubscriberListBase {
public:
    using callback_type = std::function<void(Args...)>;

    SubscriptionId add(callback_type callback) {
        const auto id = ++_next_id;
        _entries.emplace_back(id, std::move(callback));
        return id;
    }

    bool remove(SubscriptionId id) override {
        auto it = std::find_if(_entries.begin(), _entries.end(), [id](const auto &entry) { return entry.first == id; });
        if (it == _entries.end()) { return false; }
        // The callback may own the source of this list, it is destroyed only once the entry is gone.
        auto removed = std::move(it->second);
        _entries.erase(it);
        return true;
    }

    [[nodiscard]] bool contains(SubscriptionId id) const override {
        return std::any_of(_entries.begin(), _entries.end(), [id](const auto &entry) { return entry.first == id; });
    }

    void clear() { _entries.clear(); }

    [[nodiscard]] std::size_t size() const { return _entries.size(); }

    [[nodiscard]] bool empty() const { return _entries.empty(); }

    void notify(Args... args) const {
        if (_entries.empty()) { return; }
        const auto snapshot = _entries;
        for (const auto &[id, callback] : snapshot) {
            if (contains(id)) { callback(args...); }
        }
    }

private:
    std::vector<std::pair<SubscriptionId, callback_type>> _entries;
    SubscriptionId _next_id{0};
};

} // namespace sigraph
