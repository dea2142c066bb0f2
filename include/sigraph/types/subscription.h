#pragma once

#include <sigraph/sigraph_base.h>
#include <sigraph/types/subscriber_list.h>

#include <memory>
#include <vector>

namespace sigraph {

/**
 * @brief Handle to one subscriber callback (or a group of them).
 *
 * Dropping the handle leaves the callback subscribed, call unsubscribe() to detach it. The handle only holds a weak
 * reference to the subscriber list, so unsubscribing after the source was destroyed is safe and does nothing.
 */
class SIGRAPH_EXPORT Subscription {
public:
    Subscription() = default;

    Subscription(std::weak_ptr<SubscriberListBase> list, SubscriptionId id);

    Subscription(Subscription &&other) noexcept;

    Subscription &operator=(Subscription &&other) noexcept;

    Subscription(const Subscription &) = delete;

    Subscription &operator=(const Subscription &) = delete;

    ~Subscription();

    /**
     * @brief A single handle that unsubscribes every part at once.
     */
    [[nodiscard]] static Subscription combine(std::vector<Subscription> parts);

    /**
     * @brief Detach the callback. Idempotent.
     */
    void unsubscribe();

    void operator()() { unsubscribe(); }

    /**
     * @brief True while at least one callback of this handle is still subscribed.
     */
    [[nodiscard]] bool active() const;

    [[nodiscard]] SubscriptionId id() const { return _id; }

private:
    std::weak_ptr<SubscriberListBase> _list;
    SubscriptionId _id{0};
    std::vector<Subscription> _children;
};

} // namespace sigraph
