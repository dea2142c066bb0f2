#include <sigraph/types/subscription.h>

#include <algorithm>
#include <utility>

namespace sigraph {

Subscription::Subscription(std::weak_ptr<SubscriberListBase> list, SubscriptionId id)
    : _list{std::move(list)}, _id{id} {}

Subscription::Subscription(Subscription &&other) noexcept
    : _list{std::move(other._list)}, _id{std::exchange(other._id, 0)}, _children{std::move(other._children)} {}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
    if (this != &other) {
        _list = std::move(other._list);
        _id = std::exchange(other._id, 0);
        _children = std::move(other._children);
    }
    return *this;
}

Subscription::~Subscription() = default;

Subscription Subscription::combine(std::vector<Subscription> parts) {
    Subscription result;
    result._children = std::move(parts);
    return result;
}

void Subscription::unsubscribe() {
    if (auto list = _list.lock()) { list->remove(_id); }
    _list.reset();
    for (auto &child : _children) { child.unsubscribe(); }
    _children.clear();
}

bool Subscription::active() const {
    if (auto list = _list.lock(); list && list->contains(_id)) { return true; }
    return std::any_of(_children.begin(), _children.end(), [](const Subscription &child) { return child.active(); });
}

} // namespace sigraph
