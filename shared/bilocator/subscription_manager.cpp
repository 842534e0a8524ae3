#include "subscription_manager.hpp"

#include <algorithm>

#include "result_helper.hpp"
#include "logging.hpp"

namespace bilocator {

Result<void> SubscriptionManager::subscribe(const std::shared_ptr<ChangeNotifier>& notifier, const Listener& listener)
{
    if (!notifier) {
        return Error(ResultCode::InvalidArgument, "subscribe called without a notifier");
    }
    if (isSubscribed(notifier, listener)) {
        return DuplicateIgnored("listener is already subscribed to this notifier");
    }

    auto added = notifier->addListener(listener);
    RETURN_IF_ERR(added);

    subscriptions_.push_back(Subscription{notifier, listener});
    LOGT("subscribed, {} subscription(s)", subscriptions_.size());
    return OK();
}

void SubscriptionManager::unsubscribeAll()
{
    if (subscriptions_.empty()) return;

    auto released = std::move(subscriptions_);
    subscriptions_.clear();
    for (auto& subscription : released) {
        subscription.notifier->removeListener(subscription.listener);
    }
    LOGT("released {} subscription(s)", released.size());
}

bool SubscriptionManager::isSubscribed(const std::shared_ptr<ChangeNotifier>& notifier, const Listener& listener) const
{
    const Subscription probe{notifier, listener};
    return std::find(subscriptions_.begin(), subscriptions_.end(), probe) != subscriptions_.end();
}

}; // namespace bilocator
