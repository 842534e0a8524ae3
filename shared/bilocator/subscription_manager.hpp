#pragma once

#include <memory>
#include <vector>

#include "result.h"
#include "change_notifier.hpp"

namespace bilocator {

	// One listener attached to one notifier. Equal when both are the same objects.
	struct Subscription
	{
		std::shared_ptr<ChangeNotifier> notifier;
		Listener listener;

		bool operator==(const Subscription& other) const
		{
			return notifier == other.notifier && listener == other.listener;
		}
		bool operator!=(const Subscription& other) const { return !(*this == other); }
	};


	// Tracks the subscriptions of one observing object. The owner releases
	// them explicitly with unsubscribeAll(); destruction does not.
	class SubscriptionManager
	{
	public:
		inline static constexpr const char* LOG_TAG = "SubscriptionManager";

		SubscriptionManager() = default;

		SubscriptionManager(const SubscriptionManager&) = delete;
		SubscriptionManager& operator=(const SubscriptionManager&) = delete;

		// Attaches listener to notifier unless the pair is already tracked, in
		// which case DuplicateIgnored is returned and nothing changes.
		Result<void> subscribe(const std::shared_ptr<ChangeNotifier>& notifier, const Listener& listener);

		// Detaches every tracked listener. Safe to call repeatedly.
		void unsubscribeAll();

		bool isSubscribed(const std::shared_ptr<ChangeNotifier>& notifier, const Listener& listener) const;
		size_t size() const { return subscriptions_.size(); }
		bool empty() const { return subscriptions_.empty(); }

	private:
		std::vector<Subscription> subscriptions_;
	}; // class SubscriptionManager

}; // namespace bilocator
