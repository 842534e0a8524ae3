#pragma once

#include <memory>
#include <type_traits>

#include "result.h"
#include "result_helper.hpp"
#include "bilocator_def.hpp"
#include "change_notifier.hpp"
#include "locator.hpp"
#include "subscription_manager.hpp"
#include "tree_position.hpp"

namespace bilocator {

	// Consumer-side helper: resolves objects from the registry or the tree and
	// keeps the listeners it attached in a SubscriptionManager.
	//
	// The owner calls cancelSubscriptions() when it goes away.
	class Observer
	{
	public:
		inline static constexpr const char* LOG_TAG = "Observer";

		explicit Observer(Locator& locator) : locator_(locator) {}

		Observer(const Observer&) = delete;
		Observer& operator=(const Observer&) = delete;

		template<typename T>
		[[nodiscard]] Result<std::shared_ptr<T>> get(const Name& name = std::nullopt)
		{
			return locator_.registry().get<T>(name);
		}

		template<typename T>
		[[nodiscard]] Result<std::shared_ptr<T>> get(const Filter& filter)
		{
			return locator_.registry().get<T>(filter);
		}

		template<typename T>
		[[nodiscard]] Result<std::shared_ptr<T>> get(const TreePosition& from)
		{
			return locator_.scope().resolveNonReactive<T>(from);
		}

		// Resolves T from the registry and attaches listener to it.
		template<typename T>
		Result<std::shared_ptr<T>> listenTo(const Listener& listener, const Name& name = std::nullopt)
		{
			static_assert(std::is_base_of_v<ChangeNotifier, T>, "listenTo needs a ChangeNotifier type");
			return subscribeTo<T>(listener, locator_.registry().get<T>(name));
		}

		template<typename T>
		Result<std::shared_ptr<T>> listenTo(const Listener& listener, const Filter& filter)
		{
			static_assert(std::is_base_of_v<ChangeNotifier, T>, "listenTo needs a ChangeNotifier type");
			return subscribeTo<T>(listener, locator_.registry().get<T>(filter));
		}

		// Resolves the nearest tree binding of T above from and attaches listener to it.
		template<typename T>
		Result<std::shared_ptr<T>> listenTo(const Listener& listener, const TreePosition& from)
		{
			static_assert(std::is_base_of_v<ChangeNotifier, T>, "listenTo needs a ChangeNotifier type");
			return subscribeTo<T>(listener, locator_.scope().resolveNonReactive<T>(from));
		}

		// Attaches listener to a notifier the caller already holds.
		template<typename T>
		Result<std::shared_ptr<T>> listenTo(const Listener& listener, const std::shared_ptr<T>& notifier)
		{
			static_assert(std::is_base_of_v<ChangeNotifier, T>, "listenTo needs a ChangeNotifier type");
			if (!notifier) {
				return Result<std::shared_ptr<T>>::Error(ResultCode::InvalidArgument, "listenTo called without a notifier");
			}
			return subscribeTo<T>(listener, Result<std::shared_ptr<T>>::OK(notifier));
		}

		// Publishes the nearest tree binding of T above from in the registry.
		template<typename T>
		Result<void> promote(const TreePosition& from, const Name& name = std::nullopt)
		{
			return locator_.scope().promote<T>(from, name);
		}

		template<typename T>
		Result<void> demote(const TreePosition& from)
		{
			return locator_.scope().demote<T>(from);
		}

		void cancelSubscriptions() { subscriptions_.unsubscribeAll(); }

		const SubscriptionManager& subscriptions() const { return subscriptions_; }

	private:
		template<typename T>
		Result<std::shared_ptr<T>> subscribeTo(const Listener& listener, Result<std::shared_ptr<T>> resolved)
		{
			RETURN_IF_ERR_AS(resolved, std::shared_ptr<T>);
			auto subscribed = subscriptions_.subscribe(resolved.value(), listener);
			if (!subscribed) {
				LOG_IF_ERR(subscribed);
				return Result<std::shared_ptr<T>>::Error(subscribed.code(), subscribed.error());
			}
			return resolved;
		}

	private:
		Locator& locator_;
		SubscriptionManager subscriptions_;
	}; // class Observer

}; // namespace bilocator
