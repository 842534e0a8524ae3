#pragma once

#include <memory>
#include <type_traits>

#include "result.h"
#include "result_helper.hpp"
#include "logging.hpp"
#include "change_notifier.hpp"
#include "lazy_cell.hpp"
#include "tree_position.hpp"
#include "tree_scope.hpp"

namespace bilocator {

	// Host-side adapter for one binding: creates the cell when its node
	// mounts and tears it down when the node unmounts.
	//
	// When the bound value is a ChangeNotifier, the owning node is also marked
	// for rebuild on every notification, from the moment the value exists
	// (at mount for an eager instance, once built for a factory) until the
	// binding is torn down.
	//
	// The factory hook points at the adapter, so it is neither copyable nor movable.
	template<typename T>
	class Bilocator
	{
	public:
		inline static constexpr const char* LOG_TAG = "Bilocator";

		Bilocator(TreeScope& scope, BindingSpec<T> spec) : scope_(scope), spec_(std::move(spec)) {}

		~Bilocator()
		{
			if (!isMounted()) return;
			auto result = unmount();
			LOG_IF_ERR(result);
		}

		Bilocator(const Bilocator&) = delete;
		Bilocator& operator=(const Bilocator&) = delete;

		// onMount: binds the declared object at node.
		Result<std::shared_ptr<LazyCell<T>>> mount(TreePosition& node)
		{
			using CellPtr = std::shared_ptr<LazyCell<T>>;
			if (isMounted()) {
				return Result<CellPtr>::Error(ResultCode::InvalidState,
					fmt::format("Bilocator<{}> is already mounted at {}", getTypeId<T>().name(), node_->describe()));
			}

			BindingSpec<T> spec = spec_;
			if (spec.factory) {
				auto user_hook = std::move(spec.on_init);
				spec.on_init = [this, user_hook](const std::shared_ptr<T>& instance) {
					if (user_hook) user_hook(instance);
					watch(instance);
				};
			}

			auto cell = scope_.bind<T>(node, std::move(spec));
			RETURN_IF_ERR_AS(cell, CellPtr);

			node_ = &node;
			cell_ = cell.value();
			if (spec_.instance) {
				watch(spec_.instance);
			}
			return cell;
		}

		// onUnmount: tears the binding down, which also stops the self rebuild.
		// A binding already torn down through TreeScope::onUnmount is left alone.
		Result<void> unmount()
		{
			if (!isMounted()) return OK();

			Result<void> result = OK();
			auto binding = ownBinding();
			if (binding && !binding->isTornDown()) {
				result = scope_.unbind<T>(*node_);
			}
			node_ = nullptr;
			cell_.reset();
			return result;
		}

		bool isMounted() const { return node_ != nullptr; }
		const std::shared_ptr<LazyCell<T>>& cell() const { return cell_; }

	private:
		// the binding this adapter created, null once it was unbound or replaced
		std::shared_ptr<TreeBinding> ownBinding() const
		{
			auto binding = scope_.bindingAt(*node_, getTypeId<T>());
			if (!binding || binding->cell() != cell_) return nullptr;
			return binding;
		}

		void watch(const std::shared_ptr<T>& instance)
		{
			if constexpr (std::is_base_of_v<ChangeNotifier, T>) {
				attachRebuild(std::static_pointer_cast<ChangeNotifier>(instance));
			} else if constexpr (std::is_polymorphic_v<T>) {
				attachRebuild(std::dynamic_pointer_cast<ChangeNotifier>(instance));
			}
		}

		void attachRebuild(const std::shared_ptr<ChangeNotifier>& notifier)
		{
			if (!notifier || !node_) return;
			auto binding = ownBinding();
			if (!binding) return;
			auto added = binding->rebuildOwnerOnChange(notifier);
			LOG_IF_ERR(added);
		}

	private:
		TreeScope& scope_;
		BindingSpec<T> spec_;

		TreePosition* node_ = nullptr;
		std::shared_ptr<LazyCell<T>> cell_;
	}; // class Bilocator

}; // namespace bilocator
