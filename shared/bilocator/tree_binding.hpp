#pragma once

#include <memory>
#include <vector>

#include "result.h"
#include "basis_typeinfo.hpp"
#include "bilocator_def.hpp"
#include "change_notifier.hpp"
#include "lazy_cell.hpp"
#include "tree_position.hpp"

namespace bilocator {

	// What a node published: one LazyCell of one type, its placement, and the
	// positions that depend on it reactively.
	//
	//   Bound(location) <-> Promoted
	//        \               /
	//         +-> TornDown <-+        (terminal, reached once)
	class TreeBinding
	{
	public:
		inline static constexpr const char* LOG_TAG = "TreeBinding";

		enum class State { Bound, Promoted, TornDown };

		TreeBinding(TreePosition& owner, TypeId type, std::shared_ptr<ILazyCell> cell,
		            Location location, Name name, bool dispose);
		~TreeBinding();

		TreeBinding(const TreeBinding&) = delete;
		TreeBinding& operator=(const TreeBinding&) = delete;

		TreePosition& owner() const { return *owner_; }
		TypeId type() const { return type_; }
		const std::shared_ptr<ILazyCell>& cell() const { return cell_; }
		Location location() const { return location_; }
		const Name& name() const { return name_; }
		bool disposeOnTeardown() const { return dispose_; }
		State state() const { return state_; }

		bool isPromoted() const { return state_ == State::Promoted; }
		bool isTornDown() const { return state_ == State::TornDown; }

		// descendants find only tree-located, live bindings
		bool isTreeVisible() const { return location_ == Location::Tree && state_ != State::TornDown; }

		// registry key this binding occupies, if any
		bool holdsRegistryEntry() const { return location_ == Location::Registry || state_ == State::Promoted; }
		const Name& registryName() const { return location_ == Location::Registry ? name_ : promoted_name_; }

		void markPromoted(Name registry_name);
		void markDemoted();
		void markTornDown();

		// Registers position as depending on the bound value. The first
		// dependent attaches one listener to notifier; each change then marks
		// every dependent for rebuild. Adding a known position is a no-op.
		Result<void> addDependent(TreePosition& position, const std::shared_ptr<ChangeNotifier>& notifier);
		void removeDependent(const TreePosition& position);
		bool hasDependent(const TreePosition& position) const;
		size_t dependentCount() const { return dependents_.size(); }

		// Marks the owner for rebuild on every change of notifier, until the
		// binding is torn down. Only one notifier is watched; later calls are no-ops.
		Result<void> rebuildOwnerOnChange(const std::shared_ptr<ChangeNotifier>& notifier);
		bool rebuildsOwner() const { return owner_listener_ != nullptr; }

	private:
		void notifyDependents();
		void detachDependentsListener();
		void detachOwnerListener();

		TreePosition* owner_;
		TypeId type_;
		std::shared_ptr<ILazyCell> cell_;
		Location location_;
		Name name_;
		bool dispose_;
		State state_ = State::Bound;
		Name promoted_name_;

		std::vector<TreePosition*> dependents_;
		Listener dependents_listener_;
		std::weak_ptr<ChangeNotifier> observed_;

		Listener owner_listener_;
		std::weak_ptr<ChangeNotifier> owner_observed_;
	}; // class TreeBinding

}; // namespace bilocator
