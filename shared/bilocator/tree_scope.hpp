#pragma once

#include <map>
#include <memory>
#include <string>

#include "result.h"
#include "result_helper.hpp"
#include "logging.hpp"
#include "helper.hpp"
#include "basis_typeinfo.hpp"
#include "bilocator_def.hpp"
#include "lazy_cell.hpp"
#include "registry.hpp"
#include "tree_binding.hpp"
#include "tree_position.hpp"

namespace bilocator {

	// What a node declares when it mounts: how to obtain the object, where to
	// publish it and whether to dispose it on unmount.
	template<typename T>
	struct BindingSpec
	{
		typename LazyCell<T>::Factory factory;
		std::shared_ptr<T> instance;
		Name name;                              // registry name, used with Location::Registry
		Location location = Location::Registry;
		bool dispose = true;
		typename LazyCell<T>::InitHook on_init;
	};


	// Tree-scoped bindings keyed by the host's positions.
	//
	// A node holds at most one binding per type. Descendants resolve a binding
	// by walking from their own position toward the root; the first
	// tree-located binding of the requested type wins. Registry-located
	// bindings are only reachable through the Registry.
	class TreeScope
	{
		using NodeBindings = std::map<TypeId, std::shared_ptr<TreeBinding>>;

	public:
		inline static constexpr const char* LOG_TAG = "TreeScope";

		explicit TreeScope(Registry& registry) : registry_(registry) {}
		~TreeScope();

		TreeScope(const TreeScope&) = delete;
		TreeScope& operator=(const TreeScope&) = delete;

		// Creates the cell for spec and attaches it at node. With
		// Location::Registry the cell is also registered under (T, spec.name).
		template<typename T>
		Result<std::shared_ptr<LazyCell<T>>> bind(TreePosition& node, BindingSpec<T> spec)
		{
			using CellPtr = std::shared_ptr<LazyCell<T>>;
			auto cell = LazyCell<T>::create(std::move(spec.factory), std::move(spec.instance), std::move(spec.on_init));
			RETURN_IF_ERR_AS(cell, CellPtr);
			auto attached = attach(node, getTypeId<T>(), cell.value(), spec.location, spec.name, spec.dispose);
			RETURN_IF_ERR_AS(attached, CellPtr);
			return cell;
		}

		// Resolves the nearest binding of T at or above from, without
		// recording a dependency.
		template<typename T>
		[[nodiscard]] Result<std::shared_ptr<T>> resolveNonReactive(const TreePosition& from)
		{
			auto cell = findCell<T>(from);
			RETURN_IF_ERR_AS(cell, std::shared_ptr<T>);
			return cell.value()->resolve();
		}

		// Like resolveNonReactive, and records from as a dependent: from is
		// marked for rebuild whenever the bound value notifies. The value must
		// be a ChangeNotifier (checked on the nearest match only).
		template<typename T>
		[[nodiscard]] Result<std::shared_ptr<T>> resolveReactive(TreePosition& from)
		{
			using Ptr = std::shared_ptr<T>;
			auto binding = findBinding(from, getTypeId<T>());
			if (!binding) {
				return Result<Ptr>::Error(ResultCode::NotFound, notFoundMessage(from, getTypeId<T>()));
			}
			auto cell = castCell<T>(*binding);
			RETURN_IF_ERR_AS(cell, Ptr);

			auto value = cell.value()->resolve();
			RETURN_IF_ERR_AS(value, Ptr);

			auto notifier = binding->cell()->notifier();
			if (!notifier) {
				auto message = fmt::format(
					"{} bound at {} is not observable; reactive lookup needs a ChangeNotifier. "
					"Use resolveNonReactive for plain values",
					getTypeId<T>().name(), binding->owner().describe());
				LOGW("{}", message);
				return Result<Ptr>::Error(ResultCode::NotObservable, message);
			}
			auto added = binding->addDependent(from, notifier);
			RETURN_IF_ERR_AS(added, Ptr);
			return value;
		}

		template<typename T>
		Result<void> promote(const TreePosition& from, const Name& name = std::nullopt)
		{
			return promote(from, getTypeId<T>(), name);
		}

		template<typename T>
		Result<void> demote(const TreePosition& from)
		{
			return demote(from, getTypeId<T>());
		}

		template<typename T>
		Result<void> unbind(TreePosition& node)
		{
			return unbind(node, getTypeId<T>());
		}

		template<typename T>
		bool isBound(const TreePosition& node) const
		{
			return bindingAt(node, getTypeId<T>()) != nullptr;
		}

		// ------------------------------------------------------------------
		// type-erased API
		// ------------------------------------------------------------------

		// Attaches cell at node. AlreadyExists when node already binds type,
		// or when the registry key is taken for Location::Registry.
		Result<void> attach(TreePosition& node, TypeId type, std::shared_ptr<ILazyCell> cell,
		                    Location location, const Name& name, bool dispose);

		// The walk primitive: nearest tree-visible binding of type, starting
		// at from itself. nullptr at the root.
		std::shared_ptr<TreeBinding> findBinding(const TreePosition& from, TypeId type) const;

		std::shared_ptr<TreeBinding> bindingAt(const TreePosition& node, TypeId type) const;

		// Resolves the nearest binding first, then registers its cell under
		// (type, name). The binding keeps the name for demote and teardown.
		Result<void> promote(const TreePosition& from, TypeId type, const Name& name = std::nullopt);

		// Removes the registry entry added by promote; the instance stays alive.
		Result<void> demote(const TreePosition& from, TypeId type);

		// Tears down the binding of type at node:
		// the registry entry goes first (no disposal there), then the cell is
		// disposed if the binding asked for it.
		Result<void> unbind(TreePosition& node, TypeId type);

		// Host callback: node left the tree. Tears down every binding at node
		// and forgets node as a dependent. Returns the first failure, after
		// attempting all teardowns.
		Result<void> onUnmount(TreePosition& node);

		size_t bindingCount() const;

		// Tears down every binding.
		void clear();

	private:
		template<typename T>
		static Result<std::shared_ptr<LazyCell<T>>> castCell(const TreeBinding& binding)
		{
			using CellPtr = std::shared_ptr<LazyCell<T>>;
			auto typed = std::dynamic_pointer_cast<LazyCell<T>>(binding.cell());
			if (!typed) {
				return Result<CellPtr>::Error(ResultCode::InternalError,
					fmt::format("binding of {} at {} holds a cell of {}",
					            binding.type().name(), binding.owner().describe(), binding.cell()->valueType().name()));
			}
			return Result<CellPtr>::OK(std::move(typed));
		}

		template<typename T>
		Result<std::shared_ptr<LazyCell<T>>> findCell(const TreePosition& from) const
		{
			using CellPtr = std::shared_ptr<LazyCell<T>>;
			auto binding = findBinding(from, getTypeId<T>());
			if (!binding) {
				return Result<CellPtr>::Error(ResultCode::NotFound, notFoundMessage(from, getTypeId<T>()));
			}
			return castCell<T>(*binding);
		}

		std::string notFoundMessage(const TreePosition& from, TypeId type) const;

		Result<void> teardown(TreeBinding& binding);

		void forgetDependent(const TreePosition& position);

	private:
		Registry& registry_;
		std::map<const TreePosition*, NodeBindings> nodes_;
	}; // class TreeScope

}; // namespace bilocator
