#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "result.h"
#include "result_helper.hpp"
#include "basis_typeinfo.hpp"
#include "bilocator_def.hpp"
#include "lazy_cell.hpp"
#include "registry.hpp"

namespace bilocator {

	// One entry of a binding group: (type, name, factory | instance, dispose).
	class IBindingDelegate
	{
	public:
		virtual ~IBindingDelegate() = default;

		virtual TypeId type() const = 0;
		virtual const Name& name() const = 0;
		virtual bool dispose() const = 0;

		// A fresh cell for one mount. InvalidArgument for a malformed entry.
		virtual Result<std::shared_ptr<ILazyCell>> makeCell() const = 0;
	}; // interface IBindingDelegate


	template<typename T>
	class BindingDelegate final : public IBindingDelegate
	{
	public:
		BindingDelegate(typename LazyCell<T>::Factory factory, std::shared_ptr<T> instance,
		                Name name, bool dispose) :
			factory_(std::move(factory)),
			instance_(std::move(instance)),
			name_(std::move(name)),
			dispose_(dispose)
		{
		}

		TypeId type() const override { return getTypeId<T>(); }
		const Name& name() const override { return name_; }
		bool dispose() const override { return dispose_; }

		Result<std::shared_ptr<ILazyCell>> makeCell() const override
		{
			using CellPtr = std::shared_ptr<ILazyCell>;
			auto cell = LazyCell<T>::create(factory_, instance_);
			RETURN_IF_ERR_AS(cell, CellPtr);
			return Result<CellPtr>::OK(cell.value());
		}

	private:
		typename LazyCell<T>::Factory factory_;
		std::shared_ptr<T> instance_;
		Name name_;
		bool dispose_;
	}; // class BindingDelegate

	template<typename T>
	std::shared_ptr<IBindingDelegate> lazyDelegate(typename LazyCell<T>::Factory factory,
	                                               const Name& name = std::nullopt, bool dispose = true)
	{
		return std::make_shared<BindingDelegate<T>>(std::move(factory), nullptr, name, dispose);
	}

	template<typename T>
	std::shared_ptr<IBindingDelegate> instanceDelegate(std::shared_ptr<T> instance,
	                                                   const Name& name = std::nullopt, bool dispose = true)
	{
		return std::make_shared<BindingDelegate<T>>(nullptr, std::move(instance), name, dispose);
	}


	// Idempotency keys of the groups currently holding their registrations.
	class GroupKeys
	{
	public:
		bool contains(const std::string& key) const { return keys_.count(key) > 0; }
		bool insert(const std::string& key) { return keys_.insert(key).second; }
		void erase(const std::string& key) { keys_.erase(key); }
		size_t size() const { return keys_.size(); }
		void clear() { keys_.clear(); }

	private:
		std::set<std::string> keys_;
	}; // class GroupKeys


	// Registers a set of delegates as a unit when its node mounts and
	// unregisters them when it unmounts.
	//
	// mount() is all or nothing: a failing entry rolls back the entries
	// registered before it. A group mounted under a key that another mount
	// already processed registers nothing and reports DuplicateIgnored; only
	// the group that performed the registration undoes it and frees the key.
	class BindingGroup
	{
	public:
		inline static constexpr const char* LOG_TAG = "BindingGroup";

		BindingGroup(Registry& registry, GroupKeys& keys,
		             std::vector<std::shared_ptr<IBindingDelegate>> delegates,
		             std::optional<std::string> key = std::nullopt);
		~BindingGroup();

		BindingGroup(const BindingGroup&) = delete;
		BindingGroup& operator=(const BindingGroup&) = delete;

		Result<void> mount();

		// Unregisters the entries this group registered, disposing those whose
		// delegate asks for it. Returns the first failure after attempting all.
		Result<void> unmount();

		bool isMounted() const { return mounted_; }
		bool ownsRegistration() const { return owns_; }
		const std::optional<std::string>& key() const { return key_; }
		size_t size() const { return delegates_.size(); }

	private:
		void rollback(size_t registered);

	private:
		Registry& registry_;
		GroupKeys& keys_;
		std::vector<std::shared_ptr<IBindingDelegate>> delegates_;
		std::optional<std::string> key_;

		bool mounted_ = false;
		bool owns_ = false;
	}; // class BindingGroup

}; // namespace bilocator
