#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "result.h"
#include "result_helper.hpp"
#include "logging.hpp"
#include "helper.hpp"
#include "basis_typeinfo.hpp"
#include "bilocator_def.hpp"
#include "lazy_cell.hpp"


namespace bilocator {

	class Registry
	{
		// NamedCells groups the cells registered under one type by name
		using NamedCells = std::map<Name, std::shared_ptr<ILazyCell>>;

		// cells grouped by registered type
		using CellMap = std::map<TypeId, NamedCells>;

		// CellMap
		//  -----------------------------------------------
		// |            |   NamedCells                     |
		// |  TypeId    |   [  Name       , LazyCell    ]  |
		// |------------------------------------------------
		// |  Foo       |   NamedCells of Foo              |
		// |            |   [ <unnamed>   , cell        ]  |
		// |            |   [ "left"      , cell2       ]  |
		//  -----------------------------------------------
		// |  Bar       |   NamedCells of Bar              |
		// |            |   [ "main"      , cell3       ]  |
		// -------------------------------------------------
		// A type has a bucket only while it has at least one entry.

	public:
		inline static constexpr const char* LOG_TAG = "Registry";

		Registry() noexcept = default;
		~Registry();

		Registry(const Registry&) = delete;
		Registry& operator=(const Registry&) = delete;

		// --------------------------------------------------------------
		// typed API
		// --------------------------------------------------------------

		// Registers a factory or an instance (exactly one) under (T, name).
		// InvalidArgument for both/neither, AlreadyExists when the key is taken.
		template<typename T>
		Result<void> registerService(typename LazyCell<T>::Factory factory,
		                             std::shared_ptr<T> instance,
		                             const Name& name = std::nullopt)
		{
			auto cell = LazyCell<T>::create(std::move(factory), std::move(instance));
			RETURN_IF_ERR(cell);
			return add(getTypeId<T>(), name, cell.value());
		}

		template<typename T>
		Result<void> registerLazy(typename LazyCell<T>::Factory factory, const Name& name = std::nullopt)
		{
			return registerService<T>(std::move(factory), nullptr, name);
		}

		template<typename T>
		Result<void> registerInstance(std::shared_ptr<T> instance, const Name& name = std::nullopt)
		{
			return registerService<T>(nullptr, std::move(instance), name);
		}

		// Registers an existing cell under (T, name), sharing it with its current owner.
		template<typename T>
		Result<void> registerCell(const std::shared_ptr<LazyCell<T>>& cell, const Name& name = std::nullopt)
		{
			return add(getTypeId<T>(), name, cell);
		}

		// Registers instance under its dynamic type rather than T. Used when the
		// caller only holds a base-class reference to the object.
		template<typename T>
		Result<void> registerByRuntimeType(std::shared_ptr<T> instance, const Name& name = std::nullopt)
		{
			if (!instance) {
				return Error(ResultCode::InvalidArgument,
					fmt::format("registerByRuntimeType<{}> needs an instance", getTypeId<T>().name()));
			}
			const TypeId runtime_type = getRuntimeTypeId(*instance);
			auto cell = LazyCell<T>::fromInstance(std::move(instance));
			RETURN_IF_ERR(cell);
			return add(runtime_type, name, cell.value());
		}

		template<typename T>
		Result<void> unregister(const Name& name = std::nullopt, bool dispose = true)
		{
			return unregisterByRuntimeType(getTypeId<T>(), name, dispose);
		}

		template<typename T>
		[[nodiscard]] Result<std::shared_ptr<T>> get(const Name& name = std::nullopt)
		{
			auto cell = find(getTypeId<T>(), name);
			RETURN_IF_ERR_AS(cell, std::shared_ptr<T>);
			return resolveAs<T>(cell.value());
		}

		// Selects the entry by filter over all names registered under T.
		template<typename T>
		[[nodiscard]] Result<std::shared_ptr<T>> get(const Filter& filter)
		{
			auto cell = find(getTypeId<T>(), filter);
			RETURN_IF_ERR_AS(cell, std::shared_ptr<T>);
			return resolveAs<T>(cell.value());
		}

		template<typename T>
		bool isRegistered(const Name& name = std::nullopt) const
		{
			return isRegisteredByRuntimeType(getTypeId<T>(), name);
		}

		// --------------------------------------------------------------
		// type-erased API
		// --------------------------------------------------------------

		// Inserts cell under (type, name). Never overwrites.
		Result<void> add(TypeId type, const Name& name, std::shared_ptr<ILazyCell> cell);

		// Removes the entry and hands its cell back without disposing it.
		// With expected set, the entry is removed only while it still holds
		// that cell; otherwise NotRegistered.
		Result<std::shared_ptr<ILazyCell>> remove(TypeId type, const Name& name,
		                                          const std::shared_ptr<ILazyCell>& expected = nullptr);

		Result<void> unregisterByRuntimeType(TypeId type, const Name& name = std::nullopt, bool dispose = true);

		bool isRegisteredByRuntimeType(TypeId type, const Name& name = std::nullopt) const;

		Result<std::shared_ptr<ILazyCell>> find(TypeId type, const Name& name) const;
		Result<std::shared_ptr<ILazyCell>> find(TypeId type, const Filter& filter) const;

		// names registered under type, empty when the type has no bucket
		std::vector<Name> names(TypeId type) const;

		size_t size() const;
		size_t typeCount() const;

		// Drops every entry, disposing the cells when dispose is set.
		void clear(bool dispose = true);

		// Diagnostic view: { type: { name: { resolved: bool, observable: bool } } }
		YAML::Node snapshot() const;

	private:
		template<typename T>
		static Result<std::shared_ptr<T>> resolveAs(const std::shared_ptr<ILazyCell>& cell)
		{
			// registered through the static type
			if (auto typed = std::dynamic_pointer_cast<LazyCell<T>>(cell)) {
				return typed->resolve();
			}
			// registered through the runtime type: the most-derived object is a T
			auto erased = cell->resolveErased();
			RETURN_IF_ERR_AS(erased, std::shared_ptr<T>);
			const auto& object = erased.value();
			return Result<std::shared_ptr<T>>::OK(std::shared_ptr<T>(object, static_cast<T*>(object.get())));
		}

		static std::string notRegisteredMessage(TypeId type, const Name& name);

	private:
		CellMap collection_;

		mutable std::mutex mutex_;
	}; // class Registry


}; // namespace bilocator
