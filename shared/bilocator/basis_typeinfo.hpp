#pragma once
#include <functional>
#include <string>
#include <typeindex>
#include <typeinfo>

namespace bilocator
{

	// One TypeInfo exists per distinct type for the lifetime of the process,
	// so TypeId can compare by address.
	// Similar to std::type_index, but also carrying the demangled name used in diagnostics.
	struct alignas(void*) TypeInfo {

		explicit TypeInfo(const std::type_info& info);

		const std::string& name() const { return name_; };

		std::type_index index() const { return std::type_index(*info_); };

	private:
		const std::type_info* info_;
		std::string name_;
	};

	struct TypeId {
		const TypeInfo* type_info;

		explicit operator std::string() const { return type_info->name(); };
		const std::string& name() const { return type_info->name(); };

		bool operator==(TypeId x) const { return type_info == x.type_info; };
		bool operator!=(TypeId x) const { return type_info != x.type_info; };
		bool operator<(TypeId x) const { return std::less<const TypeInfo*>()(type_info, x.type_info); };
	};

	// Interns the TypeInfo of a std::type_info. Static and runtime lookups of
	// the same type always produce the same TypeId.
	TypeId getTypeId(const std::type_info& info);

	template <typename T>
	inline TypeId getTypeId() {
		static const TypeId id = getTypeId(typeid(T));
		return id;
	};

	// Dynamic type of the referenced object (static type for non-polymorphic T).
	template <typename T>
	inline TypeId getRuntimeTypeId(const T& value) {
		return getTypeId(typeid(value));
	};


}; // namespace bilocator
