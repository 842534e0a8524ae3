#include "basis_typeinfo.hpp"
#include "helper.hpp"

#include <memory>
#include <mutex>
#include <unordered_map>

namespace bilocator {

TypeInfo::TypeInfo(const std::type_info& info)
    : info_(&info), name_(demangle(info.name()))
{
}

TypeId getTypeId(const std::type_info& info)
{
    // type_info objects of the same type may differ in address across shared
    // objects, type_index compares them by value.
    static std::mutex mutex;
    static std::unordered_map<std::type_index, std::unique_ptr<TypeInfo>> interned;

    std::lock_guard<std::mutex> lock(mutex);
    auto [it, inserted] = interned.try_emplace(std::type_index(info));
    if (inserted) {
        it->second = std::make_unique<TypeInfo>(info);
    }
    return TypeId{ it->second.get() };
}

} // namespace bilocator
