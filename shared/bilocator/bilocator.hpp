#pragma once

#include "bilocator_def.hpp"
#include "change_notifier.hpp"
#include "lazy_cell.hpp"
#include "registry.hpp"
#include "tree_position.hpp"
#include "tree_scope.hpp"
#include "subscription_manager.hpp"
#include "bilocator_binding.hpp"
#include "binding_group.hpp"
#include "observer.hpp"
#include "locator.hpp"

namespace bilocator {

template <typename T>
inline Result<std::shared_ptr<T>> get(const Name& name = std::nullopt)
{
    return LocatorBuild().registry().get<T>(name);
}

template <typename T>
inline Result<std::shared_ptr<T>> get(const Filter& filter)
{
    return LocatorBuild().registry().get<T>(filter);
}

template <typename T>
inline bool isRegistered(const Name& name = std::nullopt)
{
    return LocatorBuild().registry().isRegistered<T>(name);
}

} // namespace bilocator
