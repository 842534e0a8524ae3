#include "tree_scope.hpp"

#include <vector>

namespace bilocator {


TreeScope::~TreeScope()
{
    // bindings detach their listeners on destruction, nothing is disposed here
    nodes_.clear();
}

std::string TreeScope::notFoundMessage(const TreePosition& from, TypeId type) const
{
    auto message = fmt::format(
        "no tree binding of {} found at or above {}. Possible causes:\n"
        " - the binding is not an ancestor of this position\n"
        " - the binding node was already unmounted",
        type.name(), from.describe());

    const auto registered = registry_.names(type);
    if (!registered.empty()) {
        message += fmt::format(
            "\n - the registry holds {} entr{} of {}: it was bound with Location::Registry, "
            "so get it from the registry instead",
            registered.size(), registered.size() == 1 ? "y" : "ies", type.name());
    }
    return message;
}

Result<void> TreeScope::attach(TreePosition& node, TypeId type, std::shared_ptr<ILazyCell> cell,
                               Location location, const Name& name, bool dispose)
{
    if (!cell) {
        return Error(ResultCode::InvalidArgument,
            fmt::format("tried to bind an empty cell of {} at {}", type.name(), node.describe()));
    }

    if (bindingAt(node, type)) {
        auto message = fmt::format("{} already binds {}; a node holds one binding per type",
                                   node.describe(), type.name());
        LOGW("{}", message);
        return Error(ResultCode::AlreadyExists, message);
    }

    if (location == Location::Registry) {
        auto added = registry_.add(type, name, cell);
        RETURN_IF_ERR(added);
    }

    nodes_[&node].emplace(type,
        std::make_shared<TreeBinding>(node, type, std::move(cell), location, name, dispose));

    LOGD("bound {} at {} ({})", type.name(), node.describe(), to_string(location));
    return OK();
}

std::shared_ptr<TreeBinding> TreeScope::bindingAt(const TreePosition& node, TypeId type) const
{
    auto it = nodes_.find(&node);
    if (it == nodes_.end())
        return nullptr;
    auto binding = it->second.find(type);
    if (binding == it->second.end())
        return nullptr;
    return binding->second;
}

std::shared_ptr<TreeBinding> TreeScope::findBinding(const TreePosition& from, TypeId type) const
{
    for (const TreePosition* position = &from; position != nullptr; position = position->parentPosition()) {
        auto binding = bindingAt(*position, type);
        if (binding && binding->isTreeVisible())
            return binding;
    }
    return nullptr;
}

Result<void> TreeScope::promote(const TreePosition& from, TypeId type, const Name& name)
{
    auto binding = findBinding(from, type);
    if (!binding) {
        return Error(ResultCode::NotFound, notFoundMessage(from, type));
    }
    if (binding->isPromoted()) {
        auto message = fmt::format("{} bound at {} is already promoted under {}",
                                   type.name(), binding->owner().describe(), describeName(binding->registryName()));
        LOGW("{}", message);
        return Error(ResultCode::AlreadyExists, message);
    }

    // promotion publishes a built instance
    auto resolved = binding->cell()->resolveErased();
    RETURN_IF_ERR(resolved);

    auto added = registry_.add(type, name, binding->cell());
    RETURN_IF_ERR(added);

    binding->markPromoted(name);
    LOGD("promoted {} bound at {} as {}", type.name(), binding->owner().describe(), describeName(name));
    return OK();
}

Result<void> TreeScope::demote(const TreePosition& from, TypeId type)
{
    auto binding = findBinding(from, type);
    if (!binding) {
        return Error(ResultCode::NotFound, notFoundMessage(from, type));
    }
    if (!binding->isPromoted()) {
        return Error(ResultCode::NotRegistered,
            fmt::format("{} bound at {} is not promoted, there is no registry entry to remove",
                        type.name(), binding->owner().describe()));
    }

    const Name registry_name = binding->registryName();
    binding->markDemoted();

    auto removed = registry_.remove(type, registry_name, binding->cell());
    RETURN_IF_ERR(removed);

    LOGD("demoted {} bound at {}", type.name(), binding->owner().describe());
    return OK();
}

Result<void> TreeScope::teardown(TreeBinding& binding)
{
    Result<void> result = OK();

    if (binding.holdsRegistryEntry()) {
        // disposal belongs to the binding below, not to the registry;
        // an entry re-registered by another owner is left in place
        auto removed = registry_.remove(binding.type(), binding.registryName(), binding.cell());
        if (!removed) {
            LOGW("teardown of {} at {}: {}", binding.type().name(), binding.owner().describe(), removed.c_str());
            result = Error(removed.code(), removed.error());
        }
    }

    binding.markTornDown();

    if (binding.disposeOnTeardown()) {
        binding.cell()->dispose();
    }

    LOGD("tore down {} at {}", binding.type().name(), binding.owner().describe());
    return result;
}

Result<void> TreeScope::unbind(TreePosition& node, TypeId type)
{
    auto it = nodes_.find(&node);
    if (it == nodes_.end() || !it->second.count(type)) {
        return Error(ResultCode::NotFound,
            fmt::format("{} does not bind {}", node.describe(), type.name()));
    }

    auto binding = it->second[type];
    it->second.erase(type);
    if (it->second.empty())
        nodes_.erase(it);

    return teardown(*binding);
}

Result<void> TreeScope::onUnmount(TreePosition& node)
{
    Result<void> result = OK();

    auto it = nodes_.find(&node);
    if (it != nodes_.end()) {
        NodeBindings bindings = std::move(it->second);
        nodes_.erase(it);

        for (auto& [type, binding] : bindings) {
            auto torn = teardown(*binding);
            if (!torn && result)
                result = torn;
        }
    }

    forgetDependent(node);
    return result;
}

void TreeScope::forgetDependent(const TreePosition& position)
{
    for (auto& [node, bindings] : nodes_) {
        for (auto& [type, binding] : bindings) {
            binding->removeDependent(position);
        }
    }
}

size_t TreeScope::bindingCount() const
{
    size_t count = 0;
    for (const auto& [node, bindings] : nodes_) {
        count += bindings.size();
    }
    return count;
}

void TreeScope::clear()
{
    std::map<const TreePosition*, NodeBindings> dropped;
    dropped.swap(nodes_);

    for (auto& [node, bindings] : dropped) {
        for (auto& [type, binding] : bindings) {
            auto torn = teardown(*binding);
            LOG_IF_ERR(torn);
        }
    }
}

}; // namespace bilocator
