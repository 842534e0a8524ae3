#include "registry.hpp"

namespace bilocator {


Registry::~Registry()
{
    std::lock_guard<std::mutex> lock(mutex_);
    collection_.clear();
}

std::string Registry::notRegisteredMessage(TypeId type, const Name& name)
{
    return fmt::format(
        "type {} with name {} is not registered. Possible causes:\n"
        " - the object was bound with Location::Tree, so it lives in the tree and not in the registry; "
        "resolve it from a tree position or promote it first\n"
        " - it was never registered, or was already unregistered",
        type.name(), describeName(name));
}

Result<void> Registry::add(TypeId type, const Name& name, std::shared_ptr<ILazyCell> cell)
{
    if (!cell) {
        return Error(ResultCode::InvalidArgument,
            fmt::format("tried to register an empty cell for type {} with name {}", type.name(), describeName(name)));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto bucket = collection_.find(type);
        if (bucket != collection_.end() && bucket->second.count(name)) {
            auto message = fmt::format(
                "type {} with name {} is already registered. Possible causes:\n"
                " - two objects of the same type need unique names\n"
                " - the binding that registered it was mounted twice; give its group an idempotency key",
                type.name(), describeName(name));
            LOGW("{}", message);
            return Error(ResultCode::AlreadyExists, message);
        }
        collection_[type].emplace(name, std::move(cell));
    }

    LOGD("registered {} {}", type.name(), describeName(name));
    return OK();
}

Result<std::shared_ptr<ILazyCell>> Registry::remove(TypeId type, const Name& name,
                                                    const std::shared_ptr<ILazyCell>& expected)
{
    using CellPtr = std::shared_ptr<ILazyCell>;
    CellPtr removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto bucket = collection_.find(type);
        if (bucket == collection_.end()) {
            return Result<CellPtr>::Error(ResultCode::NotRegistered, notRegisteredMessage(type, name));
        }
        auto& cells = bucket->second;
        auto it = cells.find(name);
        if (it == cells.end()) {
            return Result<CellPtr>::Error(ResultCode::NotRegistered, notRegisteredMessage(type, name));
        }
        if (expected && it->second != expected) {
            return Result<CellPtr>::Error(ResultCode::NotRegistered,
                fmt::format("{} {} was re-registered by another owner and is left in place",
                            type.name(), describeName(name)));
        }
        removed = std::move(it->second);
        cells.erase(it);

        if (cells.empty())
            collection_.erase(bucket);
    }

    LOGD("unregistered {} {}", type.name(), describeName(name));
    return Result<CellPtr>::OK(std::move(removed));
}

Result<void> Registry::unregisterByRuntimeType(TypeId type, const Name& name, bool dispose)
{
    auto removed = remove(type, name);
    if (!removed) {
        LOGW("unregister failed: {}", removed.c_str());
        return Error(removed.code(), removed.error());
    }
    // disposal runs outside the lock, it calls into user code
    if (dispose) {
        removed.value()->dispose();
    }
    return OK();
}

bool Registry::isRegisteredByRuntimeType(TypeId type, const Name& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto bucket = collection_.find(type);
    if (bucket == collection_.end())
        return false;
    return bucket->second.count(name) > 0;
}

Result<std::shared_ptr<ILazyCell>> Registry::find(TypeId type, const Name& name) const
{
    using CellPtr = std::shared_ptr<ILazyCell>;
    std::lock_guard<std::mutex> lock(mutex_);
    auto bucket = collection_.find(type);
    if (bucket != collection_.end()) {
        auto it = bucket->second.find(name);
        if (it != bucket->second.end())
            return Result<CellPtr>::OK(it->second);
    }
    return Result<CellPtr>::Error(ResultCode::NotRegistered, notRegisteredMessage(type, name));
}

Result<std::shared_ptr<ILazyCell>> Registry::find(TypeId type, const Filter& filter) const
{
    using CellPtr = std::shared_ptr<ILazyCell>;
    if (!filter) {
        return Result<CellPtr>::Error(ResultCode::InvalidArgument,
            fmt::format("empty filter passed to get<{}>", type.name()));
    }

    auto candidates = names(type);
    if (candidates.empty()) {
        return Result<CellPtr>::Error(ResultCode::NotRegistered,
            fmt::format("no object of type {} is registered, the filter had nothing to select from. "
                        "If it was bound with Location::Tree, resolve it from a tree position instead",
                        type.name()));
    }

    // the filter is user code and runs without the lock held
    const Name selected = filter(candidates);
    return find(type, selected);
}

std::vector<Name> Registry::names(TypeId type) const
{
    std::vector<Name> result;
    std::lock_guard<std::mutex> lock(mutex_);
    auto bucket = collection_.find(type);
    if (bucket == collection_.end())
        return result;
    result.reserve(bucket->second.size());
    for (const auto& [name, cell] : bucket->second) {
        result.push_back(name);
    }
    return result;
}

size_t Registry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [type, cells] : collection_) {
        count += cells.size();
    }
    return count;
}

size_t Registry::typeCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return collection_.size();
}

void Registry::clear(bool dispose)
{
    CellMap dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(collection_);
    }
    if (!dispose) return;

    for (auto& [type, cells] : dropped) {
        for (auto& [name, cell] : cells) {
            cell->dispose();
        }
    }
}

YAML::Node Registry::snapshot() const
{
    YAML::Node root(YAML::NodeType::Map);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [type, cells] : collection_) {
        YAML::Node bucket(YAML::NodeType::Map);
        for (const auto& [name, cell] : cells) {
            YAML::Node entry;
            entry["resolved"] = cell->isResolved();
            entry["observable"] = cell->notifier() != nullptr;
            bucket[name.has_value() ? *name : std::string("<unnamed>")] = entry;
        }
        root[type.name()] = bucket;
    }
    return root;
}

} // namespace bilocator
