#include "binding_group.hpp"

#include "logging.hpp"
#include "helper.hpp"

namespace bilocator {

BindingGroup::BindingGroup(Registry& registry, GroupKeys& keys,
                           std::vector<std::shared_ptr<IBindingDelegate>> delegates,
                           std::optional<std::string> key) :
    registry_(registry),
    keys_(keys),
    delegates_(std::move(delegates)),
    key_(std::move(key))
{
}

BindingGroup::~BindingGroup()
{
    if (!mounted_) return;
    auto result = unmount();
    LOG_IF_ERR(result);
}

Result<void> BindingGroup::mount()
{
    if (mounted_) {
        return Error(ResultCode::InvalidState, "binding group is already mounted");
    }

    if (key_ && keys_.contains(*key_)) {
        mounted_ = true;
        LOGD("group key '{}' already processed, skipping registration", *key_);
        return DuplicateIgnored(fmt::format("group key '{}' was already processed", *key_));
    }

    // build every cell before touching the registry
    std::vector<std::shared_ptr<ILazyCell>> cells;
    cells.reserve(delegates_.size());
    for (const auto& delegate : delegates_) {
        if (!delegate) {
            return Error(ResultCode::InvalidArgument, "binding group holds an empty delegate");
        }
        auto cell = delegate->makeCell();
        RETURN_IF_ERR(cell);
        cells.push_back(cell.value());
    }

    for (size_t i = 0; i < delegates_.size(); ++i) {
        auto added = registry_.add(delegates_[i]->type(), delegates_[i]->name(), cells[i]);
        if (!added) {
            rollback(i);
            return added;
        }
    }

    if (key_) keys_.insert(*key_);
    mounted_ = true;
    owns_ = true;
    LOGD("mounted group of {} binding(s){}", delegates_.size(),
         key_ ? fmt::format(" under key '{}'", *key_) : std::string());
    return OK();
}

void BindingGroup::rollback(size_t registered)
{
    for (size_t i = 0; i < registered; ++i) {
        auto removed = registry_.remove(delegates_[i]->type(), delegates_[i]->name());
        LOG_IF_ERR(removed);
    }
}

Result<void> BindingGroup::unmount()
{
    if (!mounted_) return OK();

    Result<void> result = OK();
    if (owns_) {
        for (const auto& delegate : delegates_) {
            auto removed = registry_.unregisterByRuntimeType(delegate->type(), delegate->name(), delegate->dispose());
            if (!removed && result)
                result = removed;
        }
        if (key_) keys_.erase(*key_);
    }

    mounted_ = false;
    owns_ = false;
    return result;
}

}; // namespace bilocator
