#include "tree_binding.hpp"

#include <algorithm>

#include "logging.hpp"

namespace bilocator {


TreeBinding::TreeBinding(TreePosition& owner, TypeId type, std::shared_ptr<ILazyCell> cell,
                         Location location, Name name, bool dispose) :
    owner_(&owner),
    type_(type),
    cell_(std::move(cell)),
    location_(location),
    name_(std::move(name)),
    dispose_(dispose)
{
}

TreeBinding::~TreeBinding()
{
    // the listeners capture this and the owner
    detachDependentsListener();
    detachOwnerListener();
}

void TreeBinding::markPromoted(Name registry_name)
{
    promoted_name_ = std::move(registry_name);
    state_ = State::Promoted;
}

void TreeBinding::markDemoted()
{
    promoted_name_.reset();
    state_ = State::Bound;
}

void TreeBinding::markTornDown()
{
    // the owner may be freed once its unmount was reported
    detachOwnerListener();
    detachDependentsListener();
    dependents_.clear();
    state_ = State::TornDown;
}

Result<void> TreeBinding::addDependent(TreePosition& position, const std::shared_ptr<ChangeNotifier>& notifier)
{
    if (state_ == State::TornDown) {
        return Error(ResultCode::InvalidState,
            fmt::format("binding of {} at {} was already torn down", type_.name(), owner_->describe()));
    }
    if (!notifier) {
        return Error(ResultCode::NotObservable,
            fmt::format("{} bound at {} is not observable", type_.name(), owner_->describe()));
    }
    if (hasDependent(position))
        return OK();

    if (!dependents_listener_) {
        auto listener = makeListener([this]() { notifyDependents(); });
        auto added = notifier->addListener(listener);
        RETURN_IF_ERR(added);
        dependents_listener_ = std::move(listener);
        observed_ = notifier;
    }

    dependents_.push_back(&position);
    LOGT("{} depends on {} bound at {}", position.describe(), type_.name(), owner_->describe());
    return OK();
}

Result<void> TreeBinding::rebuildOwnerOnChange(const std::shared_ptr<ChangeNotifier>& notifier)
{
    if (state_ == State::TornDown) {
        return Error(ResultCode::InvalidState,
            fmt::format("binding of {} at {} was already torn down", type_.name(), owner_->describe()));
    }
    if (!notifier) {
        return Error(ResultCode::NotObservable,
            fmt::format("{} bound at {} is not observable", type_.name(), owner_->describe()));
    }
    if (owner_listener_)
        return OK();

    TreePosition* owner = owner_;
    auto listener = makeListener([owner]() { owner->markNeedsRebuild(); });
    auto added = notifier->addListener(listener);
    RETURN_IF_ERR(added);
    owner_listener_ = std::move(listener);
    owner_observed_ = notifier;
    return OK();
}

void TreeBinding::removeDependent(const TreePosition& position)
{
    dependents_.erase(
        std::remove(dependents_.begin(), dependents_.end(), &position),
        dependents_.end());
}

bool TreeBinding::hasDependent(const TreePosition& position) const
{
    return std::find(dependents_.begin(), dependents_.end(), &position) != dependents_.end();
}

void TreeBinding::notifyDependents()
{
    // a rebuild may unmount dependents and shrink the list
    auto targets = dependents_;
    for (auto* position : targets) {
        if (hasDependent(*position))
            position->markNeedsRebuild();
    }
}

void TreeBinding::detachDependentsListener()
{
    if (!dependents_listener_) return;
    if (auto notifier = observed_.lock()) {
        notifier->removeListener(dependents_listener_);
    }
    dependents_listener_.reset();
    observed_.reset();
}

void TreeBinding::detachOwnerListener()
{
    if (!owner_listener_) return;
    if (auto notifier = owner_observed_.lock()) {
        notifier->removeListener(owner_listener_);
    }
    owner_listener_.reset();
    owner_observed_.reset();
}

}; // namespace bilocator
