#include "change_notifier.hpp"
#include "logging.hpp"

#include <algorithm>

namespace bilocator {

Result<void> ChangeNotifier::addListener(const Listener& listener)
{
    if (!listener || !*listener) {
        return Error(ResultCode::InvalidArgument, "ChangeNotifier::addListener called with an empty listener");
    }
    if (disposed_) {
        LOGW("addListener on a disposed notifier");
        return Error(ResultCode::InvalidState, "ChangeNotifier was used after being disposed");
    }
    listeners_.push_back(listener);
    return OK();
}

void ChangeNotifier::removeListener(const Listener& listener)
{
    auto it = std::find(listeners_.begin(), listeners_.end(), listener);
    if (it != listeners_.end()) {
        listeners_.erase(it);
    }
}

void ChangeNotifier::dispose()
{
    if (disposed_) return;
    disposed_ = true;
    listeners_.clear();
}

void ChangeNotifier::notifyListeners()
{
    if (disposed_ || listeners_.empty()) return;

    const std::vector<Listener> snapshot = listeners_;
    for (const auto& listener : snapshot) {
        if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
            continue;
        }
        (*listener)();
        if (disposed_) break;
    }
}

} // namespace bilocator
