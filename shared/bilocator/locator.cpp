#include "locator.hpp"

#include "logging.hpp"

namespace bilocator {

// function-local static, initialized once and thread safe since C++11
Locator& Locator::instance()
{
    static Locator instance;
    return instance;
}

Locator& LocatorBuild()
{
    return Locator::instance();
}

void Locator::reset()
{
    scope_.clear();
    registry_.clear(true);
    keys_.clear();
    LOGD("locator reset");
}

}; // namespace bilocator
