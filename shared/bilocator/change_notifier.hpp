#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "result.h"

namespace bilocator {

    // Listeners compare by identity: two listeners wrapping the same callable
    // are still different listeners.
    using Listener = std::shared_ptr<const std::function<void()>>;

    inline Listener makeListener(std::function<void()> callback)
    {
        return std::make_shared<const std::function<void()>>(std::move(callback));
    }

    // Observable capability: listener registration, synchronous change
    // notification and disposal. Values that derive from ChangeNotifier are
    // what the locator treats as observable.
    class ChangeNotifier
    {
    public:
        inline static constexpr const char* LOG_TAG = "ChangeNotifier";

        ChangeNotifier() = default;
        virtual ~ChangeNotifier() = default;

        ChangeNotifier(const ChangeNotifier&) = delete;
        ChangeNotifier& operator=(const ChangeNotifier&) = delete;

        // The same listener may be added more than once and is then called once per addition.
        Result<void> addListener(const Listener& listener);

        // Removes one registration of listener. Removing an unknown listener is a no-op.
        void removeListener(const Listener& listener);

        bool hasListeners() const { return !listeners_.empty(); }
        size_t listenerCount() const { return listeners_.size(); }

        // Drops all listeners. Further addListener calls fail with InvalidState.
        virtual void dispose();
        bool isDisposed() const { return disposed_; }

    protected:
        // Calls the listeners registered when delivery starts, in registration
        // order. A listener removed during delivery is skipped; a listener
        // added during delivery is first called on the next notification.
        void notifyListeners();

    private:
        std::vector<Listener> listeners_;
        bool disposed_ = false;
    }; // class ChangeNotifier


    // ChangeNotifier holding a single value; notifies when the value changes.
    template<typename V>
    class ValueNotifier : public ChangeNotifier
    {
    public:
        explicit ValueNotifier(V value) : value_(std::move(value)) {}

        const V& value() const { return value_; }

        void setValue(V value)
        {
            if (value_ == value) return;
            value_ = std::move(value);
            notifyListeners();
        }

    private:
        V value_;
    }; // class ValueNotifier

}; // namespace bilocator
