/*
Bilocator: ChangeNotifier Tests
Role: Verify synchronous listener delivery and the documented ordering policy
Testing Strategy: Record calls from listeners that mutate the listener list mid-delivery
Coverage: add/remove, duplicates, snapshot delivery, dispose, ValueNotifier
*/
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "change_notifier.hpp"
#include "fixtures/test_models.hpp"

using namespace bilocator;
using fixtures::Counter;

// =============================================================================
// Listener Management
// =============================================================================

TEST(ChangeNotifier, DeliversInRegistrationOrder) {
    Counter counter;
    std::vector<int> calls;
    auto first = makeListener([&] { calls.push_back(1); });
    auto second = makeListener([&] { calls.push_back(2); });
    ASSERT_TRUE(counter.addListener(first));
    ASSERT_TRUE(counter.addListener(second));

    counter.increment();
    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
}

TEST(ChangeNotifier, RemovedListenerIsNotCalled) {
    Counter counter;
    int calls = 0;
    auto listener = makeListener([&] { ++calls; });
    ASSERT_TRUE(counter.addListener(listener));
    counter.removeListener(listener);

    counter.increment();
    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(counter.hasListeners());
}

TEST(ChangeNotifier, RemovingUnknownListenerIsNoOp) {
    Counter counter;
    auto listener = makeListener([] {});
    counter.removeListener(listener);
    EXPECT_EQ(counter.listenerCount(), 0u);
}

TEST(ChangeNotifier, ListenersCompareByIdentity) {
    Counter counter;
    int calls = 0;
    auto callback = [&] { ++calls; };
    ASSERT_TRUE(counter.addListener(makeListener(callback)));
    ASSERT_TRUE(counter.addListener(makeListener(callback)));

    counter.increment();
    EXPECT_EQ(calls, 2);
}

TEST(ChangeNotifier, EmptyListenerIsRejected) {
    Counter counter;
    auto added = counter.addListener(nullptr);
    ASSERT_FALSE(added);
    EXPECT_EQ(added.code(), ResultCode::InvalidArgument);
}

// =============================================================================
// Delivery Policy
// =============================================================================

TEST(ChangeNotifier, ListenerAddedDuringDeliveryWaitsForNextNotification) {
    Counter counter;
    int late_calls = 0;
    auto late = makeListener([&] { ++late_calls; });
    bool added = false;
    auto adder = makeListener([&] {
        if (!added) {
            added = static_cast<bool>(counter.addListener(late));
        }
    });
    ASSERT_TRUE(counter.addListener(adder));

    counter.increment();
    EXPECT_EQ(late_calls, 0);

    counter.increment();
    EXPECT_EQ(late_calls, 1);
}

TEST(ChangeNotifier, ListenerRemovedDuringDeliveryIsSkipped) {
    Counter counter;
    int victim_calls = 0;
    auto victim = makeListener([&] { ++victim_calls; });
    auto remover = makeListener([&] { counter.removeListener(victim); });
    ASSERT_TRUE(counter.addListener(remover));
    ASSERT_TRUE(counter.addListener(victim));

    counter.increment();
    EXPECT_EQ(victim_calls, 0);
}

// =============================================================================
// Disposal
// =============================================================================

TEST(ChangeNotifier, DisposeDropsListenersAndRejectsNewOnes) {
    Counter counter;
    ASSERT_TRUE(counter.addListener(makeListener([] {})));

    counter.dispose();
    EXPECT_TRUE(counter.isDisposed());
    EXPECT_FALSE(counter.hasListeners());

    auto added = counter.addListener(makeListener([] {}));
    ASSERT_FALSE(added);
    EXPECT_EQ(added.code(), ResultCode::InvalidState);
}

// =============================================================================
// ValueNotifier
// =============================================================================

TEST(ValueNotifier, NotifiesOnlyOnChange) {
    ValueNotifier<std::string> page("home");
    int calls = 0;
    ASSERT_TRUE(page.addListener(makeListener([&] { ++calls; })));

    page.setValue("home");
    EXPECT_EQ(calls, 0);

    page.setValue("settings");
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(page.value(), "settings");
}
