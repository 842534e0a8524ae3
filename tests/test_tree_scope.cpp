/*
Bilocator: TreeScope Tests
Role: Verify tree-scoped bindings, the upward walk and promotion
Testing Strategy: Build FakeNode chains, bind at chosen positions, resolve from descendants
Coverage: Placement modes, precedence, reactive dependents, promote/demote, teardown rule
*/
#include <gtest/gtest.h>

#include "tree_scope.hpp"
#include "fixtures/test_models.hpp"

using namespace bilocator;
using fixtures::Config;
using fixtures::Counter;
using fixtures::FakeNode;
using fixtures::MyModel;

class TreeScopeTest : public ::testing::Test {
protected:
    // root -> parent -> child -> leaf, plus a sibling of parent
    TreeScopeTest()
        : root("root"), parent("parent", &root), child("child", &parent), leaf("leaf", &child),
          sibling("sibling", &root), scope(registry) {}

    template<typename T>
    BindingSpec<T> treeSpec(std::shared_ptr<T> instance, bool dispose = true)
    {
        BindingSpec<T> spec;
        spec.instance = std::move(instance);
        spec.location = Location::Tree;
        spec.dispose = dispose;
        return spec;
    }

    FakeNode root;
    FakeNode parent;
    FakeNode child;
    FakeNode leaf;
    FakeNode sibling;

    Registry registry;
    TreeScope scope;
};

// =============================================================================
// Placement
// =============================================================================

TEST_F(TreeScopeTest, TreeBindingIsNotInRegistry) {
    ASSERT_TRUE(scope.bind<MyModel>(parent, treeSpec(std::make_shared<MyModel>())));

    auto found = scope.resolveNonReactive<MyModel>(leaf);
    ASSERT_TRUE(found);
    EXPECT_FALSE(registry.isRegistered<MyModel>());
}

TEST_F(TreeScopeTest, RegistryBindingIsRegisteredAndNotTreeVisible) {
    BindingSpec<Config> spec;
    spec.factory = [] { return std::make_shared<Config>(Config{"global"}); };
    spec.name = Name("cfg");
    ASSERT_TRUE(scope.bind<Config>(parent, spec));

    EXPECT_TRUE(registry.isRegistered<Config>(Name("cfg")));
    auto found = scope.resolveNonReactive<Config>(leaf);
    ASSERT_FALSE(found);
    EXPECT_EQ(found.code(), ResultCode::NotFound);
    // the message points at the registry
    ASSERT_TRUE(found.error().has_value());
    EXPECT_NE(found.error()->find("Location::Registry"), std::string::npos);
}

TEST_F(TreeScopeTest, RegistryBindingWithTakenKeyFailsAndBindsNothing) {
    ASSERT_TRUE(registry.registerInstance<Config>(std::make_shared<Config>()));

    BindingSpec<Config> spec;
    spec.instance = std::make_shared<Config>();
    auto bound = scope.bind<Config>(parent, spec);
    ASSERT_FALSE(bound);
    EXPECT_EQ(bound.code(), ResultCode::AlreadyExists);
    EXPECT_FALSE(scope.isBound<Config>(parent));
}

TEST_F(TreeScopeTest, OneBindingPerTypePerNode) {
    ASSERT_TRUE(scope.bind<MyModel>(parent, treeSpec(std::make_shared<MyModel>())));
    auto again = scope.bind<MyModel>(parent, treeSpec(std::make_shared<MyModel>()));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.code(), ResultCode::AlreadyExists);
}

TEST_F(TreeScopeTest, MalformedSpecIsInvalidArgument) {
    BindingSpec<Config> spec;
    spec.location = Location::Tree;
    auto bound = scope.bind<Config>(parent, spec);
    ASSERT_FALSE(bound);
    EXPECT_EQ(bound.code(), ResultCode::InvalidArgument);
}

// =============================================================================
// Walk
// =============================================================================

TEST_F(TreeScopeTest, ClosestAncestorWins) {
    ASSERT_TRUE(scope.bind<MyModel>(root, treeSpec(std::make_shared<MyModel>("far"))));
    ASSERT_TRUE(scope.bind<MyModel>(child, treeSpec(std::make_shared<MyModel>("near"))));

    auto plain = scope.resolveNonReactive<MyModel>(leaf);
    auto reactive = scope.resolveReactive<MyModel>(leaf);
    ASSERT_TRUE(plain);
    ASSERT_TRUE(reactive);
    EXPECT_EQ(plain.value()->tag, "near");
    EXPECT_EQ(reactive.value()->tag, "near");
}

TEST_F(TreeScopeTest, WalkIncludesStartingPosition) {
    ASSERT_TRUE(scope.bind<MyModel>(child, treeSpec(std::make_shared<MyModel>("self"))));
    auto found = scope.resolveNonReactive<MyModel>(child);
    ASSERT_TRUE(found);
    EXPECT_EQ(found.value()->tag, "self");
}

TEST_F(TreeScopeTest, NonDescendantCannotSeeBinding) {
    ASSERT_TRUE(scope.bind<MyModel>(parent, treeSpec(std::make_shared<MyModel>())));
    auto found = scope.resolveNonReactive<MyModel>(sibling);
    ASSERT_FALSE(found);
    EXPECT_EQ(found.code(), ResultCode::NotFound);
}

TEST_F(TreeScopeTest, LazyTreeBindingBuildsOnFirstResolve) {
    int built = 0;
    BindingSpec<MyModel> spec;
    spec.factory = [&] {
        ++built;
        return std::make_shared<MyModel>();
    };
    spec.location = Location::Tree;
    ASSERT_TRUE(scope.bind<MyModel>(parent, spec));
    EXPECT_EQ(built, 0);

    (void)scope.resolveNonReactive<MyModel>(leaf);
    (void)scope.resolveNonReactive<MyModel>(child);
    EXPECT_EQ(built, 1);
}

// =============================================================================
// Reactive Resolution
// =============================================================================

TEST_F(TreeScopeTest, ReactiveDependentIsMarkedOnChange) {
    ASSERT_TRUE(scope.bind<MyModel>(parent, treeSpec(std::make_shared<MyModel>())));

    auto model = scope.resolveReactive<MyModel>(leaf);
    ASSERT_TRUE(model);
    // a repeated dependency is recorded once
    ASSERT_TRUE(scope.resolveReactive<MyModel>(leaf));

    model.value()->touch();
    EXPECT_EQ(leaf.rebuilds, 1);
    EXPECT_EQ(child.rebuilds, 0);
}

TEST_F(TreeScopeTest, NonReactiveLookupRecordsNoDependency) {
    ASSERT_TRUE(scope.bind<MyModel>(parent, treeSpec(std::make_shared<MyModel>())));

    auto model = scope.resolveNonReactive<MyModel>(leaf);
    ASSERT_TRUE(model);
    model.value()->touch();
    EXPECT_EQ(leaf.rebuilds, 0);
}

TEST_F(TreeScopeTest, ReactiveLookupOfPlainValueIsNotObservable) {
    ASSERT_TRUE(scope.bind<Config>(parent, treeSpec(std::make_shared<Config>())));
    auto found = scope.resolveReactive<Config>(leaf);
    ASSERT_FALSE(found);
    EXPECT_EQ(found.code(), ResultCode::NotObservable);
}

TEST_F(TreeScopeTest, UnmountedDependentIsForgotten) {
    ASSERT_TRUE(scope.bind<MyModel>(parent, treeSpec(std::make_shared<MyModel>())));
    auto model = scope.resolveReactive<MyModel>(leaf);
    ASSERT_TRUE(model);

    ASSERT_TRUE(scope.onUnmount(leaf));
    model.value()->touch();
    EXPECT_EQ(leaf.rebuilds, 0);
}

// =============================================================================
// Promotion
// =============================================================================

TEST_F(TreeScopeTest, PromoteThenDemoteRoundTrip) {
    ASSERT_TRUE(scope.bind<MyModel>(parent, treeSpec(std::make_shared<MyModel>())));
    EXPECT_FALSE(registry.isRegistered<MyModel>());
    const size_t before = registry.size();

    ASSERT_TRUE(scope.promote<MyModel>(leaf));
    EXPECT_TRUE(registry.isRegistered<MyModel>());

    ASSERT_TRUE(scope.demote<MyModel>(leaf));
    EXPECT_FALSE(registry.isRegistered<MyModel>());
    EXPECT_EQ(registry.size(), before);
    EXPECT_EQ(registry.typeCount(), 0u);

    auto still = scope.resolveNonReactive<MyModel>(leaf);
    ASSERT_TRUE(still);
    EXPECT_FALSE(still.value()->isDisposed());
}

TEST_F(TreeScopeTest, PromotionSharesTheTreeInstance) {
    int built = 0;
    BindingSpec<MyModel> spec;
    spec.factory = [&] {
        ++built;
        return std::make_shared<MyModel>();
    };
    spec.location = Location::Tree;
    ASSERT_TRUE(scope.bind<MyModel>(parent, spec));

    ASSERT_TRUE(scope.promote<MyModel>(child, Name("shared")));
    EXPECT_EQ(built, 1);

    auto from_registry = registry.get<MyModel>(Name("shared"));
    auto from_tree = scope.resolveNonReactive<MyModel>(child);
    ASSERT_TRUE(from_registry);
    ASSERT_TRUE(from_tree);
    EXPECT_EQ(from_registry.value(), from_tree.value());
    EXPECT_EQ(built, 1);
}

TEST_F(TreeScopeTest, PromoteTwiceFails) {
    ASSERT_TRUE(scope.bind<MyModel>(parent, treeSpec(std::make_shared<MyModel>())));
    ASSERT_TRUE(scope.promote<MyModel>(child));
    auto again = scope.promote<MyModel>(child, Name("other"));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.code(), ResultCode::AlreadyExists);
}

TEST_F(TreeScopeTest, DemoteWithoutPromotionFails) {
    ASSERT_TRUE(scope.bind<MyModel>(parent, treeSpec(std::make_shared<MyModel>())));
    auto demoted = scope.demote<MyModel>(child);
    ASSERT_FALSE(demoted);
    EXPECT_EQ(demoted.code(), ResultCode::NotRegistered);
}

TEST_F(TreeScopeTest, PromoteWithoutBindingIsNotFound) {
    auto promoted = scope.promote<MyModel>(leaf);
    ASSERT_FALSE(promoted);
    EXPECT_EQ(promoted.code(), ResultCode::NotFound);
}

TEST_F(TreeScopeTest, TreeModelScenario) {
    ASSERT_TRUE(scope.bind<MyModel>(parent, treeSpec(std::make_shared<MyModel>())));
    ASSERT_TRUE(scope.resolveNonReactive<MyModel>(child));
    EXPECT_FALSE(registry.isRegistered<MyModel>());

    ASSERT_TRUE(scope.promote<MyModel>(child));
    EXPECT_TRUE(registry.isRegistered<MyModel>());
}

// =============================================================================
// Teardown
// =============================================================================

TEST_F(TreeScopeTest, UnmountRemovesPromotedEntryWithoutRegistryDisposal) {
    auto counter = std::make_shared<Counter>();
    ASSERT_TRUE(scope.bind<Counter>(parent, treeSpec(counter)));
    ASSERT_TRUE(scope.promote<Counter>(child, Name("clicks")));

    ASSERT_TRUE(scope.onUnmount(parent));
    EXPECT_FALSE(registry.isRegistered<Counter>(Name("clicks")));
    // disposed once, through the node
    EXPECT_EQ(counter->dispose_calls, 1);
    EXPECT_FALSE(scope.isBound<Counter>(parent));
}

TEST_F(TreeScopeTest, UnmountOfRegistryBindingUnregisters) {
    auto counter = std::make_shared<Counter>();
    BindingSpec<Counter> spec;
    spec.instance = counter;
    ASSERT_TRUE(scope.bind<Counter>(parent, spec));
    ASSERT_TRUE(registry.isRegistered<Counter>());

    ASSERT_TRUE(scope.onUnmount(parent));
    EXPECT_FALSE(registry.isRegistered<Counter>());
    EXPECT_EQ(counter->dispose_calls, 1);
}

TEST_F(TreeScopeTest, UnmountWithoutDisposeKeepsInstanceAlive) {
    auto counter = std::make_shared<Counter>();
    ASSERT_TRUE(scope.bind<Counter>(parent, treeSpec(counter, false)));

    ASSERT_TRUE(scope.onUnmount(parent));
    EXPECT_EQ(counter->dispose_calls, 0);
    EXPECT_EQ(scope.bindingCount(), 0u);
}

TEST_F(TreeScopeTest, UnmountDetachesDependentsListener) {
    auto counter = std::make_shared<Counter>();
    ASSERT_TRUE(scope.bind<Counter>(parent, treeSpec(counter, false)));
    ASSERT_TRUE(scope.resolveReactive<Counter>(leaf));
    EXPECT_EQ(counter->listenerCount(), 1u);

    ASSERT_TRUE(scope.onUnmount(parent));
    EXPECT_EQ(counter->listenerCount(), 0u);
    counter->increment();
    EXPECT_EQ(leaf.rebuilds, 0);
}

TEST_F(TreeScopeTest, TeardownReportsExternallyRemovedEntry) {
    auto counter = std::make_shared<Counter>();
    ASSERT_TRUE(scope.bind<Counter>(parent, treeSpec(counter)));
    ASSERT_TRUE(scope.promote<Counter>(child));
    ASSERT_TRUE(registry.unregister<Counter>(std::nullopt, false));

    auto unmounted = scope.onUnmount(parent);
    ASSERT_FALSE(unmounted);
    EXPECT_EQ(unmounted.code(), ResultCode::NotRegistered);
    // teardown still completes
    EXPECT_EQ(counter->dispose_calls, 1);
    EXPECT_FALSE(scope.isBound<Counter>(parent));
}

TEST_F(TreeScopeTest, TeardownLeavesReRegisteredEntryAlone) {
    auto counter = std::make_shared<Counter>();
    ASSERT_TRUE(scope.bind<Counter>(parent, treeSpec(counter)));
    ASSERT_TRUE(scope.promote<Counter>(child));
    ASSERT_TRUE(registry.unregister<Counter>(std::nullopt, false));
    auto replacement = std::make_shared<Counter>(7);
    ASSERT_TRUE(registry.registerInstance<Counter>(replacement));

    auto unmounted = scope.onUnmount(parent);
    ASSERT_FALSE(unmounted);
    EXPECT_EQ(unmounted.code(), ResultCode::NotRegistered);
    EXPECT_EQ(counter->dispose_calls, 1);

    auto current = registry.get<Counter>();
    ASSERT_TRUE(current);
    EXPECT_EQ(current.value(), replacement);
    EXPECT_EQ(replacement->dispose_calls, 0);
}

TEST_F(TreeScopeTest, DemoteLeavesReRegisteredEntryAlone) {
    ASSERT_TRUE(scope.bind<Counter>(parent, treeSpec(std::make_shared<Counter>())));
    ASSERT_TRUE(scope.promote<Counter>(child, Name("clicks")));
    ASSERT_TRUE(registry.unregister<Counter>(Name("clicks"), false));
    auto replacement = std::make_shared<Counter>();
    ASSERT_TRUE(registry.registerInstance<Counter>(replacement, Name("clicks")));

    auto demoted = scope.demote<Counter>(child);
    ASSERT_FALSE(demoted);
    EXPECT_EQ(demoted.code(), ResultCode::NotRegistered);
    EXPECT_EQ(registry.get<Counter>(Name("clicks")).value(), replacement);
    // the binding itself is back to unpromoted
    EXPECT_TRUE(scope.promote<Counter>(child, Name("again")));
}

TEST_F(TreeScopeTest, UnbindUnknownTypeIsNotFound) {
    auto result = scope.unbind<MyModel>(parent);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.code(), ResultCode::NotFound);
}

TEST_F(TreeScopeTest, ClearTearsDownEverything) {
    auto counter = std::make_shared<Counter>();
    ASSERT_TRUE(scope.bind<Counter>(parent, treeSpec(counter)));
    ASSERT_TRUE(scope.promote<Counter>(child));

    scope.clear();
    EXPECT_EQ(scope.bindingCount(), 0u);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(counter->dispose_calls, 1);
}
