#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <type_traits>
#include "flagpole/core/dependency_resolver.h"

using namespace flagpole::core;
using json = nlohmann::json;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

class DependencyResolverTest : public ::testing::Test {
protected:
    // Adds a single-output binding and returns its handle id
    std::size_t add(FlagMask flag, FlagMask dependsOn = 0) {
        BindingHandle handle{bindings.size() + 1};
        bindings.emplace_back(handle,
                              std::vector<BindingEntry>{BindingEntry{flag, std::nullopt, dependsOn, 0}},
                              dependsOn,
                              SingleHandler([](const HandlerCall&) { return json(); }));
        return handle.id;
    }

    std::vector<std::size_t> ids(const BuildPlan& plan) const {
        std::vector<std::size_t> result;
        for (const auto& handle : plan.order) {
            result.push_back(handle.id);
        }
        return result;
    }

    FlagSpace flags{"ONE", "TWO", "THREE", "FOUR", "FIVE"};
    std::vector<HandlerBinding> bindings;
};

TEST_F(DependencyResolverTest, SelectsOnlyRequestedBindings) {
    add(flags["ONE"]);
    add(flags["TWO"]);
    add(flags["THREE"]);

    DependencyResolver resolver(flags, bindings);
    BuildPlan plan = resolver.resolve(flags["ONE"] | flags["THREE"]);

    EXPECT_THAT(ids(plan), ElementsAre(1, 3));
    EXPECT_EQ(plan.requestedFlags, flags["ONE"] | flags["THREE"]);
    EXPECT_EQ(plan.effectiveFlags, flags["ONE"] | flags["THREE"]);
}

TEST_F(DependencyResolverTest, EmptyRequestSelectsNothing) {
    add(flags["ONE"]);
    DependencyResolver resolver(flags, bindings);
    EXPECT_TRUE(resolver.resolve(flags["NONE"]).order.empty());
}

// Asking for FOUR, which depends on TWO, which depends on ONE
TEST_F(DependencyResolverTest, PullsInTransitiveDependencies) {
    add(flags["ONE"]);
    add(flags["TWO"], flags["ONE"]);
    add(flags["THREE"]);
    add(flags["FOUR"], flags["TWO"]);

    DependencyResolver resolver(flags, bindings);

    BuildPlan plan = resolver.resolve(flags["FOUR"]);
    EXPECT_THAT(ids(plan), ElementsAre(1, 2, 4));
    EXPECT_EQ(plan.effectiveFlags, flags["ONE"] | flags["TWO"] | flags["FOUR"]);

    EXPECT_EQ(resolver.resolve(flags["THREE"]).effectiveFlags, flags["THREE"]);
    EXPECT_EQ(resolver.resolve(flags["TWO"]).effectiveFlags, flags["ONE"] | flags["TWO"]);

    EXPECT_EQ(resolver.dependencyFlag(3), flags["ONE"] | flags["TWO"]);
    EXPECT_EQ(resolver.dependencyFlag(2), 0u);
}

// Test that dependents registered before their dependencies still run after them
TEST_F(DependencyResolverTest, OrdersDependenciesFirstRegardlessOfRegistration) {
    add(flags["THREE"], flags["TWO"]);
    add(flags["TWO"], flags["ONE"]);
    add(flags["ONE"]);

    DependencyResolver resolver(flags, bindings);
    EXPECT_THAT(ids(resolver.resolve(flags.all())), ElementsAre(3, 2, 1));
}

// Test that unconstrained bindings keep registration order
TEST_F(DependencyResolverTest, StableOrderAmongIndependentBindings) {
    add(flags["FIVE"]);
    add(flags["THREE"], flags["ONE"]);
    add(flags["TWO"]);
    add(flags["ONE"]);
    add(flags["FOUR"]);

    DependencyResolver resolver(flags, bindings);
    // THREE waits for ONE; everything else runs as registered
    EXPECT_THAT(ids(resolver.resolve(flags.all())), ElementsAre(1, 3, 4, 2, 5));
}

// Test that a composite dependency waits for every provider
TEST_F(DependencyResolverTest, CompositeDependency) {
    add(flags["FOUR"], flags["ONE"] | flags["TWO"]);
    add(flags["TWO"]);
    add(flags["ONE"]);

    DependencyResolver resolver(flags, bindings);
    EXPECT_THAT(ids(resolver.resolve(flags["FOUR"])), ElementsAre(2, 3, 1));
}

TEST_F(DependencyResolverTest, DetectsTwoNodeCycle) {
    add(flags["ONE"], flags["TWO"]);
    add(flags["TWO"], flags["ONE"]);

    DependencyResolver resolver(flags, bindings);
    try {
        resolver.resolve(flags["ONE"]);
        FAIL() << "Expected CircularDependencyError";
    } catch (const CircularDependencyError& e) {
        EXPECT_THAT(e.getFlags(), UnorderedElementsAre("ONE", "TWO"));
        EXPECT_NE(std::string(e.what()).find("Circular Dependency Error"), std::string::npos);
        EXPECT_EQ(e.getErrorCode(), FlagErrorCode::CIRCULAR_DEPENDENCY);
    }

    EXPECT_THROW(resolver.dependencyFlag(1), CircularDependencyError);
}

TEST_F(DependencyResolverTest, DetectsSelfDependency) {
    add(flags["ONE"], flags["ONE"]);
    DependencyResolver resolver(flags, bindings);
    EXPECT_THROW(resolver.resolve(flags["ONE"]), CircularDependencyError);
}

TEST_F(DependencyResolverTest, DetectsLongCycleOnlyWhenWalked) {
    add(flags["ONE"], flags["THREE"]);
    add(flags["TWO"], flags["ONE"]);
    add(flags["THREE"], flags["TWO"]);
    add(flags["FOUR"]);

    DependencyResolver resolver(flags, bindings);
    EXPECT_THROW(resolver.resolve(flags["TWO"]), CircularDependencyError);
    // FOUR never touches the cycle
    EXPECT_THAT(ids(resolver.resolve(flags["FOUR"])), ElementsAre(4));
}

TEST_F(DependencyResolverTest, UnknownDependency) {
    add(flags["ONE"], flags["FIVE"]);

    DependencyResolver resolver(flags, bindings);
    try {
        resolver.resolve(flags["ONE"]);
        FAIL() << "Expected UnknownFlagError";
    } catch (const UnknownFlagError& e) {
        EXPECT_EQ(e.getMask(), flags["FIVE"]);
        EXPECT_EQ(e.getFlagName(), "FIVE");
    }
}

TEST_F(DependencyResolverTest, UndeclaredBits) {
    add(flags["ONE"]);
    add(FlagMask{1} << 20);

    DependencyResolver resolver(flags, bindings);
    EXPECT_THROW(resolver.resolve(FlagMask{1} << 30), UnknownFlagError);
    EXPECT_NO_THROW(resolver.resolve(flags["ONE"]));

    bindings.clear();
    add(flags["ONE"], FlagMask{1} << 20);
    add(FlagMask{1} << 20);
    DependencyResolver walking(flags, bindings);
    EXPECT_THROW(walking.resolve(flags["ONE"]), UnknownFlagError);
}

// Test that requested flags without providers are accepted
TEST_F(DependencyResolverTest, RequestedFlagsWithoutHandlers) {
    add(flags["TWO"]);
    DependencyResolver resolver(flags, bindings);
    EXPECT_THAT(ids(resolver.resolve(flags.all())), ElementsAre(1));
}

TEST_F(DependencyResolverTest, ProvidersOf) {
    add(flags["ONE"]);
    add(flags["TWO"]);
    add(flags["THREE"]);

    DependencyResolver resolver(flags, bindings);
    EXPECT_THAT(resolver.providersOf(flags["ONE"] | flags["THREE"]), ElementsAre(0, 2));
    EXPECT_THAT(resolver.providersOf(flags["FOUR"]), ElementsAre());
}

TEST(DependencyResolverLifetimeTest, RequiresLvalueInputs) {
    using Bindings = std::vector<HandlerBinding>;
    EXPECT_TRUE((std::is_constructible<DependencyResolver, const FlagSpace&, const Bindings&>::value));
    EXPECT_FALSE((std::is_constructible<DependencyResolver, FlagSpace, const Bindings&>::value));
    EXPECT_FALSE((std::is_constructible<DependencyResolver, const FlagSpace&, Bindings>::value));
    EXPECT_FALSE((std::is_constructible<DependencyResolver, FlagSpace, Bindings>::value));
}
