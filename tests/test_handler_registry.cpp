/*
automation-engine: HandlerRegistry Tests
Role: Verify type-to-factory mapping, last-wins precedence and owner-scoped removal
Coverage: add/remove, sub-type lookup, shadowing, close
*/
#include <gtest/gtest.h>
#include "engine/handler_registry.hpp"
#include "fixtures/mock_handlers.hpp"

#include <algorithm>
#include <memory>

using automation_engine::HandlerRegistry;
using fixtures::MockHandlerFactory;

TEST(HandlerRegistry, AddMapsEverySupportedType) {
    HandlerRegistry registry;
    auto factory = std::make_shared<MockHandlerFactory>(std::set<std::string>{"Foo", "Bar"});

    auto added = registry.add(factory);
    std::sort(added.begin(), added.end());

    EXPECT_EQ(added, (std::vector<std::string>{"Bar", "Foo"}));
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.find("Foo"), factory);
    EXPECT_EQ(registry.find("Baz"), nullptr);
}

TEST(HandlerRegistry, SubTypeFallsBackToSystemType) {
    HandlerRegistry registry;
    auto factory = std::make_shared<MockHandlerFactory>(std::set<std::string>{"Foo"});
    registry.add(factory);

    EXPECT_EQ(registry.find("Foo:Special"), factory);
}

TEST(HandlerRegistry, LaterRegistrationWins) {
    HandlerRegistry registry;
    auto first = std::make_shared<MockHandlerFactory>(std::set<std::string>{"Foo"});
    auto second = std::make_shared<MockHandlerFactory>(std::set<std::string>{"Foo"});

    registry.add(first);
    registry.add(second);

    EXPECT_EQ(registry.find("Foo"), second);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(HandlerRegistry, RemoveOnlyDropsTypesOwnedByFactory) {
    HandlerRegistry registry;
    auto first = std::make_shared<MockHandlerFactory>(std::set<std::string>{"Foo", "Bar"});
    auto second = std::make_shared<MockHandlerFactory>(std::set<std::string>{"Foo"});
    registry.add(first);
    registry.add(second);

    auto removed = registry.remove(first);

    EXPECT_EQ(removed, (std::vector<std::string>{"Bar"}));
    EXPECT_EQ(registry.find("Foo"), second);
    EXPECT_EQ(registry.find("Bar"), nullptr);
}

TEST(HandlerRegistry, AddingSameFactoryTwiceIsHarmless) {
    HandlerRegistry registry;
    auto factory = std::make_shared<MockHandlerFactory>(std::set<std::string>{"Foo"});
    registry.add(factory);
    registry.add(factory);

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.find("Foo"), factory);
}

TEST(HandlerRegistry, ClosedRegistryIgnoresAdditions) {
    HandlerRegistry registry;
    auto factory = std::make_shared<MockHandlerFactory>(std::set<std::string>{"Foo"});
    registry.add(factory);
    registry.close();

    EXPECT_TRUE(registry.is_closed());
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_TRUE(registry.add(factory).empty());
    EXPECT_EQ(registry.find("Foo"), nullptr);
}
