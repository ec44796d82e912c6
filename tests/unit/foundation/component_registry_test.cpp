#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "warden/foundation/component_registry.hpp"

using namespace warden::foundation;

namespace {

class IGreeter {
public:
    virtual ~IGreeter() = default;
    virtual std::string greet() const = 0;
};

class EnglishGreeter : public IGreeter {
public:
    std::string greet() const override { return "hello"; }
};

class FrenchGreeter : public IGreeter {
public:
    std::string greet() const override { return "bonjour"; }
};

} // namespace

TEST(ComponentRegistryTest, ResolveByName) {
    ComponentRegistry components;
    components.add<IGreeter>("en", std::make_shared<EnglishGreeter>());
    components.add<IGreeter>("fr", std::make_shared<FrenchGreeter>());

    auto fr = components.resolve<IGreeter>("fr");
    ASSERT_TRUE(fr.hasValue());
    EXPECT_EQ(fr.value()->greet(), "bonjour");
    EXPECT_EQ(components.size(), 2u);
}

TEST(ComponentRegistryTest, MissingNameIsConfigurationError) {
    ComponentRegistry components;
    components.add<IGreeter>("en", std::make_shared<EnglishGreeter>());

    auto missing = components.resolve<IGreeter>("de");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.code(), ErrorCode::ConfigurationError);
    EXPECT_NE(std::string(missing.error().message()).find("de"), std::string::npos);
    EXPECT_EQ(components.get<IGreeter>("de"), nullptr);
}

TEST(ComponentRegistryTest, SameNameDifferentTypesAreIndependent) {
    ComponentRegistry components;
    components.add<IGreeter>("memory", std::make_shared<EnglishGreeter>());
    components.add<std::string>("memory", std::make_shared<std::string>("value"));

    EXPECT_TRUE(components.has<IGreeter>("memory"));
    EXPECT_TRUE(components.has<std::string>("memory"));
    EXPECT_FALSE(components.has<int>("memory"));
    EXPECT_EQ(*components.get<std::string>("memory"), "value");
}

TEST(ComponentRegistryTest, AddReplacesPreviousRegistration) {
    ComponentRegistry components;
    components.add<IGreeter>("default", std::make_shared<EnglishGreeter>());
    components.add<IGreeter>("default", std::make_shared<FrenchGreeter>());

    EXPECT_EQ(components.size(), 1u);
    EXPECT_EQ(components.get<IGreeter>("default")->greet(), "bonjour");
}
