#include <gtest/gtest.h>
#include <algorithm>
#include <string>

#include "index/builtin_key_generators.h"
#include "index/key_generator_registry.h"
#include "storage/schema_errors.h"

using namespace strata;

namespace {

ScopedSlice emptyKey(utils::ByteArena&, const TableValueReader&) {
    return ScopedSlice();
}

} // namespace

TEST(KeyGeneratorRegistryTest, RegisterAndResolve) {
    KeyGeneratorRegistry registry;
    auto registered = registry.registerKeyGenerator("app.orders", "by_customer", &emptyKey);

    auto resolved = registry.resolve("app.orders", "by_customer");
    EXPECT_EQ(resolved, registered);
    EXPECT_TRUE(resolved->is_static);
    EXPECT_TRUE(resolved->is_index_key_generator);
    EXPECT_EQ(resolved->qualifiedName(), "app.orders::by_customer");
    EXPECT_TRUE(registry.contains("app.orders", "by_customer"));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(KeyGeneratorRegistryTest, RejectsInvalidRegistrations) {
    KeyGeneratorRegistry registry;
    registry.registerKeyGenerator("app", "gen", &emptyKey);

    EXPECT_THROW(registry.registerKeyGenerator("app", "gen", &emptyKey), std::invalid_argument);
    EXPECT_THROW(registry.registerKeyGenerator("", "gen", &emptyKey), std::invalid_argument);
    EXPECT_THROW(registry.registerKeyGenerator("app", "", &emptyKey), std::invalid_argument);
    EXPECT_THROW(registry.registerKeyGenerator("app", "null", nullptr), std::invalid_argument);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(KeyGeneratorRegistryTest, ResolveReportsWhatIsMissing) {
    KeyGeneratorRegistry registry;
    registry.registerKeyGenerator("app", "gen", &emptyKey);

    try {
        registry.resolve("other", "gen");
        FAIL();
    } catch (const KeyGeneratorResolutionException& e) {
        EXPECT_NE(std::string(e.what()).find("scope is not registered"), std::string::npos);
    }
    try {
        registry.resolve("app", "missing");
        FAIL();
    } catch (const KeyGeneratorResolutionException& e) {
        EXPECT_NE(std::string(e.what()).find("no generator with this name"), std::string::npos);
        EXPECT_EQ(e.name(), "missing");
    }
    EXPECT_EQ(registry.find("app", "missing"), nullptr);
}

TEST(KeyGeneratorRegistryTest, UnregisterDropsEmptyScopes) {
    KeyGeneratorRegistry registry;
    registry.registerKeyGenerator("a", "x", &emptyKey);
    registry.registerKeyGenerator("a", "y", &emptyKey);
    registry.registerKeyGenerator("b", "z", &emptyKey);

    EXPECT_EQ(registry.scopes(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(registry.names("a"), (std::vector<std::string>{"x", "y"}));

    EXPECT_TRUE(registry.unregister("b", "z"));
    EXPECT_FALSE(registry.unregister("b", "z"));
    EXPECT_EQ(registry.scopes(), (std::vector<std::string>{"a"}));

    registry.clear();
    EXPECT_EQ(registry.size(), 0u);
}

TEST(KeyGeneratorRegistryTest, BuiltinRegistrationIsIdempotent) {
    KeyGeneratorRegistry registry;
    EXPECT_EQ(registerBuiltinKeyGenerators(registry), 3u);
    EXPECT_EQ(registerBuiltinKeyGenerators(registry), 0u);

    auto names = registry.names(builtin_keys::kBuiltinScope);
    EXPECT_NE(std::find(names.begin(), names.end(), builtin_keys::kLowercaseFirstField), names.end());
}

TEST(KeyGeneratorRegistryTest, DescriptorFlagsAreKept) {
    KeyGeneratorRegistry registry;
    KeyGeneratorDescriptor d;
    d.scope = "app";
    d.name = "plain";
    d.generator = &emptyKey;
    auto ptr = registry.registerDescriptor(d);
    EXPECT_TRUE(ptr->is_static);
    EXPECT_FALSE(ptr->is_index_key_generator);
}
