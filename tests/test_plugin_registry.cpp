#include <gtest/gtest.h>

#include "plugins/builtin_plugins.h"
#include "plugins/plugin_registry.h"
#include "test_support.h"

using pm::RegistryError;
using pm::plugins::PluginRegistry;
using pm::test::FakeSwitchPlugin;

TEST(PluginRegistryTest, ResolvesRegisteredPlugins) {
    PluginRegistry registry;
    registry.registerPlugin("switch_a", std::make_unique<FakeSwitchPlugin>("switch_a"));
    registry.registerPlugin("b2", std::make_unique<FakeSwitchPlugin>("b2"));

    ASSERT_NE(nullptr, registry.resolve("switch_a"));
    EXPECT_EQ("switch_a", registry.resolve("switch_a")->name());
    EXPECT_TRUE(registry.contains("b2"));
    EXPECT_EQ(2u, registry.size());
}

TEST(PluginRegistryTest, LookupIsExactAndCaseSensitive) {
    PluginRegistry registry;
    registry.registerPlugin("switch", std::make_unique<FakeSwitchPlugin>("switch"));

    EXPECT_EQ(nullptr, registry.resolve("Switch"));
    EXPECT_EQ(nullptr, registry.resolve("switc"));
    EXPECT_EQ(nullptr, registry.resolve("doesnotexist"));
}

TEST(PluginRegistryTest, RejectsDuplicates) {
    PluginRegistry registry;
    registry.registerPlugin("switch", std::make_unique<FakeSwitchPlugin>("switch"));
    EXPECT_THROW(registry.registerPlugin("switch", std::make_unique<FakeSwitchPlugin>("switch")),
                 RegistryError);
    EXPECT_EQ(1u, registry.size());
}

TEST(PluginRegistryTest, RejectsMalformedIds) {
    PluginRegistry registry;
    for (const char *bad : {"", "1abc", "nmi-watchdog", "Upper", "with space", "dot.ted", "abc\n", "\nabc"}) {
        EXPECT_FALSE(PluginRegistry::isValidId(bad)) << bad;
        EXPECT_THROW(registry.registerPlugin(bad, std::make_unique<FakeSwitchPlugin>("x")),
                     RegistryError) << bad;
    }
    for (const char *good : {"a", "_private", "intel_epb", "abc123", "x_1_y"})
        EXPECT_TRUE(PluginRegistry::isValidId(good)) << good;
    EXPECT_EQ(0u, registry.size());
}

TEST(PluginRegistryTest, RejectsNullPlugin) {
    PluginRegistry registry;
    EXPECT_THROW(registry.registerPlugin("empty", nullptr), RegistryError);
}

TEST(PluginRegistryTest, BuiltinsAreRegisteredUnderTheirNames) {
    PluginRegistry registry;
    pm::plugins::registerBuiltinPlugins(registry);

    const std::vector<std::string> expected{"command", "intel_epb", "intel_pstate", "nmi_watchdog"};
    EXPECT_EQ(expected, registry.ids());
    for (const auto &id : registry.ids())
        EXPECT_EQ(id, registry.resolve(id)->name());

    EXPECT_FALSE(registry.resolve("command")->isInteractive());
    EXPECT_TRUE(registry.resolve("nmi_watchdog")->isInteractive());
}
