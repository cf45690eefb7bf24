#include <gtest/gtest.h>
#include <QTemporaryDir>
#include <QFile>

#include "config/config.h"
#include "core/error.h"

using pm::Config;
using pm::ConfigError;
using pm::ConfigValue;

TEST(ConfigTest, ScalarsAreTyped) {
    const ConfigValue v = Config::parse(
        "a: true\n"
        "b: 42\n"
        "c: -7\n"
        "d: hello\n"
        "e: \"true\"\n"
        "f: '15'\n"
        "g: 1.5\n");

    ASSERT_TRUE(v.isTable());
    EXPECT_EQ(ConfigValue::boolean(true), *v.find("a"));
    EXPECT_EQ(ConfigValue::integer(42), *v.find("b"));
    EXPECT_EQ(ConfigValue::integer(-7), *v.find("c"));
    EXPECT_EQ(ConfigValue::string("hello"), *v.find("d"));
    EXPECT_EQ(ConfigValue::string("true"), *v.find("e"));
    EXPECT_EQ(ConfigValue::string("15"), *v.find("f"));
    EXPECT_EQ(ConfigValue::string("1.5"), *v.find("g"));
}

TEST(ConfigTest, TablesKeepFileOrder) {
    const ConfigValue v = Config::parse("zeta: 1\nalpha: 2\nmid: 3\n");
    const auto &t = v.asTable();
    ASSERT_EQ(3u, t.size());
    EXPECT_EQ("zeta", t[0].first);
    EXPECT_EQ("alpha", t[1].first);
    EXPECT_EQ("mid", t[2].first);
}

TEST(ConfigTest, NestedListsOfTables) {
    const ConfigValue v = Config::parse(
        "command:\n"
        "  - command: [ls, -l]\n"
        "    show-stdout: true\n"
        "  - command: \"echo hi\"\n");
    const auto &list = v.find("command")->asList();
    ASSERT_EQ(2u, list.size());
    const auto &argv = list[0].find("command")->asList();
    ASSERT_EQ(2u, argv.size());
    EXPECT_EQ("-l", argv[1].asString());
    EXPECT_TRUE(list[0].find("show-stdout")->asBoolean());
    EXPECT_EQ("echo hi", list[1].find("command")->asString());
}

TEST(ConfigTest, RejectsNullValues) {
    EXPECT_THROW(Config::parse("mode:\n  nmi_watchdog:\n"), ConfigError);
}

TEST(ConfigTest, RejectsDuplicateKeys) {
    EXPECT_THROW(Config::parse("a: 1\na: 2\n"), ConfigError);
    EXPECT_THROW(ConfigValue::table({{"x", ConfigValue::integer(1)},
                                     {"x", ConfigValue::integer(2)}}),
                 ConfigError);
}

TEST(ConfigTest, RejectsEmptyAndMalformedDocuments) {
    EXPECT_THROW(Config::parse(""), ConfigError);
    EXPECT_THROW(Config::parse("a: [1, 2\n"), ConfigError);
}

TEST(ConfigTest, IntegerOverflowIsAnError) {
    EXPECT_THROW(Config::parse("a: 99999999999999999999999\n"), ConfigError);
}

TEST(ConfigTest, AccessorsCheckTheTag) {
    const ConfigValue v = ConfigValue::integer(3);
    EXPECT_THROW(v.asString(), ConfigError);
    EXPECT_THROW(v.asTable(), ConfigError);
    EXPECT_EQ(nullptr, v.find("x"));
}

TEST(ConfigTest, ModesSkipNonTables) {
    const ConfigValue root = Config::parse(
        "fast:\n  nmi_watchdog: true\n"
        "broken: 3\n"
        "slow:\n  nmi_watchdog: false\n");
    QStringList warnings;
    const auto modes = Config::modes(root, &warnings);

    ASSERT_EQ(2u, modes.size());
    EXPECT_EQ("fast", modes[0].name);
    EXPECT_EQ("slow", modes[1].name);
    ASSERT_EQ(1, warnings.size());
    EXPECT_TRUE(warnings.first().contains("broken"));

    EXPECT_NE(nullptr, Config::findMode(modes, "slow"));
    EXPECT_EQ(nullptr, Config::findMode(modes, "Slow"));
}

TEST(ConfigTest, TopLevelMustBeATable) {
    EXPECT_THROW(Config::modes(Config::parse("- a\n- b\n"), nullptr), ConfigError);
}

TEST(ConfigTest, LoadFileReportsPath) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString missing = dir.filePath("missing.yaml");
    try {
        Config::loadFile(missing);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find(missing.toStdString()));
    }

    const QString path = dir.filePath("modes.yaml");
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write("quiet:\n  nmi_watchdog: skip\n");
    f.close();

    const ConfigValue root = Config::loadFile(path);
    EXPECT_EQ(ConfigValue::string("skip"), *root.find("quiet")->find("nmi_watchdog"));
}

TEST(ConfigTest, ToYamlReloadsToTheSameValue) {
    const ConfigValue value = ConfigValue::table({
        {"min-percentage", ConfigValue::integer(10)},
        {"turbo", ConfigValue::boolean(false)},
        {"label", ConfigValue::string("true")},
        {"argv", ConfigValue::list({ConfigValue::string("echo"), ConfigValue::string("12")})},
    });
    const std::string yaml = Config::toYaml("intel_pstate", value);
    const ConfigValue back = Config::parse(yaml);
    EXPECT_EQ(value, *back.find("intel_pstate"));
}
