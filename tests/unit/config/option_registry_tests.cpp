#include <gtest/gtest.h>

#include "sv/options.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace
{

std::filesystem::path makeTempFilePath()
{
    auto base = std::filesystem::temp_directory_path();
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<std::uint64_t> dist;
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        auto candidate = base / ("sv_options_test_" + std::to_string(dist(rng)) + ".json");
        if (!std::filesystem::exists(candidate))
            return candidate;
    }
    return base / "sv_options_test.json";
}

void registerSample(sv::config::OptionRegistry &registry)
{
    sv::config::OptionDefinition interval{"interval", sv::config::OptionKind::Integer,
                                          sv::config::OptionValue(std::int64_t{16}), "Interval",
                                          "Redraw interval"};
    interval.minValue = 1;
    interval.maxValue = 1000;
    registry.registerOption(interval);

    registry.registerOption({"enabled", sv::config::OptionKind::Boolean, sv::config::OptionValue(true),
                             "Enabled", "Boolean flag"});

    sv::config::OptionDefinition mode{"mode", sv::config::OptionKind::String, sv::config::OptionValue("dark"),
                                      "Mode", "Restricted string"};
    mode.choices = {"dark", "light"};
    registry.registerOption(mode);
}

} // namespace

TEST(OptionRegistry, RegistersAndReadsDefaults)
{
    sv::config::OptionRegistry registry("test-app");
    sv::config::OptionDefinition def{"featureEnabled", sv::config::OptionKind::Boolean, sv::config::OptionValue(true),
                                     "Feature Enabled", "Enables a feature for testing."};
    registry.registerOption(def);

    EXPECT_TRUE(registry.hasOption("featureEnabled"));
    EXPECT_FALSE(registry.hasOption("missing"));
    EXPECT_TRUE(registry.getBool("featureEnabled"));

    registry.set("featureEnabled", sv::config::OptionValue(false));
    EXPECT_FALSE(registry.getBool("featureEnabled"));

    registry.reset("featureEnabled");
    EXPECT_TRUE(registry.getBool("featureEnabled"));
}

TEST(OptionRegistry, NormalizesValuesToDefinitionTypes)
{
    sv::config::OptionRegistry registry("test-app");
    registerSample(registry);

    registry.set("interval", sv::config::OptionValue(std::string("42")));
    registry.set("enabled", sv::config::OptionValue(std::string("no")));

    EXPECT_EQ(registry.getInteger("interval"), 42);
    EXPECT_FALSE(registry.getBool("enabled"));
    EXPECT_EQ(registry.get("interval").kind(), sv::config::OptionKind::Integer);
}

TEST(OptionRegistry, ClampsIntegersAndRejectsUnknownChoices)
{
    sv::config::OptionRegistry registry("test-app");
    registerSample(registry);

    registry.set("interval", sv::config::OptionValue(std::int64_t{0}));
    EXPECT_EQ(registry.getInteger("interval"), 1);
    registry.set("interval", sv::config::OptionValue(std::int64_t{5000}));
    EXPECT_EQ(registry.getInteger("interval"), 1000);
    registry.set("interval", sv::config::OptionValue("not a number"));
    EXPECT_EQ(registry.getInteger("interval"), 16);

    registry.set("mode", sv::config::OptionValue("light"));
    EXPECT_EQ(registry.getString("mode"), "light");
    registry.set("mode", sv::config::OptionValue("sepia"));
    EXPECT_EQ(registry.getString("mode"), "dark");
}

TEST(OptionRegistry, IgnoresUnregisteredKeys)
{
    sv::config::OptionRegistry registry("test-app");
    registry.set("unknown", sv::config::OptionValue(true));
    EXPECT_TRUE(registry.get("unknown").isNull());
    EXPECT_EQ(registry.getInteger("unknown", 7), 7);
}

TEST(OptionRegistry, ListsOptionsSortedByKey)
{
    sv::config::OptionRegistry registry("test-app");
    registerSample(registry);

    auto options = registry.listRegisteredOptions();
    ASSERT_EQ(options.size(), 3u);
    EXPECT_EQ(options[0].key, "enabled");
    EXPECT_EQ(options[1].key, "interval");
    EXPECT_EQ(options[2].key, "mode");
}

TEST(OptionRegistry, PersistsValuesToDisk)
{
    sv::config::OptionRegistry registry("test-app");
    registerSample(registry);
    registry.set("interval", sv::config::OptionValue(std::int64_t{33}));
    registry.set("mode", sv::config::OptionValue("light"));

    const auto filePath = makeTempFilePath();
    ASSERT_TRUE(registry.saveToFile(filePath));

    sv::config::OptionRegistry loaded("test-app");
    registerSample(loaded);
    ASSERT_TRUE(loaded.loadFromFile(filePath));

    EXPECT_EQ(loaded.getInteger("interval"), 33);
    EXPECT_EQ(loaded.getString("mode"), "light");
    EXPECT_TRUE(loaded.getBool("enabled"));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, MalformedFileKeepsDefaultsAndLogs)
{
    const auto filePath = makeTempFilePath();
    {
        std::ofstream out(filePath);
        out << "{ \"interval\": ";
    }

    sv::config::OptionRegistry registry("test-app");
    registerSample(registry);
    std::vector<std::string> log;
    registry.setLogSink([&log](const std::string &entry)
                        { log.push_back(entry); });

    EXPECT_FALSE(registry.loadFromFile(filePath));
    EXPECT_EQ(registry.getInteger("interval"), 16);
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].rfind("[OPTIONS] ignoring", 0), 0u);

    EXPECT_FALSE(registry.loadFromFile(filePath.string() + ".missing"));

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, OutOfRangeFloatFallsBackToDefault)
{
    const auto filePath = makeTempFilePath();
    {
        std::ofstream out(filePath);
        out << "{ \"interval\": 1e300, \"enabled\": false }";
    }

    sv::config::OptionRegistry registry("test-app");
    registerSample(registry);

    EXPECT_TRUE(registry.loadFromFile(filePath));
    EXPECT_EQ(registry.getInteger("interval"), 16);
    EXPECT_FALSE(registry.getBool("enabled", true));

    {
        std::ofstream out(filePath, std::ios::trunc);
        out << "{ \"interval\": -1e300 }";
    }
    EXPECT_TRUE(registry.loadFromFile(filePath));
    EXPECT_EQ(registry.getInteger("interval"), 16);

    {
        std::ofstream out(filePath, std::ios::trunc);
        out << "{ \"interval\": 250.7 }";
    }
    EXPECT_TRUE(registry.loadFromFile(filePath));
    EXPECT_EQ(registry.getInteger("interval"), 250);

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}

TEST(OptionRegistry, DefaultPathLivesUnderConfigRoot)
{
    sv::config::OptionRegistry registry("sv-stream");
    auto path = registry.defaultOptionsPath();
    EXPECT_EQ(path.filename(), "defaults.json");
    EXPECT_EQ(path.parent_path().filename(), "sv-stream");
    EXPECT_EQ(path.parent_path().parent_path(), sv::config::OptionRegistry::configRoot());
}
