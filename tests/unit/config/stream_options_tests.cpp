#include <gtest/gtest.h>

#include "stream_options.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace std::chrono_literals;

TEST(StreamOptions, DefaultsMatchRendererDefaults)
{
    sv::config::OptionRegistry registry("sv-stream-test");
    sv::streamview::registerStreamOptions(registry);

    auto renderer = sv::streamview::rendererSettings(registry);
    EXPECT_EQ(renderer.updateInterval, 16ms);
    EXPECT_EQ(renderer.wrapPadding, 4);

    auto producer = sv::streamview::producerSettings(registry);
    EXPECT_EQ(producer.chunkDelay, 15ms);

    EXPECT_TRUE(registry.getBool(sv::streamview::kOptionFreezeOnScroll));
    EXPECT_EQ(registry.getString(sv::streamview::kOptionTheme), "dark");
    EXPECT_EQ(registry.getString(sv::streamview::kOptionLogFile), "");
}

TEST(StreamOptions, OverridesReachSettings)
{
    sv::config::OptionRegistry registry("sv-stream-test");
    sv::streamview::registerStreamOptions(registry);
    registry.set(sv::streamview::kOptionUpdateIntervalMs, sv::config::OptionValue(std::int64_t{33}));
    registry.set(sv::streamview::kOptionWrapPadding, sv::config::OptionValue(std::int64_t{0}));
    registry.set(sv::streamview::kOptionChunkDelayMs, sv::config::OptionValue(std::int64_t{0}));

    EXPECT_EQ(sv::streamview::rendererSettings(registry).updateInterval, 33ms);
    EXPECT_EQ(sv::streamview::rendererSettings(registry).wrapPadding, 0);
    EXPECT_EQ(sv::streamview::producerSettings(registry).chunkDelay, 0ms);
}

TEST(StreamOptions, RejectsUnknownTheme)
{
    sv::config::OptionRegistry registry("sv-stream-test");
    sv::streamview::registerStreamOptions(registry);
    registry.set(sv::streamview::kOptionTheme, sv::config::OptionValue("light"));
    EXPECT_EQ(registry.getString(sv::streamview::kOptionTheme), "light");
    registry.set(sv::streamview::kOptionTheme, sv::config::OptionValue("neon"));
    EXPECT_EQ(registry.getString(sv::streamview::kOptionTheme), "dark");
}

TEST(StreamOptions, LoadReturnsEntriesLoggedBeforeTheLogFileIsKnown)
{
    const auto filePath = std::filesystem::temp_directory_path() / "sv_stream_options_load_test.json";
    {
        std::ofstream out(filePath);
        out << "{ \"logFile\": ";
    }

    sv::config::OptionRegistry registry("sv-stream-test");
    sv::streamview::registerStreamOptions(registry);
    std::vector<std::string> sinkEntries;
    registry.setLogSink([&sinkEntries](const std::string &entry)
                        { sinkEntries.push_back(entry); });

    auto entries = sv::streamview::loadStreamOptions(registry, filePath);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].rfind("[OPTIONS] ignoring", 0), 0u);
    EXPECT_TRUE(sinkEntries.empty());

    {
        std::ofstream out(filePath, std::ios::trunc);
        out << "{ \"logFile\": \"/tmp/sv-stream.log\", \"theme\": \"light\" }";
    }
    entries = sv::streamview::loadStreamOptions(registry, filePath);
    EXPECT_TRUE(entries.empty());
    EXPECT_EQ(registry.getString(sv::streamview::kOptionLogFile), "/tmp/sv-stream.log");
    EXPECT_EQ(registry.getString(sv::streamview::kOptionTheme), "light");

    std::error_code ec;
    std::filesystem::remove(filePath, ec);
}
