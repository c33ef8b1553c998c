#include "stream_options.hpp"

#include "sv/stream/theme.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace sv::streamview
{

void registerStreamOptions(config::OptionRegistry &registry)
{
  config::OptionDefinition interval{kOptionUpdateIntervalMs, config::OptionKind::Integer,
                                    config::OptionValue(std::int64_t{16}), "Update Interval",
                                    "Minimum milliseconds between transcript redraws while streaming."};
  interval.minValue = 1;
  interval.maxValue = 1000;
  registry.registerOption(interval);

  config::OptionDefinition padding{kOptionWrapPadding, config::OptionKind::Integer,
                                   config::OptionValue(std::int64_t{4}), "Wrap Padding",
                                   "Columns left free at the right edge when wrapping."};
  padding.minValue = 0;
  padding.maxValue = 40;
  registry.registerOption(padding);

  config::OptionDefinition delay{kOptionChunkDelayMs, config::OptionKind::Integer,
                                 config::OptionValue(std::int64_t{15}), "Chunk Delay",
                                 "Milliseconds between streamed chunks."};
  delay.minValue = 0;
  delay.maxValue = 5000;
  registry.registerOption(delay);

  registry.registerOption({kOptionFreezeOnScroll, config::OptionKind::Boolean,
                           config::OptionValue(true), "Freeze On Scroll",
                           "Stop following new output while scrolled away from the bottom."});

  config::OptionDefinition theme{kOptionTheme, config::OptionKind::String,
                                 config::OptionValue("dark"), "Theme",
                                 "Transcript colour theme."};
  theme.choices = stream::themeNames();
  registry.registerOption(theme);

  registry.registerOption({kOptionLogFile, config::OptionKind::String,
                           config::OptionValue(std::string()), "Log File",
                           "Append renderer and stream events to this file; empty disables logging."});
}

std::vector<std::string> loadStreamOptions(config::OptionRegistry &registry,
                                           const std::filesystem::path &path)
{
  std::vector<std::string> entries;
  registry.setLogSink([&entries](const std::string &entry)
                      { entries.push_back(entry); });
  registry.loadFromFile(path);
  registry.setLogSink(nullptr);
  return entries;
}

stream::RendererSettings rendererSettings(const config::OptionRegistry &registry)
{
  stream::RendererSettings settings;
  settings.updateInterval = std::chrono::milliseconds(registry.getInteger(kOptionUpdateIntervalMs, 16));
  settings.wrapPadding = static_cast<int>(registry.getInteger(kOptionWrapPadding, 4));
  return settings;
}

stream::StreamProducer::Settings producerSettings(const config::OptionRegistry &registry)
{
  stream::StreamProducer::Settings settings;
  settings.chunkDelay = std::chrono::milliseconds(registry.getInteger(kOptionChunkDelayMs, 15));
  return settings;
}

} // namespace sv::streamview
