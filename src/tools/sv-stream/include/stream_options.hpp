#pragma once

#include "sv/options.hpp"
#include "sv/stream/stream_producer.hpp"
#include "sv/stream/stream_renderer.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace sv::streamview
{

inline constexpr char kOptionUpdateIntervalMs[] = "updateIntervalMs";
inline constexpr char kOptionWrapPadding[] = "wrapPadding";
inline constexpr char kOptionChunkDelayMs[] = "chunkDelayMs";
inline constexpr char kOptionFreezeOnScroll[] = "freezeOnScroll";
inline constexpr char kOptionTheme[] = "theme";
inline constexpr char kOptionLogFile[] = "logFile";

void registerStreamOptions(config::OptionRegistry &registry);

// Loads saved options from `path`. The log file is itself an option, so
// entries the registry reports while loading are handed back to the caller
// instead of going to the registry's sink.
std::vector<std::string> loadStreamOptions(config::OptionRegistry &registry,
                                           const std::filesystem::path &path);

stream::RendererSettings rendererSettings(const config::OptionRegistry &registry);
stream::StreamProducer::Settings producerSettings(const config::OptionRegistry &registry);

} // namespace sv::streamview
