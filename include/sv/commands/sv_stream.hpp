#pragma once

#include <cstdint>

#include "sv/commands/common.hpp"

namespace sv::commands::stream
{

inline constexpr std::uint16_t NewWindow = 1000;
inline constexpr std::uint16_t ReplayStream = 1001;
inline constexpr std::uint16_t StopStream = 1002;
inline constexpr std::uint16_t ClearTranscript = 1003;
inline constexpr std::uint16_t ToggleFreeze = 1004;
inline constexpr std::uint16_t ToggleTheme = 1005;
inline constexpr std::uint16_t About = sv::commands::common::About;

} // namespace sv::commands::stream
