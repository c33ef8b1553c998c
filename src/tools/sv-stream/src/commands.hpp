#pragma once

#include "sv/commands/sv_stream.hpp"

inline constexpr unsigned short cmNewWindow = sv::commands::stream::NewWindow;
inline constexpr unsigned short cmReplayStream = sv::commands::stream::ReplayStream;
inline constexpr unsigned short cmStopStream = sv::commands::stream::StopStream;
inline constexpr unsigned short cmClearTranscript = sv::commands::stream::ClearTranscript;
inline constexpr unsigned short cmToggleFreeze = sv::commands::stream::ToggleFreeze;
inline constexpr unsigned short cmToggleTheme = sv::commands::stream::ToggleTheme;
inline constexpr unsigned short cmAbout = sv::commands::stream::About;
