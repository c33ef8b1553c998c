#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sv::stream
{

// Colour set for the transcript surface, as BIOS attributes (background in
// the high nibble). Passed by reference to the views that paint with it.
struct Theme
{
    std::string name;
    std::uint8_t text = 0x07;
    std::uint8_t frozenText = 0x08;
};

Theme darkTheme();
Theme lightTheme();

// Unknown names fall back to the dark theme.
Theme themeByName(std::string_view name);
std::vector<std::string> themeNames();

} // namespace sv::stream
