#include "sv/stream/theme.hpp"

namespace sv::stream
{

Theme darkTheme()
{
    return Theme{"dark", 0x07, 0x08};
}

Theme lightTheme()
{
    return Theme{"light", 0x70, 0x78};
}

Theme themeByName(std::string_view name)
{
    if (name == "light")
        return lightTheme();
    return darkTheme();
}

std::vector<std::string> themeNames()
{
    return {"dark", "light"};
}

} // namespace sv::stream
