#include <gtest/gtest.h>

#include "sv/stream/theme.hpp"

TEST(Theme, LooksUpThemesByName)
{
    EXPECT_EQ(sv::stream::themeByName("dark").name, "dark");
    EXPECT_EQ(sv::stream::themeByName("light").name, "light");
    EXPECT_EQ(sv::stream::themeByName("light").text, sv::stream::lightTheme().text);
}

TEST(Theme, UnknownNameFallsBackToDark)
{
    auto theme = sv::stream::themeByName("solarized");
    EXPECT_EQ(theme.name, "dark");
    EXPECT_EQ(theme.text, sv::stream::darkTheme().text);
}

TEST(Theme, FrozenTextDiffersFromNormalText)
{
    for (const auto &name : sv::stream::themeNames())
    {
        auto theme = sv::stream::themeByName(name);
        EXPECT_EQ(theme.name, name);
        EXPECT_NE(theme.text, theme.frozenText) << name;
    }
}
