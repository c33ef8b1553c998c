#include <gtest/gtest.h>

#include "sv/stream/content_buffer.hpp"

TEST(ContentBuffer, AppendsVerbatim)
{
    sv::stream::ContentBuffer buffer;
    EXPECT_TRUE(buffer.empty());

    EXPECT_TRUE(buffer.append("Hello"));
    EXPECT_TRUE(buffer.append(", world"));
    EXPECT_EQ(buffer.snapshot(), "Hello, world");
    EXPECT_EQ(buffer.view(), "Hello, world");
    EXPECT_EQ(buffer.size(), 12u);
}

TEST(ContentBuffer, EmptyAppendIsNoOp)
{
    sv::stream::ContentBuffer buffer;
    buffer.append("x");
    EXPECT_FALSE(buffer.append(""));
    EXPECT_EQ(buffer.size(), 1u);
}

TEST(ContentBuffer, CountsLines)
{
    sv::stream::ContentBuffer buffer;
    EXPECT_EQ(buffer.lineCount(), 0u);

    buffer.append("one");
    EXPECT_EQ(buffer.lineCount(), 1u);

    buffer.append("\ntwo\n");
    EXPECT_EQ(buffer.lineCount(), 2u);

    buffer.appendLine("three");
    EXPECT_EQ(buffer.snapshot(), "one\ntwo\nthree\n");
    EXPECT_EQ(buffer.lineCount(), 3u);

    buffer.appendLine("");
    EXPECT_EQ(buffer.lineCount(), 4u);
}

TEST(ContentBuffer, ClearResetsToEmpty)
{
    sv::stream::ContentBuffer buffer;
    buffer.appendLine("some text");
    buffer.clear();
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.snapshot(), "");
    EXPECT_EQ(buffer.lineCount(), 0u);

    buffer.append("again");
    EXPECT_EQ(buffer.snapshot(), "again");
}
