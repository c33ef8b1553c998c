#include <gtest/gtest.h>

#include "sv/stream/display_width.hpp"

#include <string>

namespace
{

// "漢字"
const std::string kHanzi = "\xe6\xbc\xa2\xe5\xad\x97";

} // namespace

TEST(DisplayWidth, CountsAsciiColumns)
{
    EXPECT_EQ(sv::stream::displayWidth(""), 0);
    EXPECT_EQ(sv::stream::displayWidth("hello"), 5);
}

TEST(DisplayWidth, WideCharactersTakeTwoColumns)
{
    EXPECT_EQ(sv::stream::displayWidth(kHanzi), 4);
    EXPECT_EQ(sv::stream::displayWidth("a" + kHanzi + "b"), 6);
}

TEST(DisplayWidth, CombiningMarksTakeNoColumns)
{
    // e + COMBINING ACUTE ACCENT
    EXPECT_EQ(sv::stream::displayWidth("e\xcc\x81"), 1);
}

TEST(DisplayWidth, EscapeSequencesTakeNoColumns)
{
    const std::string csi = "\x1b[31mred\x1b[0m";
    EXPECT_EQ(sv::stream::escapeSequenceLength(csi, 0), 5u);
    EXPECT_EQ(sv::stream::displayWidth(csi), 3);
    EXPECT_TRUE(sv::stream::containsEscape(csi));

    const std::string osc = "\x1b]0;title\x07ok";
    EXPECT_EQ(sv::stream::escapeSequenceLength(osc, 0), 10u);
    EXPECT_EQ(sv::stream::displayWidth(osc), 2);

    const std::string twoByte = "\x1b" "7x";
    EXPECT_EQ(sv::stream::escapeSequenceLength(twoByte, 0), 2u);
    EXPECT_EQ(sv::stream::displayWidth(twoByte), 1);

    EXPECT_FALSE(sv::stream::containsEscape("plain"));
    EXPECT_EQ(sv::stream::escapeSequenceLength("plain", 0), 0u);
}

TEST(DisplayWidth, MalformedBytesTakeOneColumnEach)
{
    const std::string invalid = "a\x80\xff" "b";
    std::size_t index = 1;
    EXPECT_EQ(sv::stream::decodeCodepoint(invalid, index), 0xFFFDu);
    EXPECT_EQ(index, 2u);
    EXPECT_EQ(sv::stream::displayWidth(invalid), 4);

    // Truncated three-byte sequence.
    EXPECT_EQ(sv::stream::displayWidth("\xe6\xbc"), 2);
}

TEST(DisplayWidth, SegmentsGlyphsWithByteRanges)
{
    const std::string text = "a\x1b[1m" + kHanzi.substr(0, 3);
    auto glyphs = sv::stream::segmentGlyphs(text);
    ASSERT_EQ(glyphs.size(), 3u);

    EXPECT_EQ(glyphs[0].start, 0u);
    EXPECT_EQ(glyphs[0].end, 1u);
    EXPECT_EQ(glyphs[0].width, 1);

    EXPECT_TRUE(glyphs[1].escape);
    EXPECT_EQ(glyphs[1].width, 0);
    EXPECT_EQ(glyphs[1].end - glyphs[1].start, 4u);

    EXPECT_FALSE(glyphs[2].escape);
    EXPECT_EQ(glyphs[2].width, 2);
    EXPECT_EQ(glyphs[2].end, text.size());
}

TEST(DisplayWidth, ClipKeepsCombiningMarksWithTheirBase)
{
    // "e" + U+0301 COMBINING ACUTE ACCENT, then "x".
    const std::string text = "e\xcc\x81x";
    auto glyphs = sv::stream::segmentGlyphs(text);

    auto span = sv::stream::clipToColumns(text, glyphs, 0, 10);
    EXPECT_EQ(span.column, 0);
    EXPECT_EQ(span.columns, 2);
    EXPECT_EQ(span.text, text);

    // Scrolled past the base: the orphaned mark is not painted.
    span = sv::stream::clipToColumns(text, glyphs, 1, 10);
    EXPECT_EQ(span.column, 0);
    EXPECT_EQ(span.columns, 1);
    EXPECT_EQ(span.text, "x");

    // A mark with nothing before it is dropped as well.
    const std::string leading = "\xcc\x81" "ab";
    span = sv::stream::clipToColumns(leading, sv::stream::segmentGlyphs(leading), 0, 10);
    EXPECT_EQ(span.text, "ab");
}

TEST(DisplayWidth, ClipDropsEscapesAndControls)
{
    const std::string text = "a\x1b[31mb\tc";
    auto span = sv::stream::clipToColumns(text, sv::stream::segmentGlyphs(text), 0, 10);
    EXPECT_EQ(span.text, "abc");
    EXPECT_EQ(span.columns, 3);
}

TEST(DisplayWidth, ClipStopsAtTheRightEdge)
{
    const std::string text = "ab" + kHanzi;
    auto glyphs = sv::stream::segmentGlyphs(text);

    // The second wide glyph would straddle column 5.
    auto span = sv::stream::clipToColumns(text, glyphs, 0, 5);
    EXPECT_EQ(span.text, "ab" + kHanzi.substr(0, 3));
    EXPECT_EQ(span.columns, 4);

    // Half of the first wide glyph is scrolled off; painting starts after it.
    span = sv::stream::clipToColumns(text, glyphs, 3, 10);
    EXPECT_EQ(span.column, 1);
    EXPECT_EQ(span.text, kHanzi.substr(3));
}
