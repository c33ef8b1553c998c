#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sv::stream
{

// One terminal cell group: a code point (or an undecodable byte) or a whole
// escape sequence. Escape sequences occupy zero columns.
struct Glyph
{
    std::size_t start = 0;
    std::size_t end = 0;
    int width = 0;
    bool escape = false;
};

// Decodes the UTF-8 sequence at `index` and advances past it. Malformed input
// consumes a single byte and yields U+FFFD.
std::uint32_t decodeCodepoint(std::string_view text, std::size_t &index) noexcept;

// Column count of a code point: 0 for controls and combining marks, 2 for
// East Asian wide and emoji ranges, 1 otherwise.
int codepointWidth(std::uint32_t codepoint) noexcept;

// Length in bytes of the terminal escape sequence starting at `index`
// (CSI, OSC or a two-byte ESC sequence), or 0 when text[index] is not ESC.
std::size_t escapeSequenceLength(std::string_view text, std::size_t index) noexcept;

bool containsEscape(std::string_view text) noexcept;

int displayWidth(std::string_view text) noexcept;

std::vector<Glyph> segmentGlyphs(std::string_view text);

// The printable part of one row as it lands in a window `width` columns wide
// scrolled `offset` columns to the right. Escape sequences and controls are
// dropped; zero-width marks stay attached to the glyph they follow.
struct VisibleSpan
{
    int column = 0;
    int columns = 0;
    std::string text;
};

VisibleSpan clipToColumns(std::string_view text, const std::vector<Glyph> &glyphs,
                          int offset, int width);

} // namespace sv::stream
