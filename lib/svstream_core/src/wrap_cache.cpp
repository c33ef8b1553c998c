#include "sv/stream/wrap_cache.hpp"

#include "sv/stream/display_width.hpp"

namespace sv::stream
{
namespace
{
// Display width of text known to hold no escape sequences. Stops counting
// once `limit` is exceeded.
int plainWidth(std::string_view line, int limit) noexcept
{
    int width = 0;
    std::size_t index = 0;
    while (index < line.size() && width <= limit)
        width += codepointWidth(decodeCodepoint(line, index));
    return width;
}

void appendWrappedLine(std::string &out, std::string_view line, int width)
{
    if (line.size() <= static_cast<std::size_t>(width))
    {
        out.append(line);
        return;
    }

    bool escapes = containsEscape(line);
    if (!escapes && plainWidth(line, width) <= width)
    {
        out.append(line);
        return;
    }
    if (escapes && displayWidth(line) <= width)
    {
        out.append(line);
        return;
    }

    int column = 0;
    std::size_t index = 0;
    while (index < line.size())
    {
        std::size_t start = index;
        int glyphWidth = 0;
        if (std::size_t skip = escapeSequenceLength(line, index))
            index += skip;
        else
            glyphWidth = codepointWidth(decodeCodepoint(line, index));

        if (glyphWidth > 0 && column > 0 && column + glyphWidth > width)
        {
            out.push_back('\n');
            column = 0;
        }
        out.append(line.substr(start, index - start));
        column += glyphWidth;
    }
}

void appendWrapped(std::string &out, std::string_view text, int width)
{
    std::size_t lineStart = 0;
    while (true)
    {
        std::size_t newline = text.find('\n', lineStart);
        if (newline == std::string_view::npos)
        {
            appendWrappedLine(out, text.substr(lineStart), width);
            return;
        }
        appendWrappedLine(out, text.substr(lineStart, newline - lineStart), width);
        out.push_back('\n');
        lineStart = newline + 1;
    }
}
} // namespace

std::string wrapText(std::string_view text, int width)
{
    if (width <= 0)
        return std::string(text);

    std::string result;
    result.reserve(text.size() + text.size() / static_cast<std::size_t>(width) * 2);
    appendWrapped(result, text, width);
    return result;
}

const std::string &WrapCache::recompute(std::string_view content, int width)
{
    bool sameWidth = valid_ && width == width_;
    bool grown = sameWidth && content.size() >= lastContentLen_;

    if (grown && content.size() == lastContentLen_)
    {
        lastPass_ = Pass::Hit;
        ++stats_.hits;
        return wrapped_;
    }

    if (width <= kBypassWidth)
    {
        if (grown)
            wrapped_.append(content.substr(lastContentLen_));
        else
            wrapped_.assign(content);
        lastPass_ = Pass::Bypass;
        ++stats_.bypasses;
    }
    else if (grown)
    {
        // Re-wrap from the start of the last unterminated line. When the
        // previous content ended in '\n' this is exactly the new suffix.
        wrapFrom(content, width);
        lastPass_ = Pass::Incremental;
        ++stats_.incrementalWraps;
    }
    else
    {
        wrapped_.clear();
        tailContentStart_ = 0;
        tailWrappedStart_ = 0;
        wrapFrom(content, width);
        lastPass_ = Pass::Full;
        ++stats_.fullWraps;
    }

    width_ = width;
    valid_ = true;
    lastContentLen_ = content.size();
    lastWrappedLen_ = wrapped_.size();
    return wrapped_;
}

void WrapCache::invalidate() noexcept
{
    wrapped_.clear();
    lastContentLen_ = 0;
    lastWrappedLen_ = 0;
    tailContentStart_ = 0;
    tailWrappedStart_ = 0;
    valid_ = false;
    lastPass_ = Pass::None;
}

void WrapCache::wrapFrom(std::string_view content, int width)
{
    wrapped_.resize(tailWrappedStart_);
    std::string_view pending = content.substr(tailContentStart_);

    std::size_t lastBreak = pending.rfind('\n');
    if (lastBreak != std::string_view::npos)
    {
        appendWrapped(wrapped_, pending.substr(0, lastBreak + 1), width);
        tailContentStart_ += lastBreak + 1;
        tailWrappedStart_ = wrapped_.size();
        pending.remove_prefix(lastBreak + 1);
    }
    appendWrapped(wrapped_, pending, width);
}

} // namespace sv::stream
