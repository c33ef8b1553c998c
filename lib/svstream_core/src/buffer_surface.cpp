#include "sv/stream/display_surface.hpp"

#include <algorithm>

namespace sv::stream
{

BufferSurface::BufferSurface(int width, int height)
    : width_(std::max(0, width)), height_(std::max(0, height))
{
}

void BufferSurface::setContent(const std::string &text)
{
    rows_.clear();
    if (!text.empty())
    {
        std::size_t start = 0;
        while (true)
        {
            std::size_t newline = text.find('\n', start);
            if (newline == std::string::npos)
            {
                rows_.push_back(text.substr(start));
                break;
            }
            rows_.push_back(text.substr(start, newline - start));
            start = newline + 1;
        }
    }
    top_ = std::min(top_, maxTop());
    ++contentUpdates_;
}

void BufferSurface::scrollToBottom()
{
    top_ = maxTop();
}

bool BufferSurface::isAtBottom() const
{
    return top_ >= maxTop();
}

void BufferSurface::resize(int width, int height)
{
    width_ = std::max(0, width);
    height_ = std::max(0, height);
    top_ = std::min(top_, maxTop());
}

void BufferSurface::scrollTo(int row)
{
    top_ = std::clamp(row, 0, maxTop());
}

void BufferSurface::scrollBy(int rows)
{
    scrollTo(top_ + rows);
}

int BufferSurface::scrollPercent() const noexcept
{
    int limit = maxTop();
    if (limit <= 0)
        return 100;
    return top_ * 100 / limit;
}

std::vector<std::string> BufferSurface::visibleRows() const
{
    std::vector<std::string> visible;
    for (int y = 0; y < height_; ++y)
    {
        std::size_t index = static_cast<std::size_t>(top_ + y);
        if (index >= rows_.size())
            break;
        visible.push_back(rows_[index]);
    }
    return visible;
}

int BufferSurface::maxTop() const noexcept
{
    return std::max(0, static_cast<int>(rows_.size()) - height_);
}

} // namespace sv::stream
