#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sv::stream
{

// The scrollable widget that paints wrapped text. Only the render thread
// calls into a surface.
class DisplaySurface
{
public:
    virtual ~DisplaySurface() = default;

    virtual void setContent(const std::string &text) = 0;
    virtual void scrollToBottom() = 0;
    virtual bool isAtBottom() const = 0;
};

// In-memory surface: a row list and a scroll offset. Used for headless
// rendering.
class BufferSurface : public DisplaySurface
{
public:
    BufferSurface(int width, int height);

    void setContent(const std::string &text) override;
    void scrollToBottom() override;
    bool isAtBottom() const override;

    void resize(int width, int height);
    void scrollTo(int row);
    void scrollBy(int rows);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }
    int topRow() const noexcept { return top_; }
    int scrollPercent() const noexcept;
    const std::vector<std::string> &rows() const noexcept { return rows_; }
    std::vector<std::string> visibleRows() const;
    std::size_t contentUpdates() const noexcept { return contentUpdates_; }

private:
    int maxTop() const noexcept;

    std::vector<std::string> rows_;
    int width_ = 0;
    int height_ = 0;
    int top_ = 0;
    std::size_t contentUpdates_ = 0;
};

} // namespace sv::stream
