#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sv::stream
{

// Append-only text store. Not synchronized: the owner serializes access.
class ContentBuffer
{
public:
    // Returns false when `text` is empty and nothing changed.
    bool append(std::string_view text);
    bool appendLine(std::string_view text);
    void clear() noexcept;

    std::string snapshot() const { return content_; }
    std::string_view view() const noexcept { return content_; }

    std::size_t size() const noexcept { return content_.size(); }
    bool empty() const noexcept { return content_.empty(); }
    std::size_t lineCount() const noexcept;

private:
    std::string content_;
    std::size_t newlines_ = 0;
};

} // namespace sv::stream
