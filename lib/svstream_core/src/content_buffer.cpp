#include "sv/stream/content_buffer.hpp"

#include <algorithm>

namespace sv::stream
{

bool ContentBuffer::append(std::string_view text)
{
    if (text.empty())
        return false;
    content_.append(text);
    newlines_ += static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    return true;
}

bool ContentBuffer::appendLine(std::string_view text)
{
    content_.append(text);
    content_.push_back('\n');
    newlines_ += static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
    return true;
}

void ContentBuffer::clear() noexcept
{
    content_.clear();
    newlines_ = 0;
}

std::size_t ContentBuffer::lineCount() const noexcept
{
    if (content_.empty())
        return 0;
    // A trailing newline terminates the last line rather than starting one.
    return content_.back() == '\n' ? newlines_ : newlines_ + 1;
}

} // namespace sv::stream
