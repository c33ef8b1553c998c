#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sv::stream
{

// Hard-wraps every line of `text` whose display width exceeds `width` into
// `width`-column segments. Escape sequences take no columns and stay attached
// to the segment they occur in. A non-positive width returns `text` as is.
std::string wrapText(std::string_view text, int width);

class WrapCache
{
public:
    // Widths at or below this value are not wrapped at all.
    static constexpr int kBypassWidth = 20;

    enum class Pass
    {
        None,
        Hit,
        Full,
        Incremental,
        Bypass,
    };

    struct Stats
    {
        std::size_t hits = 0;
        std::size_t fullWraps = 0;
        std::size_t incrementalWraps = 0;
        std::size_t bypasses = 0;
    };

    // `content` must extend the content of the previous call unless the cache
    // was invalidated in between.
    const std::string &recompute(std::string_view content, int width);
    void invalidate() noexcept;

    bool valid() const noexcept { return valid_; }
    int width() const noexcept { return width_; }
    const std::string &wrapped() const noexcept { return wrapped_; }
    std::size_t lastContentLength() const noexcept { return lastContentLen_; }
    std::size_t lastWrappedLength() const noexcept { return lastWrappedLen_; }
    Pass lastPass() const noexcept { return lastPass_; }
    const Stats &stats() const noexcept { return stats_; }

private:
    void wrapFrom(std::string_view content, int width);

    std::string wrapped_;
    std::size_t lastContentLen_ = 0;
    std::size_t lastWrappedLen_ = 0;
    // Start of the last unterminated content line and of its wrapped form.
    std::size_t tailContentStart_ = 0;
    std::size_t tailWrappedStart_ = 0;
    int width_ = 0;
    bool valid_ = false;
    Pass lastPass_ = Pass::None;
    Stats stats_;
};

} // namespace sv::stream
