#include "sv/app_info.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace sv::appinfo
{
    namespace
    {

        constexpr std::array<ToolInfo, 1> kTools{{
            ToolInfo{
                "sv-stream",
                "sv-stream",
                "Stream View",
                "Watch streamed text wrap and scroll live in the terminal.",
                "Stream View plays a text stream into a scrolling transcript the way a model response arrives: "
                "chunk by chunk from a background producer, wrapped to the window width and redrawn at a "
                "steady frame rate. Scroll up to freeze the view while the stream keeps growing underneath, "
                "resize to re-wrap, and replay or clear the transcript at any time."},
        }};

    } // namespace

    std::span<const ToolInfo> tools() noexcept
    {
        return std::span<const ToolInfo>{kTools};
    }

    const ToolInfo *findTool(std::string_view id) noexcept
    {
        auto it = std::find_if(kTools.begin(), kTools.end(), [&](const ToolInfo &info)
                               { return info.id == id; });
        if (it == kTools.end())
            return nullptr;
        return &*it;
    }

    const ToolInfo &requireTool(std::string_view id)
    {
        if (const ToolInfo *info = findTool(id))
            return *info;
        throw std::runtime_error("Unknown tool id: " + std::string{id});
    }

} // namespace sv::appinfo
