#pragma once

#include "sv/stream/debounce_scheduler.hpp"
#include "sv/stream/wrap_cache.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace sv::stream
{

class DisplaySurface;

struct RendererSettings
{
    std::chrono::milliseconds updateInterval = DebounceScheduler::kDefaultInterval;
    // Columns kept free on the right edge of the surface.
    int wrapPadding = 4;
};

// Buffer -> wrap -> display pipeline for streamed text.
//
// A StreamRenderer is a handle: copies share one state block, so a copy held
// by a producer thread and the one owned by the UI see the same buffer, cache
// and debounce state. The thread that constructs the renderer is its render
// thread and the only one that touches the attached surface. Calls from any
// other thread only append and leave the dirty flag for the next tick.
class StreamRenderer
{
public:
    using LogSink = std::function<void(const std::string &)>;
    using NowFn = DebounceScheduler::NowFn;

    explicit StreamRenderer(RendererSettings settings = {}, NowFn now = {});

    // Non-owning; the surface must outlive its attachment.
    void attachSurface(DisplaySurface *surface);
    void bindRenderThread();
    void setLogSink(LogSink sink);

    void append(std::string_view text);
    void appendLine(std::string_view text);
    void clear();

    void setSize(int width, int height);
    void setFrozen(bool frozen);

    void forceUpdate();
    void flushIfDirty();

    std::string content() const;
    std::string renderedView() const;

    bool ready() const;
    bool frozen() const;
    bool dirty() const noexcept;
    bool isAtBottom() const;
    void scrollToBottom();

    int wrapWidth() const;
    std::size_t contentSize() const;
    std::size_t lineCount() const;
    std::size_t surfaceUpdates() const noexcept;
    WrapCache::Stats wrapStats() const;
    const RendererSettings &settings() const noexcept;

private:
    struct State;

    bool onRenderThread() const;
    void performUpdate(bool force);
    void log(const std::string &entry) const;

    std::shared_ptr<State> state_;
};

} // namespace sv::stream
