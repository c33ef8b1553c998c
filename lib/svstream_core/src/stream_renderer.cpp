#include "sv/stream/stream_renderer.hpp"

#include "sv/stream/content_buffer.hpp"
#include "sv/stream/display_surface.hpp"

#include <atomic>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>

namespace sv::stream
{

struct StreamRenderer::State
{
    State(RendererSettings config, NowFn now)
        : settings(config),
          scheduler(config.updateInterval, std::move(now)),
          renderThread(std::this_thread::get_id())
    {
    }

    // Guards buffer, cache and the geometry/freeze fields.
    mutable std::mutex mutex;
    ContentBuffer buffer;
    WrapCache cache;
    int width = 0;
    int height = 0;
    bool ready = false;
    bool frozen = false;
    LogSink logSink;

    const RendererSettings settings;
    DebounceScheduler scheduler;
    std::atomic<std::thread::id> renderThread;
    std::atomic<std::size_t> surfaceUpdates{0};

    // Render thread only.
    DisplaySurface *surface = nullptr;
};

StreamRenderer::StreamRenderer(RendererSettings settings, NowFn now)
    : state_(std::make_shared<State>(settings, std::move(now)))
{
}

void StreamRenderer::attachSurface(DisplaySurface *surface)
{
    state_->surface = surface;
    if (surface)
        forceUpdate();
}

void StreamRenderer::bindRenderThread()
{
    state_->renderThread.store(std::this_thread::get_id(), std::memory_order_release);
}

void StreamRenderer::setLogSink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->logSink = std::move(sink);
}

void StreamRenderer::append(std::string_view text)
{
    bool ready = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->buffer.append(text))
            return;
        ready = state_->ready;
    }

    if (!ready || !onRenderThread())
    {
        state_->scheduler.markDirty();
        return;
    }

    if (state_->scheduler.requestUpdate())
        performUpdate(false);
}

void StreamRenderer::appendLine(std::string_view text)
{
    bool ready = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->buffer.appendLine(text);
        ready = state_->ready;
    }

    if (!ready || !onRenderThread())
    {
        state_->scheduler.markDirty();
        return;
    }

    if (state_->scheduler.requestUpdate())
        performUpdate(false);
}

void StreamRenderer::clear()
{
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        dropped = state_->buffer.size();
        state_->buffer.clear();
        state_->cache.invalidate();
        state_->frozen = false;
    }
    log("[CLEAR] dropped " + std::to_string(dropped) + " bytes");
    forceUpdate();
}

void StreamRenderer::setSize(int width, int height)
{
    int wrapWidth = width - state_->settings.wrapPadding;
    bool widthChanged = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (wrapWidth != state_->width)
        {
            state_->cache.invalidate();
            widthChanged = true;
        }
        state_->width = wrapWidth;
        state_->height = height;
        state_->ready = true;
    }

    if (widthChanged)
    {
        std::ostringstream entry;
        entry << "[RESIZE] " << width << 'x' << height << " wrap width " << wrapWidth;
        if (wrapWidth <= WrapCache::kBypassWidth)
            entry << " (wrapping bypassed)";
        log(entry.str());
    }
    forceUpdate();
}

void StreamRenderer::setFrozen(bool frozen)
{
    bool wasFrozen = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        wasFrozen = state_->frozen;
        state_->frozen = frozen;
    }
    if (wasFrozen && !frozen)
        forceUpdate();
}

void StreamRenderer::forceUpdate()
{
    if (!ready() || !onRenderThread())
    {
        state_->scheduler.markDirty();
        return;
    }
    state_->scheduler.beginUpdate();
    performUpdate(true);
}

void StreamRenderer::flushIfDirty()
{
    if (!ready() || !onRenderThread())
        return;
    if (!state_->scheduler.beginFlush())
        return;
    performUpdate(false);
}

std::string StreamRenderer::content() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->buffer.snapshot();
}

std::string StreamRenderer::renderedView() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cache.wrapped();
}

bool StreamRenderer::ready() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->ready;
}

bool StreamRenderer::frozen() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->frozen;
}

bool StreamRenderer::dirty() const noexcept
{
    return state_->scheduler.dirty();
}

bool StreamRenderer::isAtBottom() const
{
    if (!onRenderThread() || !state_->surface)
        return true;
    return state_->surface->isAtBottom();
}

void StreamRenderer::scrollToBottom()
{
    if (onRenderThread() && state_->surface)
        state_->surface->scrollToBottom();
}

int StreamRenderer::wrapWidth() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->width;
}

std::size_t StreamRenderer::contentSize() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->buffer.size();
}

std::size_t StreamRenderer::lineCount() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->buffer.lineCount();
}

std::size_t StreamRenderer::surfaceUpdates() const noexcept
{
    return state_->surfaceUpdates.load(std::memory_order_acquire);
}

WrapCache::Stats StreamRenderer::wrapStats() const
{
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cache.stats();
}

const RendererSettings &StreamRenderer::settings() const noexcept
{
    return state_->settings;
}

bool StreamRenderer::onRenderThread() const
{
    return std::this_thread::get_id() == state_->renderThread.load(std::memory_order_acquire);
}

void StreamRenderer::performUpdate(bool force)
{
    std::string view;
    bool frozen = false;
    WrapCache::Pass pass = WrapCache::Pass::None;
    std::size_t contentSize = 0;
    int width = 0;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        const std::string &wrapped = state_->cache.recompute(state_->buffer.view(), state_->width);
        pass = state_->cache.lastPass();
        if (pass == WrapCache::Pass::Hit && !force)
            return;
        view = wrapped;
        frozen = state_->frozen;
        contentSize = state_->buffer.size();
        width = state_->width;
    }

    if (pass == WrapCache::Pass::Full && contentSize > 0)
        log("[REWRAP] full wrap of " + std::to_string(contentSize) + " bytes at width " +
            std::to_string(width));

    DisplaySurface *surface = state_->surface;
    if (!surface)
        return;
    surface->setContent(view);
    if (!frozen)
        surface->scrollToBottom();
    state_->surfaceUpdates.fetch_add(1, std::memory_order_acq_rel);
}

void StreamRenderer::log(const std::string &entry) const
{
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        sink = state_->logSink;
    }
    if (sink)
        sink(entry);
}

} // namespace sv::stream
