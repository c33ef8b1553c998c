#include "stream_window.hpp"
#include "stream_app.hpp"
#include "stream_transcript_view.hpp"
#include "../commands.hpp"

#define Uses_TScrollBar
#define Uses_TFrame
#include <tvision/tv.h>

#include <sstream>
#include <utility>

namespace
{
    constexpr int kScrollBarWidth = 1;
}

StreamWindow::StreamWindow(StreamApp &owner, const TRect &bounds, int number,
                           const sv::stream::Theme &theme,
                           const sv::stream::RendererSettings &settings, bool freezeOnScroll)
    : TWindowInit(&StreamWindow::initFrame),
      TWindow(bounds, "Stream", number),
      app(owner),
      renderer(settings),
      producer(renderer),
      freezeOnScroll_(freezeOnScroll)
{
    options |= ofTileable;

    TRect extent = getExtent();
    extent.grow(-1, -1);
    if (extent.b.x <= extent.a.x + kScrollBarWidth + 1)
        extent.b.x = static_cast<short>(extent.a.x + kScrollBarWidth + 2);

    TRect scrollRect(extent.b.x - kScrollBarWidth, extent.a.y, extent.b.x + 1, extent.b.y);
    transcriptScrollBar = new TScrollBar(scrollRect);
    transcriptScrollBar->growMode = gfGrowLoX | gfGrowHiX | gfGrowHiY;
    insert(transcriptScrollBar);

    TRect transcriptRect(extent.a.x, extent.a.y, extent.b.x - kScrollBarWidth, extent.b.y);
    transcript = new StreamTranscriptView(transcriptRect, transcriptScrollBar, theme);
    transcript->setUserScrollCallback([this](bool atBottom)
                                      { onTranscriptScrolled(atBottom); });
    transcript->setResizeCallback([this](int width, int height)
                                  { onTranscriptResized(width, height); });
    insert(transcript);

    auto log = [this](const std::string &entry)
    { app.appendLog(entry); };
    renderer.setLogSink(log);
    producer.setLogSink(log);

    renderer.attachSurface(transcript);
    renderer.setSize(transcript->size.x, transcript->size.y);
    refreshWindowTitle();
}

void StreamWindow::handleEvent(TEvent &event)
{
    if (event.what == evCommand)
    {
        switch (event.message.command)
        {
        case cmClearTranscript:
            clearTranscript();
            clearEvent(event);
            return;
        case cmToggleFreeze:
            toggleFreeze();
            clearEvent(event);
            return;
        case cmStopStream:
            stopStream();
            clearEvent(event);
            return;
        default:
            break;
        }
    }

    TWindow::handleEvent(event);

    if (transcriptScrollBar)
        transcriptScrollBar->drawView();
}

void StreamWindow::sizeLimits(TPoint &min, TPoint &max)
{
    TWindow::sizeLimits(min, max);
    constexpr short minWidth = 16;
    constexpr short minHeight = 6;
    if (min.x < minWidth)
        min.x = minWidth;
    if (min.y < minHeight)
        min.y = minHeight;
}

void StreamWindow::shutDown()
{
    producer.cancel();
    producer.setLogSink(nullptr);
    renderer.setLogSink(nullptr);
    renderer.attachSurface(nullptr);
    transcript = nullptr;
    app.unregisterWindow(this);
    TWindow::shutDown();
}

// Called from the application's idle loop on the UI thread.
void StreamWindow::processPendingUpdates()
{
    if (!transcript)
        return;

    renderer.flushIfDirty();
    if (producer.consumeFinished())
        renderer.forceUpdate();
    refreshWindowTitle();
}

void StreamWindow::startStream(std::string text, const sv::stream::StreamProducer::Settings &settings)
{
    producer.start(std::move(text), settings);
    refreshWindowTitle();
}

void StreamWindow::stopStream()
{
    if (!producer.running())
        return;
    producer.cancel();
    renderer.forceUpdate();
    refreshWindowTitle();
}

void StreamWindow::clearTranscript()
{
    producer.cancel();
    producer.consumeFinished();
    renderer.clear();
    if (transcript)
        transcript->setFrozenIndicator(false);
    refreshWindowTitle();
}

void StreamWindow::toggleFreeze()
{
    bool frozen = !renderer.frozen();
    renderer.setFrozen(frozen);
    if (transcript)
        transcript->setFrozenIndicator(frozen);
    refreshWindowTitle();
}

void StreamWindow::themeChanged()
{
    if (transcript)
        transcript->drawView();
}

void StreamWindow::refreshWindowTitle()
{
    std::ostringstream titleStream;
    titleStream << "Stream";
    if (producer.running())
        titleStream << " | streaming";
    if (renderer.frozen())
        titleStream << " | FROZEN";
    titleStream << " | " << renderer.lineCount() << " lines, " << renderer.contentSize() << " bytes";
    int wrapWidth = renderer.wrapWidth();
    if (wrapWidth <= sv::stream::WrapCache::kBypassWidth)
        titleStream << " | no wrap";
    else
        titleStream << " | wrap " << wrapWidth;

    std::string title = titleStream.str();
    if (title == lastWindowTitle_)
        return;
    lastWindowTitle_ = title;

    delete[] const_cast<char *>(this->title);
    this->title = newStr(title.c_str());
    if (frame)
        frame->drawView();
}

void StreamWindow::onTranscriptScrolled(bool atBottom)
{
    if (!freezeOnScroll_)
        return;

    bool frozen = renderer.frozen();
    if (!atBottom && !frozen)
    {
        renderer.setFrozen(true);
        transcript->setFrozenIndicator(true);
    }
    else if (atBottom && frozen)
    {
        renderer.setFrozen(false);
        transcript->setFrozenIndicator(false);
    }
    refreshWindowTitle();
}

void StreamWindow::onTranscriptResized(int width, int height)
{
    if (!transcript)
        return;
    renderer.setSize(width, height);
    refreshWindowTitle();
}
