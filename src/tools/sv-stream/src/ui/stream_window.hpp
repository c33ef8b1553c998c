#pragma once

#define Uses_TWindow
#define Uses_TRect
#define Uses_TEvent
#include <tvision/tv.h>

#include "sv/stream/stream_producer.hpp"
#include "sv/stream/stream_renderer.hpp"
#include "sv/stream/theme.hpp"

#include <string>

class StreamApp;
class StreamTranscriptView;
class TScrollBar;

class StreamWindow : public TWindow
{
public:
    StreamWindow(StreamApp &owner, const TRect &bounds, int number,
                 const sv::stream::Theme &theme,
                 const sv::stream::RendererSettings &settings, bool freezeOnScroll);

    virtual void handleEvent(TEvent &event) override;
    virtual void sizeLimits(TPoint &min, TPoint &max) override;
    virtual void shutDown() override;

    void processPendingUpdates();
    void startStream(std::string text, const sv::stream::StreamProducer::Settings &settings);
    void stopStream();
    void clearTranscript();
    void toggleFreeze();
    void setFreezeOnScroll(bool enabled) noexcept { freezeOnScroll_ = enabled; }
    void refreshWindowTitle();
    void themeChanged();

private:
    void onTranscriptScrolled(bool atBottom);
    void onTranscriptResized(int width, int height);

    StreamApp &app;
    sv::stream::StreamRenderer renderer;
    sv::stream::StreamProducer producer;
    StreamTranscriptView *transcript = nullptr;
    TScrollBar *transcriptScrollBar = nullptr;
    bool freezeOnScroll_ = true;
    std::string lastWindowTitle_;
};
