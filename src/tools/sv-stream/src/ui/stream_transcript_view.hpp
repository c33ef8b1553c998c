#pragma once

#define Uses_TScroller
#define Uses_TScrollBar
#define Uses_TDrawBuffer
#define Uses_TEvent
#include <tvision/tv.h>

#include "sv/stream/display_surface.hpp"
#include "sv/stream/display_width.hpp"
#include "sv/stream/theme.hpp"

#include <functional>
#include <string>
#include <vector>

class StreamTranscriptView : public TScroller, public sv::stream::DisplaySurface
{
public:
    StreamTranscriptView(const TRect &bounds, TScrollBar *vScroll,
                         const sv::stream::Theme &theme);

    void setContent(const std::string &text) override;
    void scrollToBottom() override;
    bool isAtBottom() const override;

    void setFrozenIndicator(bool frozen);
    void setUserScrollCallback(std::function<void(bool)> cb);
    void setResizeCallback(std::function<void(int, int)> cb);

protected:
    virtual void draw() override;
    virtual void changeBounds(const TRect &bounds) override;
    virtual void handleEvent(TEvent &event) override;

private:
    struct DisplayRow
    {
        std::string text;
        std::vector<sv::stream::Glyph> glyphs;
    };

    const sv::stream::Theme &theme;
    std::vector<DisplayRow> rows;
    bool frozen_ = false;
    bool programmaticScroll_ = false;
    std::function<void(bool)> userScrollCallback;
    std::function<void(int, int)> resizeCallback;
};
