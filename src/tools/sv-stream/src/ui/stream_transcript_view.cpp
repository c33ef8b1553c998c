#include "stream_transcript_view.hpp"

#include <algorithm>
#include <utility>

StreamTranscriptView::StreamTranscriptView(const TRect &bounds, TScrollBar *vScroll,
                                           const sv::stream::Theme &theme)
    : TScroller(bounds, nullptr, vScroll), theme(theme)
{
  options |= ofFirstClick;
  growMode = gfGrowHiX | gfGrowHiY;
  setLimit(1, 1);
}

void StreamTranscriptView::setContent(const std::string &text)
{
  rows.clear();
  int widest = 1;
  std::size_t start = 0;
  while (start <= text.size() && !text.empty())
  {
    std::size_t newline = text.find('\n', start);
    std::size_t end = newline == std::string::npos ? text.size() : newline;
    DisplayRow row;
    row.text = text.substr(start, end - start);
    row.glyphs = sv::stream::segmentGlyphs(row.text);
    widest = std::max(widest, sv::stream::displayWidth(row.text));
    rows.push_back(std::move(row));
    if (newline == std::string::npos)
      break;
    start = newline + 1;
  }

  programmaticScroll_ = true;
  setLimit(widest, std::max<int>(1, static_cast<int>(rows.size())));
  programmaticScroll_ = false;
  drawView();
}

void StreamTranscriptView::scrollToBottom()
{
  int totalRows = std::max<int>(1, static_cast<int>(rows.size()));
  programmaticScroll_ = true;
  scrollTo(delta.x, std::max(0, totalRows - size.y));
  programmaticScroll_ = false;
}

bool StreamTranscriptView::isAtBottom() const
{
  int maxDelta = std::max(0, limit.y - size.y);
  return delta.y >= maxDelta;
}

void StreamTranscriptView::setFrozenIndicator(bool frozen)
{
  if (frozen_ == frozen)
    return;
  frozen_ = frozen;
  drawView();
}

void StreamTranscriptView::setUserScrollCallback(std::function<void(bool)> cb)
{
  userScrollCallback = std::move(cb);
}

void StreamTranscriptView::setResizeCallback(std::function<void(int, int)> cb)
{
  resizeCallback = std::move(cb);
}

void StreamTranscriptView::draw()
{
  TColorAttr attr(frozen_ ? theme.frozenText : theme.text);
  int viewWidth = std::max(1, static_cast<int>(size.x));
  TDrawBuffer buffer;
  for (int y = 0; y < size.y; ++y)
  {
    buffer.moveChar(0, ' ', attr, viewWidth);
    std::size_t rowIndex = static_cast<std::size_t>(delta.y + y);
    if (rowIndex < rows.size())
    {
      // The screen cannot interpret escape sequences; paint the printable
      // glyphs only, starting at the horizontal scroll offset.
      const auto &row = rows[rowIndex];
      sv::stream::VisibleSpan span =
          sv::stream::clipToColumns(row.text, row.glyphs, delta.x, viewWidth);
      if (!span.text.empty())
        buffer.moveStr(static_cast<ushort>(span.column), TStringView(span.text), attr,
                       static_cast<ushort>(span.columns));
    }
    writeLine(0, y, viewWidth, 1, buffer);
  }

  if (vScrollBar)
    vScrollBar->drawView();
}

void StreamTranscriptView::changeBounds(const TRect &bounds)
{
  TScroller::changeBounds(bounds);
  if (resizeCallback)
    resizeCallback(size.x, size.y);
  if (vScrollBar)
    vScrollBar->drawView();
}

void StreamTranscriptView::handleEvent(TEvent &event)
{
  TPoint before = delta;
  TScroller::handleEvent(event);
  // Scroll bar broadcasts raised by setLimit/scrollTo arrive here too.
  if (programmaticScroll_)
    return;
  if ((before.x != delta.x || before.y != delta.y) && userScrollCallback)
    userScrollCallback(isAtBottom());
}
