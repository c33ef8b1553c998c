#include "stream_app.hpp"
#include "../commands.hpp"
#include "stream_options.hpp"
#include "stream_window.hpp"
#include "sv/app_info.hpp"

#define Uses_TDeskTop
#define Uses_TKeys
#define Uses_TMenuItem
#define Uses_TSubMenu
#define Uses_TStatusItem
#define Uses_TStatusDef
#define Uses_MsgBox
#include <tvision/tv.h>

#include <algorithm>
#include <fstream>
#include <utility>
#include <vector>

namespace
{
  const sv::appinfo::ToolInfo &tool_info()
  {
    return sv::appinfo::requireTool("sv-stream");
  }
} // namespace

StreamApp::StreamApp(std::string sourceText)
    : TProgInit(&StreamApp::initStatusLine, &StreamApp::initMenuBar,
                &TApplication::initDeskTop),
      sourceText_(std::move(sourceText))
{
  optionRegistry_ = std::make_shared<sv::config::OptionRegistry>("sv-stream");
  sv::streamview::registerStreamOptions(*optionRegistry_);
  std::vector<std::string> loadEntries = sv::streamview::loadStreamOptions(
      *optionRegistry_, optionRegistry_->defaultOptionsPath());

  theme_ = sv::stream::themeByName(
      optionRegistry_->getString(sv::streamview::kOptionTheme, "dark"));
  std::string logFile =
      optionRegistry_->getString(sv::streamview::kOptionLogFile, std::string());
  if (!logFile.empty())
    logPath_ = logFile;
  optionRegistry_->setLogSink([this](const std::string &entry)
                              { appendLog(entry); });
  for (const auto &entry : loadEntries)
    appendLog(entry);

  appendLog("[OPTIONS] update interval " +
            std::to_string(optionRegistry_->getInteger(
                sv::streamview::kOptionUpdateIntervalMs, 16)) +
            " ms, theme " + theme_.name);

  openStreamWindow();
}

void StreamApp::registerWindow(StreamWindow *window)
{
  if (!window)
    return;
  windows.push_back(window);
}

void StreamApp::unregisterWindow(StreamWindow *window)
{
  auto it = std::remove(windows.begin(), windows.end(), window);
  windows.erase(it, windows.end());
}

void StreamApp::openStreamWindow()
{
  if (!deskTop)
    return;

  TRect bounds = deskTop->getExtent();
  bounds.grow(-2, -1);
  if (bounds.b.x <= bounds.a.x + 10 || bounds.b.y <= bounds.a.y + 5)
    bounds = TRect(0, 0, 70, 20);

  auto *window = new StreamWindow(
      *this, bounds, nextWindowNumber++, theme_,
      sv::streamview::rendererSettings(*optionRegistry_),
      optionRegistry_->getBool(sv::streamview::kOptionFreezeOnScroll, true));
  deskTop->insert(window);
  registerWindow(window);
  window->select();
  window->startStream(sourceText_,
                      sv::streamview::producerSettings(*optionRegistry_));
}

StreamWindow *StreamApp::activeWindow() const
{
  if (!deskTop)
    return nullptr;
  for (auto *window : windows)
  {
    if (window && deskTop->current == window)
      return window;
  }
  return windows.empty() ? nullptr : windows.back();
}

void StreamApp::replayActiveWindow()
{
  auto *window = activeWindow();
  if (!window)
  {
    openStreamWindow();
    return;
  }
  window->clearTranscript();
  window->startStream(sourceText_,
                      sv::streamview::producerSettings(*optionRegistry_));
}

void StreamApp::toggleTheme()
{
  const bool dark = theme_.name == sv::stream::darkTheme().name;
  theme_ = dark ? sv::stream::lightTheme() : sv::stream::darkTheme();

  sv::config::OptionValue desired(theme_.name);
  if (optionRegistry_->get(sv::streamview::kOptionTheme) != desired)
  {
    optionRegistry_->set(sv::streamview::kOptionTheme, desired);
    optionRegistry_->saveDefaults();
  }

  for (auto *window : windows)
  {
    if (window)
      window->themeChanged();
  }
}

void StreamApp::handleEvent(TEvent &event)
{
  TApplication::handleEvent(event);
  if (event.what == evCommand)
  {
    switch (event.message.command)
    {
    case cmNewWindow:
      openStreamWindow();
      clearEvent(event);
      break;
    case cmReplayStream:
      replayActiveWindow();
      clearEvent(event);
      break;
    case cmToggleTheme:
      toggleTheme();
      clearEvent(event);
      break;
    case cmAbout:
      showAboutDialog();
      clearEvent(event);
      break;
    default:
      break;
    }
  }
}

void StreamApp::idle()
{
  TApplication::idle();

  for (auto *window : windows)
  {
    if (window)
      window->processPendingUpdates();
  }
}

TMenuBar *StreamApp::initMenuBar(TRect r)
{
  r.b.y = r.a.y + 1;

  TSubMenu &fileMenu = *new TSubMenu("~F~ile", hcNoContext) +
                       *new TMenuItem("~N~ew Stream", cmNewWindow, kbCtrlN,
                                      hcNoContext, "Ctrl-N") +
                       *new TMenuItem("~C~lose Window", cmClose, kbAltF3,
                                      hcNoContext, "Alt-F3") +
                       newLine() +
                       *new TMenuItem("E~x~it", cmQuit, kbAltX, hcNoContext,
                                      "Alt-X");

  TSubMenu &streamMenu = *new TSubMenu("~S~tream", hcNoContext) +
                         *new TMenuItem("~R~eplay", cmReplayStream, kbF5,
                                        hcNoContext, "F5") +
                         *new TMenuItem("~S~top", cmStopStream, kbF8,
                                        hcNoContext, "F8") +
                         *new TMenuItem("~C~lear", cmClearTranscript, kbCtrlL,
                                        hcNoContext, "Ctrl-L");

  TSubMenu &viewMenu = *new TSubMenu("~V~iew", hcNoContext) +
                       *new TMenuItem("~F~reeze / Unfreeze", cmToggleFreeze,
                                      kbF7, hcNoContext, "F7") +
                       *new TMenuItem("Toggle ~T~heme", cmToggleTheme, kbNoKey,
                                      hcNoContext);

  TMenuItem &menuChain = fileMenu + streamMenu + viewMenu +
                         *new TSubMenu("~H~elp", hcNoContext) +
                         *new TMenuItem("~A~bout", cmAbout, kbNoKey,
                                        hcNoContext);

  return new TMenuBar(r, static_cast<TSubMenu &>(menuChain));
}

TStatusLine *StreamApp::initStatusLine(TRect r)
{
  r.a.y = r.b.y - 1;

  return new TStatusLine(
      r, *new TStatusDef(0, 0xFFFF) +
             *new TStatusItem("~F5~ Replay", kbF5, cmReplayStream) +
             *new TStatusItem("~F7~ Freeze", kbF7, cmToggleFreeze) +
             *new TStatusItem("~F8~ Stop", kbF8, cmStopStream) +
             *new TStatusItem("~Ctrl-L~ Clear", kbCtrlL, cmClearTranscript) +
             *new TStatusItem("~Alt-X~ Quit", kbAltX, cmQuit));
}

void StreamApp::showAboutDialog()
{
  const auto &info = tool_info();
  std::string text = "\003" + std::string(info.displayName) + "\n\n\003" +
                     std::string(info.shortDescription);
#ifdef SV_STREAM_VERSION
  text += "\n\003Version " SV_STREAM_VERSION;
#endif
  messageBox(text.c_str(), mfInformation | mfOKButton);
}

void StreamApp::appendLog(const std::string &text)
{
  if (logPath_.empty())
    return;
  std::lock_guard<std::mutex> lock(logMutex_);
  std::ofstream file(logPath_, std::ios::app);
  if (!file.is_open())
    return;
  file << text;
  if (!text.empty() && text.back() != '\n')
    file << '\n';
}
