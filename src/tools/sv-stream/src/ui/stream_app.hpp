#pragma once

#define Uses_TApplication
#define Uses_TMenuBar
#define Uses_TStatusLine
#define Uses_TRect
#define Uses_TEvent
#include <tvision/tv.h>

#include "sv/options.hpp"
#include "sv/stream/theme.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class StreamWindow;

class StreamApp : public TApplication {
public:
  explicit StreamApp(std::string sourceText);

  virtual void handleEvent(TEvent &event) override;
  virtual void idle() override;

  static TMenuBar *initMenuBar(TRect r);
  static TStatusLine *initStatusLine(TRect r);

  void registerWindow(StreamWindow *window);
  void unregisterWindow(StreamWindow *window);
  void appendLog(const std::string &text);

  const sv::stream::Theme &theme() const noexcept { return theme_; }

private:
  void openStreamWindow();
  void replayActiveWindow();
  void toggleTheme();
  void showAboutDialog();
  StreamWindow *activeWindow() const;

  std::vector<StreamWindow *> windows;
  int nextWindowNumber = 1;
  std::string sourceText_;
  sv::stream::Theme theme_;
  std::filesystem::path logPath_;
  std::mutex logMutex_;
  std::shared_ptr<sv::config::OptionRegistry> optionRegistry_;
};
