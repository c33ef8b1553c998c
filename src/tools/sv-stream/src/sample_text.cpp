#include "sample_text.hpp"

namespace sv::streamview
{

const std::string &sampleStreamText()
{
  static const std::string text =
      "Streaming responses arrive a few characters at a time. Each chunk is appended to the "
      "transcript buffer immediately, but the window only redraws at a fixed rate, so a fast "
      "producer never floods the terminal with repaints.\n"
      "\n"
      "Wrapping is incremental: lines that were already wrapped stay cached, and only the line "
      "that is still growing is wrapped again when new text arrives. Resize the window to force "
      "a full re-wrap at the new width.\n"
      "\n"
      "\x1b[1mStyled output\x1b[0m keeps its escape sequences; they take no columns when the "
      "text is measured, so \x1b[32mcoloured words\x1b[0m wrap exactly like plain ones.\n"
      "\n"
      "Wide characters take two columns each: "
      "\xe6\xb5\x81\xe5\xbc\x8f\xe8\xbe\x93\xe5\x87\xba\xe4\xbc\x9a\xe9\x80\x90\xe6\xad\xa5"
      "\xe5\x87\xba\xe7\x8e\xb0\xe5\x9c\xa8\xe7\xaa\x97\xe5\x8f\xa3\xe4\xb8\xad\xe3\x80\x82"
      " \xed\x95\x9c\xea\xb8\x80\xeb\x8f\x84 \xeb\x91\x90 \xec\xb9\xb8\xec\x9d\x84 "
      "\xec\xb0\xa8\xec\xa7\x80\xed\x95\xa9\xeb\x8b\x88\xeb\x8b\xa4.\n"
      "\n"
      "Scroll up while the stream is running: the view freezes where you left it and the "
      "transcript keeps growing underneath. Scroll back to the bottom, or toggle the freeze, "
      "to follow the output again.\n";
  return text;
}

} // namespace sv::streamview
