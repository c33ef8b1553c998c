#pragma once

#include <string>

namespace sv::streamview
{

// Built-in demo transcript: long paragraphs, wide characters and ANSI
// coloured lines, so a replay exercises every wrapping path.
const std::string &sampleStreamText();

} // namespace sv::streamview
