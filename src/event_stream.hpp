#pragma once

#include <cstddef>
#include <string>

namespace chatbot {

constexpr const char* kStreamDataPrefix = "data:";
constexpr const char* kStreamDoneSentinel = "[DONE]";

struct StreamReconstruction {
  std::string text;
  size_t data_frames = 0;
  size_t content_frames = 0;
  size_t skipped_frames = 0;
  bool saw_done = false;
};

// Concatenates the delta content of every "data:" line of a line-delimited
// event stream body, in arrival order. Frames that carry no content or do not
// parse are counted in skipped_frames and logged, never fatal.
StreamReconstruction ReconstructStreamText(const std::string& body);

}  // namespace chatbot
