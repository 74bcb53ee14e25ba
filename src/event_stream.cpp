#include "event_stream.hpp"

#include "json_fields.hpp"
#include "log_util.hpp"

#include <cstring>
#include <iostream>
#include <sstream>
#include <string>

namespace chatbot {
namespace {

static bool StartsWith(const std::string& s, const char* prefix) {
  const size_t n = std::strlen(prefix);
  return s.size() >= n && s.compare(0, n, prefix) == 0;
}

static std::string TrimAscii(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && (s[start] == ' ' || s[start] == '\t' || s[start] == '\r' || s[start] == '\n')) start++;
  size_t end = s.size();
  while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r' || s[end - 1] == '\n')) end--;
  return s.substr(start, end - start);
}

}  // namespace

StreamReconstruction ReconstructStreamText(const std::string& body) {
  StreamReconstruction out;
  std::istringstream iss(body);
  std::string line;
  while (std::getline(iss, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!StartsWith(line, kStreamDataPrefix)) continue;
    out.data_frames++;

    const auto payload = TrimAscii(line.substr(std::strlen(kStreamDataPrefix)));
    if (payload == kStreamDoneSentinel) {
      out.saw_done = true;
      continue;
    }

    bool malformed = false;
    auto content = ExtractDeltaContent(payload, &malformed);
    if (!content) {
      out.skipped_frames++;
      if (malformed) {
        std::cout << "[stream] skip malformed frame payload=" << TruncateForLog(payload, 200) << "\n";
      }
      continue;
    }
    out.content_frames++;
    out.text += *content;
  }
  return out;
}

}  // namespace chatbot
