#pragma once

#include <string>

namespace chatbot {

// prefix + "-" + hex(unix ms) + "-" + hex(random 64 bits). Unique per call,
// not meant to be unpredictable.
std::string NewId(const std::string& prefix);

}  // namespace chatbot
