#include "log_util.hpp"

#include "text_escape.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <iostream>

namespace chatbot {
namespace {

static std::string ToLowerAscii(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

}  // namespace

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

std::string RedactHeaderValue(const std::string& key, const std::string& value) {
  const auto k = ToLowerAscii(key);
  if (k == "authorization" || k == "proxy-authorization" || k == "api-key" || k == "api_key" || k == "x-api-key") {
    return "<redacted>";
  }
  return value;
}

std::string SanitizeBodyForLog(const std::string& body) {
  if (body.empty()) return {};
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) return body;
  if (j.is_object()) {
    for (const auto& key : {"api_key", "api-key", "authorization", "apiKey", "client_secret"}) {
      if (j.contains(key)) j.erase(key);
    }
  }
  return j.dump();
}

void LogClientMessages(const std::string& session_id, const std::vector<ChatMessage>& messages) {
  std::cout << "[client-message] session_id=" << (session_id.empty() ? "<new>" : session_id)
            << " count=" << messages.size() << "\n";
  for (const auto& m : messages) {
    std::cout << "  " << RoleName(m.role) << ": " << TruncateForLog(EscapeJsonText(m.content), 500) << "\n";
  }
}

}  // namespace chatbot
