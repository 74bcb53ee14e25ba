#include "config.hpp"

#include <cstdlib>
#include <string>

namespace chatbot {

const char* const kDefaultWorkflowId = "wf_6907b12d71208190aebedcd7523c1d8d0a79856e2c61f448";

const char* const kDefaultSystemPrompt =
    "You are an AI Financial Copilot for PropLync.ai, a real estate investment platform. You help users analyze "
    "properties across Europe, calculate ROI for different rental strategies (Short-Term, Long-Term, Rent-to-Buy), "
    "understand local regulations, and find the best investment opportunities. Provide clear, actionable financial "
    "advice and insights. Be professional yet friendly.";

namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string TrimAscii(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && (s[start] == ' ' || s[start] == '\t' || s[start] == '\r' || s[start] == '\n')) start++;
  size_t end = s.size();
  while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' || s[end - 1] == '\r' || s[end - 1] == '\n')) end--;
  return s.substr(start, end - start);
}

static int GetEnvSeconds(const char* name, int fallback) {
  const auto v = GetEnvStr(name);
  if (v.empty()) return fallback;
  char* end = nullptr;
  long n = std::strtol(v.c_str(), &end, 10);
  if (end == v.c_str() || n <= 0) return fallback;
  if (n > 3600) n = 3600;
  return static_cast<int>(n);
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = ep.scheme == "http" ? 80 : 443;
  return ep;
}

std::string EndpointUrl(const HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port) + ep.base_path;
}

GatewayConfig LoadConfigFromEnv() {
  GatewayConfig cfg;

  if (auto host = GetEnvStr("CHATBOT_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  if (auto port = GetEnvStr("CHATBOT_LISTEN_PORT"); !port.empty()) cfg.listen.port = std::atoi(port.c_str());

  cfg.api_key = TrimAscii(GetEnvStr("OPENAI_API_KEY"));
  if (auto wf = GetEnvStr("CHATBOT_WORKFLOW_ID"); !wf.empty()) cfg.workflow_id = wf;

  if (auto base = GetEnvStr("CHATKIT_API_BASE"); !base.empty()) cfg.chatkit = ParseHttpEndpoint(base);
  if (auto base = GetEnvStr("CHATBOT_FALLBACK_API_BASE"); !base.empty()) cfg.fallback = ParseHttpEndpoint(base);
  if (auto model = GetEnvStr("CHATBOT_FALLBACK_MODEL"); !model.empty()) cfg.fallback_model = model;
  if (auto prompt = GetEnvStr("CHATBOT_SYSTEM_PROMPT"); !prompt.empty()) cfg.system_prompt = prompt;

  cfg.timeouts.connect_seconds = GetEnvSeconds("CHATBOT_CONNECT_TIMEOUT_S", cfg.timeouts.connect_seconds);
  cfg.timeouts.session_seconds = GetEnvSeconds("CHATBOT_SESSION_TIMEOUT_S", cfg.timeouts.session_seconds);
  cfg.timeouts.message_seconds = GetEnvSeconds("CHATBOT_MESSAGE_TIMEOUT_S", cfg.timeouts.message_seconds);
  cfg.timeouts.fallback_seconds = GetEnvSeconds("CHATBOT_FALLBACK_TIMEOUT_S", cfg.timeouts.fallback_seconds);

  return cfg;
}

}  // namespace chatbot
