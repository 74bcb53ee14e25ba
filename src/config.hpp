#pragma once

#include <string>

namespace chatbot {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
};

struct HttpEndpoint {
  std::string scheme = "https";
  std::string host = "api.openai.com";
  int port = 443;
  std::string base_path;
};

struct TimeoutConfig {
  int connect_seconds = 30;
  int session_seconds = 30;
  int message_seconds = 60;
  int fallback_seconds = 60;
};

extern const char* const kDefaultWorkflowId;
extern const char* const kDefaultSystemPrompt;

struct GatewayConfig {
  HttpListenConfig listen;
  std::string api_key;
  std::string workflow_id = kDefaultWorkflowId;
  HttpEndpoint chatkit;
  HttpEndpoint fallback;
  std::string fallback_model = "gpt-4o-mini";
  std::string system_prompt = kDefaultSystemPrompt;
  std::string chatkit_beta = "chatkit_beta=v1";
  TimeoutConfig timeouts;
};

GatewayConfig LoadConfigFromEnv();

// Accepts "https://host[:port][/base]"; a missing scheme is taken as https.
HttpEndpoint ParseHttpEndpoint(const std::string& url);

std::string EndpointUrl(const HttpEndpoint& ep);

}  // namespace chatbot
