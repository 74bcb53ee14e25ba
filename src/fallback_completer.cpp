#include "fallback_completer.hpp"

#include "json_fields.hpp"
#include "log_util.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace chatbot {

FallbackCompleter::FallbackCompleter(const GatewayConfig* cfg, HttpTransport* transport)
    : cfg_(cfg), transport_(transport) {}

std::string FallbackCompleter::BuildRequestBody(const std::vector<ChatMessage>& messages) const {
  nlohmann::json j;
  j["model"] = cfg_->fallback_model;
  j["messages"] = nlohmann::json::array();
  j["messages"].push_back({{"role", "system"}, {"content", cfg_->system_prompt}});
  for (const auto& m : messages) {
    j["messages"].push_back({{"role", RoleName(m.role)}, {"content", m.content}});
  }
  return j.dump();
}

std::optional<std::string> FallbackCompleter::Complete(const std::vector<ChatMessage>& messages, CallError* err) {
  std::cout << "[fallback] using chat completions model=" << cfg_->fallback_model << "\n";
  if (messages.empty()) {
    SetError(err, ErrorKind::kFallbackFailed, "Messages array is empty");
    return std::nullopt;
  }

  HttpCall call;
  call.endpoint = cfg_->fallback;
  call.path = "/v1/chat/completions";
  call.headers = BearerHeaders(cfg_->api_key);
  call.body = BuildRequestBody(messages);
  call.timeout_seconds = cfg_->timeouts.fallback_seconds;

  CallError transport_err;
  auto reply = transport_->Post(call, &transport_err);
  if (!reply) {
    SetError(err, ErrorKind::kFallbackFailed, "Fallback API error: " + transport_err.message);
    return std::nullopt;
  }
  if (!IsSuccessStatus(reply->status)) {
    std::cout << "[fallback] API error status=" << reply->status << " body=" << TruncateForLog(reply->body, 1000)
              << "\n";
    SetError(err, ErrorKind::kFallbackFailed, "Fallback API error: " + std::to_string(reply->status));
    return std::nullopt;
  }

  auto content = ExtractCompletionContent(reply->body);
  if (!content) {
    SetError(err, ErrorKind::kFallbackFailed, "Could not find content in response");
    return std::nullopt;
  }
  return content;
}

}  // namespace chatbot
