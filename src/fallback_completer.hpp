#pragma once

#include "chat_types.hpp"
#include "config.hpp"
#include "transport/http_transport.hpp"

#include <optional>
#include <string>
#include <vector>

namespace chatbot {

// Secondary path: one non-streaming chat completion over the whole
// conversation, prefixed with the configured system instruction. Every
// failure is reported as kFallbackFailed.
class FallbackCompleter {
 public:
  FallbackCompleter(const GatewayConfig* cfg, HttpTransport* transport);

  std::optional<std::string> Complete(const std::vector<ChatMessage>& messages, CallError* err);

  std::string BuildRequestBody(const std::vector<ChatMessage>& messages) const;

 private:
  const GatewayConfig* cfg_;
  HttpTransport* transport_;
};

}  // namespace chatbot
