#pragma once

#include "chat_types.hpp"
#include "config.hpp"
#include "transport/http_transport.hpp"

#include <optional>
#include <string>
#include <vector>

namespace chatbot {

constexpr const char* kEmptyReplyPlaceholder = "I received your message but couldn't generate a response.";

// Primary path: sends the trailing message to the ChatKit messages endpoint
// with the session's client secret and rebuilds the streamed reply.
class MessageDispatcher {
 public:
  MessageDispatcher(const GatewayConfig* cfg, HttpTransport* transport);

  std::optional<std::string> Send(const std::string& client_secret,
                                  const std::vector<ChatMessage>& messages,
                                  CallError* err);

 private:
  const GatewayConfig* cfg_;
  HttpTransport* transport_;
};

}  // namespace chatbot
