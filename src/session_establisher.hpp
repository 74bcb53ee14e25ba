#pragma once

#include "chat_types.hpp"
#include "config.hpp"
#include "transport/http_transport.hpp"

#include <optional>
#include <string>

namespace chatbot {

// Creates one ChatKit session per call and returns its client secret.
class SessionEstablisher {
 public:
  SessionEstablisher(const GatewayConfig* cfg, HttpTransport* transport);

  std::optional<std::string> CreateClientSecret(const std::string& session_id, CallError* err);

  // The caller's session id, or a fresh "user-..." id when it is empty.
  static std::string ResolveUserId(const std::string& session_id);

 private:
  const GatewayConfig* cfg_;
  HttpTransport* transport_;
};

}  // namespace chatbot
