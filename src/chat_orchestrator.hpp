#pragma once

#include "chat_types.hpp"
#include "config.hpp"
#include "fallback_completer.hpp"
#include "message_dispatcher.hpp"
#include "session_establisher.hpp"
#include "transport/http_transport.hpp"

namespace chatbot {

// Runs one inbound request: session, then primary dispatch, then the
// fallback completion if either of those failed. No call is made when the
// API key is missing or the request carries no messages.
class ChatOrchestrator {
 public:
  ChatOrchestrator(const GatewayConfig* cfg, HttpTransport* transport);

  DispatchOutcome Handle(const ChatRequest& req);

  const std::string& WorkflowId() const { return cfg_->workflow_id; }

 private:
  const GatewayConfig* cfg_;
  SessionEstablisher sessions_;
  MessageDispatcher dispatcher_;
  FallbackCompleter fallback_;
};

}  // namespace chatbot
