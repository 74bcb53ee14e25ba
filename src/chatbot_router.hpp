#pragma once

#include "chat_orchestrator.hpp"
#include "chat_types.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace chatbot {

constexpr const char* kChatbotMessagePath = "/api/chatbot/message";

// Decodes {messages:[{role, content}], sessionId?}. Returns nullopt and sets
// *err for anything that is not that shape. An empty messages array is
// accepted here and rejected by the orchestrator.
std::optional<ChatRequest> ParseChatRequest(const std::string& body, std::string* err);

struct RenderedResponse {
  int status = 200;
  nlohmann::json body;
};

RenderedResponse RenderOutcome(const DispatchOutcome& outcome, const std::string& workflow_id);

class ChatbotRouter {
 public:
  explicit ChatbotRouter(ChatOrchestrator* orchestrator);
  void Register(httplib::Server* server);

  void HandleMessage(const httplib::Request& req, httplib::Response& res);

 private:
  ChatOrchestrator* orchestrator_;
};

}  // namespace chatbot
