#include "chatbot_router.hpp"

#include "log_util.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace chatbot {
namespace {

// Upstream text is not guaranteed to be UTF-8; invalid bytes become U+FFFD.
static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

static nlohmann::json MakeError(const std::string& message, ErrorKind kind) {
  nlohmann::json j;
  j["error"] = message;
  j["type"] = ErrorKindName(kind);
  return j;
}

static void LogRequestRaw(const httplib::Request& req) {
  std::cout << "[request] " << req.method << " " << req.path << "\n";
  for (const auto& it : req.headers) {
    std::cout << "  " << it.first << ": " << RedactHeaderValue(it.first, it.second) << "\n";
  }
  if (!req.body.empty()) {
    std::cout << "  body: " << TruncateForLog(SanitizeBodyForLog(req.body), 2000) << "\n";
  }
}

}  // namespace

std::optional<ChatRequest> ParseChatRequest(const std::string& body, std::string* err) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "invalid json body";
    return std::nullopt;
  }
  if (!j.contains("messages") || !j["messages"].is_array()) {
    if (err) *err = "missing field: messages";
    return std::nullopt;
  }

  ChatRequest out;
  for (const auto& m : j["messages"]) {
    if (!m.is_object()) {
      if (err) *err = "each message must be an object";
      return std::nullopt;
    }
    if (!m.contains("role") || !m["role"].is_string()) {
      if (err) *err = "missing field: role";
      return std::nullopt;
    }
    auto role = ParseRole(m["role"].get<std::string>());
    if (!role) {
      if (err) *err = "unsupported role: " + m["role"].get<std::string>();
      return std::nullopt;
    }
    ChatMessage cm;
    cm.role = *role;
    if (m.contains("content") && !m["content"].is_null()) {
      if (!m["content"].is_string()) {
        if (err) *err = "content must be a string";
        return std::nullopt;
      }
      cm.content = m["content"].get<std::string>();
    }
    out.messages.push_back(std::move(cm));
  }

  if (j.contains("sessionId") && j["sessionId"].is_string()) out.session_id = j["sessionId"].get<std::string>();
  return out;
}

RenderedResponse RenderOutcome(const DispatchOutcome& outcome, const std::string& workflow_id) {
  RenderedResponse out;
  if (outcome.ok()) {
    out.status = 200;
    out.body["content"] = outcome.content;
    out.body["workflowId"] = workflow_id;
    if (outcome.fallback()) out.body["fallback"] = true;
    return out;
  }
  out.status = outcome.error.kind == ErrorKind::kInvalidRequest ? 400 : 500;
  out.body = MakeError(outcome.error.message, outcome.error.kind);
  return out;
}

ChatbotRouter::ChatbotRouter(ChatOrchestrator* orchestrator) : orchestrator_(orchestrator) {}

void ChatbotRouter::HandleMessage(const httplib::Request& req, httplib::Response& res) {
  LogRequestRaw(req);
  std::string err;
  auto chat = ParseChatRequest(req.body, &err);
  if (!chat) return SendJson(&res, 400, MakeError(err, ErrorKind::kInvalidRequest));
  LogClientMessages(chat->session_id, chat->messages);

  const auto outcome = orchestrator_->Handle(*chat);
  const auto rendered = RenderOutcome(outcome, orchestrator_->WorkflowId());
  std::cout << "[response] status=" << rendered.status << " fallback=" << (outcome.fallback() ? 1 : 0) << "\n";
  SendJson(&res, rendered.status, rendered.body);
}

void ChatbotRouter::Register(httplib::Server* server) {
  server->Post(kChatbotMessagePath,
               [this](const httplib::Request& req, httplib::Response& res) { HandleMessage(req, res); });
}

}  // namespace chatbot
