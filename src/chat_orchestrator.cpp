#include "chat_orchestrator.hpp"

#include <iostream>
#include <utility>

namespace chatbot {
namespace {

static DispatchOutcome Terminal(ErrorKind kind, std::string message) {
  DispatchOutcome out;
  out.kind = DispatchOutcome::Kind::kTerminalFailure;
  out.error.kind = kind;
  out.error.message = std::move(message);
  return out;
}

static bool IsBlank(const std::string& s) {
  for (char c : s) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
  }
  return true;
}

}  // namespace

ChatOrchestrator::ChatOrchestrator(const GatewayConfig* cfg, HttpTransport* transport)
    : cfg_(cfg), sessions_(cfg, transport), dispatcher_(cfg, transport), fallback_(cfg, transport) {}

DispatchOutcome ChatOrchestrator::Handle(const ChatRequest& req) {
  if (IsBlank(cfg_->api_key)) {
    std::cout << "[gateway] OPENAI_API_KEY is not configured\n";
    return Terminal(ErrorKind::kUnconfigured, "OpenAI API key not configured");
  }
  if (req.messages.empty()) {
    return Terminal(ErrorKind::kInvalidRequest, "Messages array is empty");
  }

  std::cout << "[gateway] processing message workflow=" << cfg_->workflow_id
            << " session=" << (req.session_id.empty() ? "new session" : req.session_id) << "\n";

  CallError primary_err;
  if (auto secret = sessions_.CreateClientSecret(req.session_id, &primary_err)) {
    if (auto content = dispatcher_.Send(*secret, req.messages, &primary_err)) {
      DispatchOutcome out;
      out.kind = DispatchOutcome::Kind::kPrimarySuccess;
      out.content = std::move(*content);
      std::cout << "[gateway] response received via ChatKit workflow\n";
      return out;
    }
  }

  std::cout << "[gateway] primary path failed kind=" << ErrorKindName(primary_err.kind)
            << " error=" << primary_err.message << "\n";

  CallError fallback_err;
  auto content = fallback_.Complete(req.messages, &fallback_err);
  if (!content) {
    std::cout << "[gateway] fallback also failed error=" << fallback_err.message << "\n";
    auto out = Terminal(ErrorKind::kFallbackFailed, fallback_err.message);
    out.primary_error = primary_err;
    return out;
  }

  DispatchOutcome out;
  out.kind = DispatchOutcome::Kind::kFallbackSuccess;
  out.content = std::move(*content);
  out.primary_error = primary_err;
  return out;
}

}  // namespace chatbot
