#include "chat_types.hpp"

namespace chatbot {

const char* RoleName(ChatRole role) {
  switch (role) {
    case ChatRole::kUser:
      return "user";
    case ChatRole::kAssistant:
      return "assistant";
    case ChatRole::kSystem:
      return "system";
  }
  return "user";
}

std::optional<ChatRole> ParseRole(const std::string& name) {
  if (name == "user") return ChatRole::kUser;
  if (name == "assistant") return ChatRole::kAssistant;
  if (name == "system") return ChatRole::kSystem;
  return std::nullopt;
}

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnconfigured:
      return "unconfigured";
    case ErrorKind::kInvalidRequest:
      return "invalid_request";
    case ErrorKind::kProtocolError:
      return "protocol_error";
    case ErrorKind::kUpstreamTimeout:
      return "upstream_timeout";
    case ErrorKind::kParseFailure:
      return "parse_failure";
    case ErrorKind::kFallbackFailed:
      return "fallback_failed";
  }
  return "unknown";
}

}  // namespace chatbot
