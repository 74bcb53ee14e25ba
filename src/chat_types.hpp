#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chatbot {

enum class ChatRole { kUser, kAssistant, kSystem };

const char* RoleName(ChatRole role);
std::optional<ChatRole> ParseRole(const std::string& name);

struct ChatMessage {
  ChatRole role = ChatRole::kUser;
  std::string content;
};

struct ChatRequest {
  std::vector<ChatMessage> messages;
  std::string session_id;
};

enum class ErrorKind {
  kUnconfigured,
  kInvalidRequest,
  kProtocolError,
  kUpstreamTimeout,
  kParseFailure,
  kFallbackFailed,
};

const char* ErrorKindName(ErrorKind kind);

struct CallError {
  ErrorKind kind = ErrorKind::kProtocolError;
  std::string message;
};

inline void SetError(CallError* err, ErrorKind kind, std::string message) {
  if (!err) return;
  err->kind = kind;
  err->message = std::move(message);
}

struct DispatchOutcome {
  enum class Kind { kPrimarySuccess, kFallbackSuccess, kTerminalFailure };

  Kind kind = Kind::kTerminalFailure;
  std::string content;
  CallError error;
  // Set when the primary path failed and the fallback was attempted.
  std::optional<CallError> primary_error;

  bool ok() const { return kind != Kind::kTerminalFailure; }
  bool fallback() const { return kind == Kind::kFallbackSuccess; }
};

}  // namespace chatbot
