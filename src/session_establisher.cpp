#include "session_establisher.hpp"

#include "ids.hpp"
#include "json_fields.hpp"
#include "log_util.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace chatbot {

SessionEstablisher::SessionEstablisher(const GatewayConfig* cfg, HttpTransport* transport)
    : cfg_(cfg), transport_(transport) {}

std::string SessionEstablisher::ResolveUserId(const std::string& session_id) {
  if (!session_id.empty()) return session_id;
  return NewId("user");
}

std::optional<std::string> SessionEstablisher::CreateClientSecret(const std::string& session_id, CallError* err) {
  const auto user_id = ResolveUserId(session_id);
  std::cout << "[chatkit] create session workflow=" << cfg_->workflow_id << " user=" << user_id << "\n";

  nlohmann::json j;
  j["workflow"] = {{"id", cfg_->workflow_id}};
  j["user"] = user_id;

  HttpCall call;
  call.endpoint = cfg_->chatkit;
  call.path = "/v1/chatkit/sessions";
  call.headers = BearerHeaders(cfg_->api_key, cfg_->chatkit_beta);
  call.body = j.dump();
  call.timeout_seconds = cfg_->timeouts.session_seconds;

  auto reply = transport_->Post(call, err);
  if (!reply) return std::nullopt;
  if (!IsSuccessStatus(reply->status)) {
    std::cout << "[chatkit] session creation failed status=" << reply->status
              << " body=" << TruncateForLog(reply->body, 1000) << "\n";
    SetError(err, ErrorKind::kProtocolError, "Session creation failed: " + std::to_string(reply->status));
    return std::nullopt;
  }

  auto secret = ExtractClientSecret(reply->body);
  if (!secret || secret->empty()) {
    SetError(err, ErrorKind::kParseFailure, "Could not find client_secret in response");
    return std::nullopt;
  }
  std::cout << "[chatkit] session created, client_secret obtained\n";
  return secret;
}

}  // namespace chatbot
