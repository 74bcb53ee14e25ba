#include "message_dispatcher.hpp"

#include "event_stream.hpp"
#include "log_util.hpp"

#include <nlohmann/json.hpp>

#include <iostream>

namespace chatbot {

MessageDispatcher::MessageDispatcher(const GatewayConfig* cfg, HttpTransport* transport)
    : cfg_(cfg), transport_(transport) {}

std::optional<std::string> MessageDispatcher::Send(const std::string& client_secret,
                                                   const std::vector<ChatMessage>& messages,
                                                   CallError* err) {
  if (messages.empty()) {
    SetError(err, ErrorKind::kInvalidRequest, "Messages array is empty");
    return std::nullopt;
  }
  std::cout << "[chatkit] send message\n";

  nlohmann::json j;
  j["content"] = messages.back().content;
  j["role"] = "user";

  HttpCall call;
  call.endpoint = cfg_->chatkit;
  call.path = "/v1/chatkit/messages";
  call.headers = BearerHeaders(client_secret, cfg_->chatkit_beta);
  call.headers.emplace_back("Accept", "text/event-stream");
  call.body = j.dump();
  call.timeout_seconds = cfg_->timeouts.message_seconds;

  auto reply = transport_->Post(call, err);
  if (!reply) return std::nullopt;
  if (!IsSuccessStatus(reply->status)) {
    std::cout << "[chatkit] message API failed status=" << reply->status
              << " body=" << TruncateForLog(reply->body, 1000) << "\n";
    SetError(err, ErrorKind::kProtocolError, "ChatKit message API failed: " + std::to_string(reply->status));
    return std::nullopt;
  }

  auto stream = ReconstructStreamText(reply->body);
  std::cout << "[stream] frames=" << stream.data_frames << " content=" << stream.content_frames
            << " skipped=" << stream.skipped_frames << " done=" << (stream.saw_done ? 1 : 0) << "\n";
  if (stream.text.empty()) return std::string(kEmptyReplyPlaceholder);
  return stream.text;
}

}  // namespace chatbot
