#pragma once

#include "transport/http_transport.hpp"

namespace chatbot {

class HttplibTransport : public HttpTransport {
 public:
  explicit HttplibTransport(int connect_timeout_seconds);

  std::optional<HttpReply> Post(const HttpCall& call, CallError* err) override;

 private:
  int connect_timeout_seconds_;
};

}  // namespace chatbot
