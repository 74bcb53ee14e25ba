#pragma once

#include "chat_types.hpp"
#include "config.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chatbot {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpCall {
  HttpEndpoint endpoint;
  std::string path;
  HeaderList headers;
  std::string body;
  int timeout_seconds = 60;
};

struct HttpReply {
  int status = 0;
  std::string body;
};

// One outbound POST with a JSON body. Returns the reply for any status the
// upstream answered with; transport failures fill *err and return nullopt.
// timeout_seconds is a deadline for the whole call: running into it (connect,
// a stalled read, or a reply still streaming) is kUpstreamTimeout. Refused
// connections, resets and TLS failures before the deadline are
// kProtocolError.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual std::optional<HttpReply> Post(const HttpCall& call, CallError* err) = 0;
};

inline bool IsSuccessStatus(int status) {
  return status >= 200 && status < 300;
}

std::string JoinPath(const std::string& base, const std::string& path);

// Authorization: Bearer <token>, plus OpenAI-Beta when `beta` is set.
HeaderList BearerHeaders(const std::string& token, const std::string& beta = {});

}  // namespace chatbot
