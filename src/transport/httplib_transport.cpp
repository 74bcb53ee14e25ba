#include "transport/httplib_transport.hpp"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <memory>
#include <string>

namespace chatbot {
namespace {

constexpr int64_t kDeadlineSlackMs = 50;

// read/write timeouts bound a single socket operation; max_timeout bounds the
// whole call so a slowly dripping upstream cannot outlive timeout_seconds.
static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, int connect_seconds, int call_seconds) {
  auto cli = std::make_unique<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  cli->set_connection_timeout(connect_seconds);
  cli->set_read_timeout(call_seconds);
  cli->set_write_timeout(call_seconds);
  cli->set_max_timeout(static_cast<time_t>(call_seconds) * 1000);
  return cli;
}

// A Read/Write failure is a timeout only when the call ran into its deadline;
// earlier ones are resets or truncated replies.
static bool IsTimeout(httplib::Error e, int64_t elapsed_ms, int call_seconds) {
  if (e == httplib::Error::ConnectionTimeout) return true;
  if (e != httplib::Error::Read && e != httplib::Error::Write) return false;
  return elapsed_ms + kDeadlineSlackMs >= static_cast<int64_t>(call_seconds) * 1000;
}

}  // namespace

HttplibTransport::HttplibTransport(int connect_timeout_seconds) : connect_timeout_seconds_(connect_timeout_seconds) {}

std::optional<HttpReply> HttplibTransport::Post(const HttpCall& call, CallError* err) {
  const auto connect_seconds = std::min(connect_timeout_seconds_, call.timeout_seconds);
  auto cli = MakeClient(call.endpoint, connect_seconds, call.timeout_seconds);
  if (!cli->is_valid()) {
    SetError(err, ErrorKind::kProtocolError, "unsupported endpoint " + EndpointUrl(call.endpoint));
    return std::nullopt;
  }

  httplib::Headers headers;
  for (const auto& kv : call.headers) headers.emplace(kv.first, kv.second);

  const auto path = JoinPath(call.endpoint.base_path, call.path);
  const auto started = std::chrono::steady_clock::now();
  auto res = cli->Post(path, headers, call.body, "application/json");
  if (!res) {
    const auto e = res.error();
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
    if (IsTimeout(e, elapsed_ms, call.timeout_seconds)) {
      SetError(err, ErrorKind::kUpstreamTimeout,
               path + ": timed out after " + std::to_string(call.timeout_seconds) + "s");
    } else {
      SetError(err, ErrorKind::kProtocolError, path + ": " + httplib::to_string(e));
    }
    return std::nullopt;
  }
  HttpReply out;
  out.status = res->status;
  out.body = res->body;
  return out;
}

}  // namespace chatbot
