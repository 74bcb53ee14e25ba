#include <gtest/gtest.h>
#include <httplib.h>

#include "config.hpp"
#include "transport/httplib_transport.hpp"

#include <chrono>
#include <string>
#include <thread>

using chatbot::CallError;
using chatbot::ErrorKind;
using chatbot::HttpCall;

class HttplibTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    server.Post("/base/ok", [this](const httplib::Request& req, httplib::Response& res) {
      seen_auth = req.get_header_value("Authorization");
      seen_body = req.body;
      res.status = 201;
      res.set_content(R"({"ok":true})", "application/json");
    });
    server.Post("/base/limited", [](const httplib::Request&, httplib::Response& res) {
      res.status = 429;
      res.set_content("slow down", "text/plain");
    });
    server.Post("/base/slow", [](const httplib::Request&, httplib::Response& res) {
      std::this_thread::sleep_for(std::chrono::seconds(2));
      res.set_content("late", "text/plain");
    });
    server.Post("/base/drip", [](const httplib::Request&, httplib::Response& res) {
      res.set_chunked_content_provider("text/event-stream", [](size_t, httplib::DataSink& sink) {
        for (int i = 0; i < 10; i++) {
          if (!sink.write(":\n", 2)) return false;
          std::this_thread::sleep_for(std::chrono::milliseconds(300));
        }
        sink.done();
        return true;
      });
    });

    port = server.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port, 0);
    listener = std::thread([this] { server.listen_after_bind(); });
    server.wait_until_ready();
  }

  void TearDown() override {
    server.stop();
    if (listener.joinable()) listener.join();
  }

  HttpCall MakeCall(const std::string& path, int timeout_seconds) const {
    HttpCall call;
    call.endpoint = chatbot::ParseHttpEndpoint("http://127.0.0.1:" + std::to_string(port) + "/base");
    call.path = path;
    call.headers = chatbot::BearerHeaders("sk-local");
    call.body = R"({"ping":1})";
    call.timeout_seconds = timeout_seconds;
    return call;
  }

  httplib::Server server;
  std::thread listener;
  int port = 0;
  std::string seen_auth;
  std::string seen_body;
};

TEST_F(HttplibTransportTest, SuccessReplyPassesThrough) {
  chatbot::HttplibTransport transport(5);
  CallError err;
  auto reply = transport.Post(MakeCall("/ok", 5), &err);
  ASSERT_TRUE(reply.has_value()) << err.message;
  EXPECT_EQ(reply->status, 201);
  EXPECT_EQ(reply->body, R"({"ok":true})");
  EXPECT_EQ(seen_auth, "Bearer sk-local");
  EXPECT_EQ(seen_body, R"({"ping":1})");
}

TEST_F(HttplibTransportTest, ErrorStatusIsAReplyNotAFailure) {
  chatbot::HttplibTransport transport(5);
  CallError err;
  auto reply = transport.Post(MakeCall("/limited", 5), &err);
  ASSERT_TRUE(reply.has_value()) << err.message;
  EXPECT_EQ(reply->status, 429);
  EXPECT_EQ(reply->body, "slow down");
}

TEST_F(HttplibTransportTest, StalledUpstreamTimesOut) {
  chatbot::HttplibTransport transport(5);
  CallError err;
  auto reply = transport.Post(MakeCall("/slow", 1), &err);
  EXPECT_FALSE(reply.has_value());
  EXPECT_EQ(err.kind, ErrorKind::kUpstreamTimeout);
}

TEST_F(HttplibTransportTest, DrippingStreamHitsTheCallDeadline) {
  chatbot::HttplibTransport transport(5);
  CallError err;
  const auto started = std::chrono::steady_clock::now();
  auto reply = transport.Post(MakeCall("/drip", 1), &err);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  EXPECT_FALSE(reply.has_value());
  EXPECT_EQ(err.kind, ErrorKind::kUpstreamTimeout);
  EXPECT_LT(elapsed, std::chrono::milliseconds(2500));
}

TEST_F(HttplibTransportTest, RefusedConnectionIsProtocolError) {
  httplib::Server closed;
  const int closed_port = closed.bind_to_any_port("127.0.0.1");
  ASSERT_GT(closed_port, 0);
  std::thread closed_listener([&closed] { closed.listen_after_bind(); });
  closed.wait_until_ready();
  closed.stop();
  closed_listener.join();

  HttpCall call = MakeCall("/ok", 5);
  call.endpoint.port = closed_port;
  chatbot::HttplibTransport transport(5);
  CallError err;
  auto reply = transport.Post(call, &err);
  EXPECT_FALSE(reply.has_value());
  EXPECT_EQ(err.kind, ErrorKind::kProtocolError);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
