#include "chat_orchestrator.hpp"
#include "chatbot_router.hpp"
#include "config.hpp"
#include "transport/httplib_transport.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <string>

int main() {
  std::cout.setf(std::ios::unitbuf);
  const auto cfg = chatbot::LoadConfigFromEnv();

  std::cout << "[gateway] workflow=" << cfg.workflow_id
            << " api_key=" << (cfg.api_key.empty() ? "<missing>" : "<configured>") << "\n";
  std::cout << "[gateway] chatkit endpoint=" << chatbot::EndpointUrl(cfg.chatkit) << "\n";
  std::cout << "[gateway] fallback endpoint=" << chatbot::EndpointUrl(cfg.fallback) << " model=" << cfg.fallback_model
            << "\n";
  std::cout << "[gateway] timeouts connect=" << cfg.timeouts.connect_seconds << "s session=" << cfg.timeouts.session_seconds
            << "s message=" << cfg.timeouts.message_seconds << "s fallback=" << cfg.timeouts.fallback_seconds << "s\n";

  chatbot::HttplibTransport transport(cfg.timeouts.connect_seconds);
  chatbot::ChatOrchestrator orchestrator(&cfg, &transport);
  chatbot::ChatbotRouter router(&orchestrator);

  httplib::Server server;
  router.Register(&server);

  server.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
      }
    }
    std::cout << "[http] unhandled exception: " << message << "\n";
    nlohmann::json j;
    j["error"] = message;
    j["type"] = "server_error";
    res.status = 500;
    res.set_content(j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    nlohmann::json j;
    j["error"] = res.status == 404 ? "not found" : "bad request";
    j["type"] = "invalid_request";
    res.set_content(j.dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  return ok ? 0 : 1;
}
