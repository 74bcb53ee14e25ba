#include "transport/http_transport.hpp"

namespace chatbot {

std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

HeaderList BearerHeaders(const std::string& token, const std::string& beta) {
  HeaderList out;
  out.emplace_back("Authorization", "Bearer " + token);
  if (!beta.empty()) out.emplace_back("OpenAI-Beta", beta);
  return out;
}

}  // namespace chatbot
