#include "json_fields.hpp"

#include "text_escape.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace chatbot {
namespace {

static bool IsJsonSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static std::optional<std::string> StringAt(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string()) return std::nullopt;
  return obj[key].get<std::string>();
}

static std::optional<std::string> DeltaContent(const nlohmann::json& holder) {
  if (!holder.is_object() || !holder.contains("delta")) return std::nullopt;
  return StringAt(holder["delta"], "content");
}

}  // namespace

std::optional<std::string> ScanQuotedField(const std::string& text, const std::string& key, size_t from) {
  const std::string needle = "\"" + key + "\"";
  size_t pos = text.find(needle, from);
  while (pos != std::string::npos) {
    size_t i = pos + needle.size();
    while (i < text.size() && IsJsonSpace(text[i])) i++;
    if (i < text.size() && text[i] == ':') {
      i++;
      while (i < text.size() && IsJsonSpace(text[i])) i++;
      if (i < text.size() && text[i] == '"') {
        const size_t start = i + 1;
        size_t end = start;
        while (end < text.size() && text[end] != '"') {
          if (text[end] == '\\') end++;
          end++;
        }
        if (end >= text.size()) return std::nullopt;
        return UnescapeJsonText(text.substr(start, end - start));
      }
    }
    pos = text.find(needle, pos + needle.size());
  }
  return std::nullopt;
}

std::optional<std::string> ExtractClientSecret(const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) return ScanQuotedField(body, "client_secret");
  if (!j.is_object() || !j.contains("client_secret")) return std::nullopt;
  const auto& secret = j["client_secret"];
  if (secret.is_string()) return secret.get<std::string>();
  if (secret.is_object()) return StringAt(secret, "value");
  return std::nullopt;
}

std::optional<std::string> ExtractDeltaContent(const std::string& payload, bool* malformed) {
  if (malformed) *malformed = false;
  auto j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded()) {
    const auto delta_pos = payload.find("\"delta\"");
    if (delta_pos != std::string::npos) {
      if (auto content = ScanQuotedField(payload, "content", delta_pos)) return content;
    }
    if (malformed) *malformed = true;
    return std::nullopt;
  }
  if (auto content = DeltaContent(j)) return content;
  if (j.is_object() && j.contains("choices") && j["choices"].is_array()) {
    for (const auto& choice : j["choices"]) {
      if (auto content = DeltaContent(choice)) return content;
    }
  }
  return std::nullopt;
}

std::optional<std::string> ExtractCompletionContent(const std::string& body) {
  auto jr = nlohmann::json::parse(body, nullptr, false);
  if (jr.is_discarded()) return ScanQuotedField(body, "content");
  if (!jr.is_object() || !jr.contains("choices") || !jr["choices"].is_array() || jr["choices"].empty() ||
      !jr["choices"][0].is_object() || !jr["choices"][0].contains("message")) {
    return std::nullopt;
  }
  return StringAt(jr["choices"][0]["message"], "content");
}

}  // namespace chatbot
