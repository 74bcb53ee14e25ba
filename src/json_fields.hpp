#pragma once

#include <optional>
#include <string>

namespace chatbot {

// Lenient scan for "key": "value" in text that is not valid JSON. The first
// occurrence at or after `from` wins; the value is unescaped with
// UnescapeJsonText. Nested quoting beyond the covered escapes is not handled.
std::optional<std::string> ScanQuotedField(const std::string& text, const std::string& key, size_t from = 0);

// client_secret from a ChatKit session response. Accepts a string field or an
// object with a string "value".
std::optional<std::string> ExtractClientSecret(const std::string& body);

// Text carried by one stream frame payload: delta.content, or
// choices[i].delta.content for OpenAI chunk payloads. Sets *malformed when the
// payload neither decodes as JSON nor yields a lenient match.
std::optional<std::string> ExtractDeltaContent(const std::string& payload, bool* malformed);

// choices[0].message.content from a chat completion response.
std::optional<std::string> ExtractCompletionContent(const std::string& body);

}  // namespace chatbot
