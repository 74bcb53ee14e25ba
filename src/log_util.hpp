#pragma once

#include "chat_types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace chatbot {

std::string TruncateForLog(std::string s, size_t max_chars);

// Replaces credential-bearing header values with "<redacted>".
std::string RedactHeaderValue(const std::string& key, const std::string& value);

// Drops credential keys from a JSON body; non-JSON bodies pass through.
std::string SanitizeBodyForLog(const std::string& body);

void LogClientMessages(const std::string& session_id, const std::vector<ChatMessage>& messages);

}  // namespace chatbot
