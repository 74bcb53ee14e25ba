#pragma once

#include <string>

namespace chatbot {

// Escapes backslash, double quote, \n, \r and \t the way a JSON string
// literal spells them. Every other byte is copied through.
std::string EscapeJsonText(const std::string& s);

// Inverse of EscapeJsonText for the five sequences it emits. Any other
// escape sequence, and a dangling trailing backslash, is kept verbatim.
std::string UnescapeJsonText(const std::string& s);

}  // namespace chatbot
