#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace codetutor::utils {

// Number of code points in a UTF-8 string. Invalid bytes count as one each.
std::size_t Utf8Length(const std::string& text);

// Byte offset of the code point at `index`, or text.size() past the end.
std::size_t Utf8Offset(const std::string& text, std::size_t index);

// First `count` code points of `text`.
std::string Utf8Prefix(const std::string& text, std::size_t count);

std::vector<char32_t> Utf8Decode(const std::string& text);
std::string Utf8Encode(char32_t code_point);
std::string Utf8Encode(const std::vector<char32_t>& code_points);

bool IsAscii(const std::string& text);

}  // namespace codetutor::utils
