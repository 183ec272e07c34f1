#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace scb {

// Source encodings tried when loading a file
enum class Encoding {
  Utf8,
  Windows1252,
  Latin1,
};

const char *toString(Encoding encoding);

// Decode bytes into UTF-8 text
// Returns false if the bytes are not valid in the given encoding
bool decodeToUtf8(std::span<const uint8_t> bytes, Encoding encoding, std::string &out);

// Append one code point as UTF-8
void appendUtf8(std::string &out, char32_t codepoint);

// Read the code point starting at pos and advance pos past it
// The input must be valid UTF-8 (as produced by decodeToUtf8)
char32_t nextCodepoint(std::string_view utf8, size_t &pos);

// Number of code points in valid UTF-8 text
size_t countCodepoints(std::string_view utf8);

// Approximation of "printable": rejects controls, non-space separators, common format
// characters, surrogates, private use and the U+FFFE/U+FFFF noncharacters
bool isPrintable(char32_t codepoint);

} // namespace scb
