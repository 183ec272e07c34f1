#include <array>
#include <utility>

#include <scb/encoding.hpp>

namespace scb {

namespace {

// Windows-1252 0x80..0x9F; zero marks the five undefined bytes
constexpr std::array<char32_t, 32> kWindows1252High = {
    0x20AC, 0x0000, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021, // 0x80
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x0000, 0x017D, 0x0000, // 0x88
    0x0000, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014, // 0x90
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x0000, 0x017E, 0x0178, // 0x98
};

bool isContinuation(uint8_t byte) {
  return (byte & 0xC0) == 0x80;
}

bool decodeUtf8(std::span<const uint8_t> bytes, std::string &out) {
  size_t i = 0;
  while (i < bytes.size()) {
    uint8_t lead = bytes[i];

    if (lead < 0x80) {
      ++i;
      continue;
    }

    size_t length = 0;
    char32_t codepoint = 0;
    char32_t minimum = 0;
    if ((lead & 0xE0) == 0xC0) {
      length = 2;
      codepoint = lead & 0x1F;
      minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      codepoint = lead & 0x0F;
      minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      codepoint = lead & 0x07;
      minimum = 0x10000;
    } else {
      return false;
    }

    if (i + length > bytes.size()) {
      return false;
    }
    for (size_t k = 1; k < length; ++k) {
      if (!isContinuation(bytes[i + k])) {
        return false;
      }
      codepoint = (codepoint << 6) | (bytes[i + k] & 0x3F);
    }

    // Overlong forms, surrogates and out-of-range values
    if (codepoint < minimum || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
      return false;
    }
    i += length;
  }

  // Valid input is already UTF-8
  out.assign(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  return true;
}

} // namespace

const char *toString(Encoding encoding) {
  switch (encoding) {
  case Encoding::Utf8:
    return "utf-8";
  case Encoding::Windows1252:
    return "cp1252";
  case Encoding::Latin1:
    return "latin-1";
  }
  return "utf-8";
}

bool decodeToUtf8(std::span<const uint8_t> bytes, Encoding encoding, std::string &out) {
  if (encoding == Encoding::Utf8) {
    return decodeUtf8(bytes, out);
  }

  std::string result;
  result.reserve(bytes.size() + bytes.size() / 8);
  for (uint8_t byte : bytes) {
    char32_t codepoint = byte;
    if (encoding == Encoding::Windows1252 && byte >= 0x80 && byte <= 0x9F) {
      codepoint = kWindows1252High[byte - 0x80];
      if (codepoint == 0) {
        return false;
      }
    }
    appendUtf8(result, codepoint);
  }

  out = std::move(result);
  return true;
}

void appendUtf8(std::string &out, char32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

char32_t nextCodepoint(std::string_view utf8, size_t &pos) {
  auto lead = static_cast<uint8_t>(utf8[pos]);
  size_t length = 1;
  char32_t codepoint = lead;

  if (lead >= 0xF0) {
    length = 4;
    codepoint = lead & 0x07;
  } else if (lead >= 0xE0) {
    length = 3;
    codepoint = lead & 0x0F;
  } else if (lead >= 0xC0) {
    length = 2;
    codepoint = lead & 0x1F;
  }

  for (size_t k = 1; k < length && pos + k < utf8.size(); ++k) {
    codepoint = (codepoint << 6) | (static_cast<uint8_t>(utf8[pos + k]) & 0x3F);
  }
  pos += length;
  return codepoint;
}

size_t countCodepoints(std::string_view utf8) {
  size_t count = 0;
  for (char c : utf8) {
    if (!isContinuation(static_cast<uint8_t>(c))) {
      ++count;
    }
  }
  return count;
}

bool isPrintable(char32_t cp) {
  // C0, DEL, C1
  if (cp < 0x20 || (cp >= 0x7F && cp <= 0x9F)) {
    return false;
  }
  if (cp < 0xA0) {
    return true;
  }

  // Separators other than U+0020
  if (cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x2028 ||
      cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000) {
    return false;
  }

  // Format characters
  if (cp == 0xAD || (cp >= 0x200B && cp <= 0x200F) || (cp >= 0x202A && cp <= 0x202E) ||
      (cp >= 0x2060 && cp <= 0x2064) || cp == 0xFEFF) {
    return false;
  }

  // Surrogates, private use, noncharacters
  if ((cp >= 0xD800 && cp <= 0xF8FF) || cp == 0xFFFE || cp == 0xFFFF || cp >= 0xF0000) {
    return false;
  }

  return true;
}

} // namespace scb
