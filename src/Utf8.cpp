#include "Utf8.hpp"
#include "LayoutErrors.hpp"

namespace layout {

std::u32string decodeUtf8(const std::string &text) {
  std::u32string result;
  result.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    unsigned char lead = static_cast<unsigned char>(text[i]);
    char32_t codePoint = 0;
    int continuation = 0;

    if (lead < 0x80) {
      codePoint = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      codePoint = lead & 0x1F;
      continuation = 1;
    } else if ((lead & 0xF0) == 0xE0) {
      codePoint = lead & 0x0F;
      continuation = 2;
    } else if ((lead & 0xF8) == 0xF0) {
      codePoint = lead & 0x07;
      continuation = 3;
    } else {
      throw MalformedDocument("Invalid UTF-8 lead byte at offset " +
                              std::to_string(i));
    }

    if (i + continuation >= text.size()) {
      throw MalformedDocument("Truncated UTF-8 sequence at offset " +
                              std::to_string(i));
    }

    for (int k = 1; k <= continuation; ++k) {
      unsigned char byte = static_cast<unsigned char>(text[i + k]);
      if ((byte & 0xC0) != 0x80) {
        throw MalformedDocument("Invalid UTF-8 continuation byte at offset " +
                                std::to_string(i + k));
      }
      codePoint = (codePoint << 6) | (byte & 0x3F);
    }

    result.push_back(codePoint);
    i += continuation + 1;
  }

  return result;
}

std::string encodeUtf8(const std::u32string &text) {
  std::string result;
  result.reserve(text.size());

  for (char32_t c : text) {
    if (c < 0x80) {
      result.push_back(static_cast<char>(c));
    } else if (c < 0x800) {
      result.push_back(static_cast<char>(0xC0 | (c >> 6)));
      result.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x10000) {
      result.push_back(static_cast<char>(0xE0 | (c >> 12)));
      result.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
      result.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
      result.push_back(static_cast<char>(0xF0 | (c >> 18)));
      result.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
      result.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
      result.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
  }

  return result;
}

bool isWordSeparator(char32_t c) {
  return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\f' ||
         c == U'\v';
}

} // namespace layout
