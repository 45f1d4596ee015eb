#ifndef LAYOUT_UTF8_HPP
#define LAYOUT_UTF8_HPP

#include <string>

namespace layout {

/**
 * @brief Decode UTF-8 text into code points
 * @throws MalformedDocument on an invalid byte sequence
 */
std::u32string decodeUtf8(const std::string &text);

/**
 * @brief Encode code points as UTF-8
 */
std::string encodeUtf8(const std::u32string &text);

/// True for the ASCII whitespace characters that separate words
bool isWordSeparator(char32_t c);

} // namespace layout

#endif // LAYOUT_UTF8_HPP
