#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

constexpr char32_t kReplacementChar = U'\uFFFD';

/// UTF-8 to UTF-32 conversion. Each byte of an invalid sequence becomes U+FFFD.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// True if every byte belongs to a well-formed UTF-8 sequence
bool isValidUtf8(const std::string& text);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Unicode whitespace (category Zs plus tab, newline, CR, FF, VT)
bool isWhitespaceChar(char32_t cp);

/// Unicode-aware upper case ("joão" -> "JOÃO")
std::string toUpperUtf8(const std::string& text);

/// Strip leading/trailing Unicode whitespace
std::string trimWhitespace(const std::string& text);

/// Trim and replace every whitespace run with a single ASCII space
std::string collapseWhitespace(const std::string& text);

/// Number of code points in a UTF-8 string
std::size_t codepointLength(const std::string& text);

/// First `max_codepoints` code points of `text`, never splitting a sequence
std::string truncateCodepoints(const std::string& text, std::size_t max_codepoints);

} // namespace processing
