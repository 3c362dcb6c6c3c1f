#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // One replacement character per offending byte; decoding resumes after it
            result.push_back(kReplacementChar);
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

bool isValidUtf8(const std::string& text)
{
    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            return false;
        pos += bytes;
    }
    return true;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

bool isWhitespaceChar(char32_t cp)
{
    if (cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' || cp == U'\f' || cp == U'\v')
        return true;
    return utf8proc_category(static_cast<utf8proc_int32_t>(cp)) == UTF8PROC_CATEGORY_ZS;
}

std::string toUpperUtf8(const std::string& text)
{
    std::u32string cps = utf8ToUtf32(text);
    for (auto& cp : cps)
    {
        cp = static_cast<char32_t>(utf8proc_toupper(static_cast<utf8proc_int32_t>(cp)));
    }
    return utf32ToUtf8(cps);
}

std::string trimWhitespace(const std::string& text)
{
    std::u32string cps = utf8ToUtf32(text);
    std::size_t begin = 0;
    std::size_t end = cps.size();
    while (begin < end && isWhitespaceChar(cps[begin]))
        ++begin;
    while (end > begin && isWhitespaceChar(cps[end - 1]))
        --end;
    return utf32ToUtf8(cps.substr(begin, end - begin));
}

std::string collapseWhitespace(const std::string& text)
{
    std::u32string cps = utf8ToUtf32(text);
    std::u32string out;
    out.reserve(cps.size());

    bool pending_space = false;
    for (char32_t cp : cps)
    {
        if (isWhitespaceChar(cp))
        {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space)
        {
            out.push_back(U' ');
            pending_space = false;
        }
        out.push_back(cp);
    }
    return utf32ToUtf8(out);
}

std::size_t codepointLength(const std::string& text)
{
    std::size_t count = 0;
    for (unsigned char c : text)
    {
        if ((c & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

std::string truncateCodepoints(const std::string& text, std::size_t max_codepoints)
{
    std::size_t count = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80)
        {
            if (count == max_codepoints)
                return text.substr(0, i);
            ++count;
        }
    }
    return text;
}

} // namespace processing
