#include "NameNormalizer.hpp"
#include "TextUtils.hpp"
#include "Diagnostics.hpp"
#include <utf8proc.h>
#include <plog/Log.h>
#include <cstdlib>

namespace processing
{

NameNormalizer::NameNormalizer() = default;

NameNormalizer::~NameNormalizer() = default;

std::string NameNormalizer::normalizeLineEndings(const std::string& text) const
{
    if (text.empty())
        return text;

    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\r')
        {
            if (i + 1 < text.size() && text[i + 1] == '\n')
            {
                ++i;
            }
            out.push_back('\n');
        }
        else
        {
            out.push_back(c);
        }
    }

    return out;
}

std::string NameNormalizer::foldCase(const std::string& text) const
{
    if (text.empty())
        return text;
    return toUpperUtf8(text);
}

std::string NameNormalizer::normalize(const std::string& text) const
{
    if (text.empty())
        return text;

    std::string line_normalized = normalizeLineEndings(text);
    if (!isValidUtf8(line_normalized))
    {
        // Stray bytes (Latin-1 exports, broken text layers) become U+FFFD; the rest is kept
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "Invalid UTF-8 in input, replacing offending bytes";
        line_normalized = utf32ToUtf8(utf8ToUtf32(line_normalized));
    }

    utf8proc_uint8_t* normalized = utf8proc_NFKC(reinterpret_cast<const utf8proc_uint8_t*>(line_normalized.c_str()));

    if (!normalized)
    {
        PLOG_WARNING_(Diagnostics::kLogInstance) << "NFKC normalization failed, falling back to case folding only";
        return collapseWhitespace(foldCase(line_normalized));
    }

    std::string nfkc_normalized(reinterpret_cast<char*>(normalized));
    std::free(normalized);

    return collapseWhitespace(foldCase(nfkc_normalized));
}

} // namespace processing
