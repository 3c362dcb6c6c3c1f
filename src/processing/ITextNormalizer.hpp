#pragma once

#include <string>

namespace processing
{

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Converts \r\n and \r to \n
    [[nodiscard]] virtual std::string normalizeLineEndings(const std::string& text) const = 0;

    // Unicode upper case, used for case-insensitive comparison
    [[nodiscard]] virtual std::string foldCase(const std::string& text) const = 0;

    // Full normalization pipeline: line endings + Unicode NFKC + upper case + whitespace collapse
    [[nodiscard]] virtual std::string normalize(const std::string& text) const = 0;
};

} // namespace processing
