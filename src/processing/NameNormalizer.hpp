#pragma once

#include "ITextNormalizer.hpp"
#include <memory>

namespace processing
{

// Canonical form shared by roster names and page text, so that
// "joão  silva" on a page and "JOÃO SILVA" in the roster compare equal.
class NameNormalizer : public ITextNormalizer
{
public:
    NameNormalizer();
    ~NameNormalizer() override;

    NameNormalizer(const NameNormalizer&) = delete;
    NameNormalizer& operator=(const NameNormalizer&) = delete;

    [[nodiscard]] std::string normalizeLineEndings(const std::string& text) const override;
    [[nodiscard]] std::string foldCase(const std::string& text) const override;
    [[nodiscard]] std::string normalize(const std::string& text) const override;
};

} // namespace processing
