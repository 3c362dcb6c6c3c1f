#pragma once

#include <string>

namespace slipsort
{

// Writes a password-protected copy of a PDF: AES-256, the same password for
// opening and for the owner, printing and copying allowed. The output's
// directory is created when missing.
class PdfSecurer
{
public:
    bool secure(const std::string& input, const std::string& output, const std::string& password,
                std::string& outError) const;
};

} // namespace slipsort
