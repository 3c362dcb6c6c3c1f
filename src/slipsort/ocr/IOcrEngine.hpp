#pragma once

#include "../document/IDocument.hpp"

#include <stdexcept>
#include <string>

namespace slipsort
{

class OcrError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class IOcrEngine
{
public:
    virtual ~IOcrEngine() = default;

    /// Recognize text in an RGB page raster. `language` is an engine language
    /// code such as "por". Throws OcrError.
    virtual std::string recognize(const PageImage& image, const std::string& language) = 0;
};

} // namespace slipsort
