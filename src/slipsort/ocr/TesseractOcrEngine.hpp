#pragma once

#include "IOcrEngine.hpp"

#include <map>
#include <memory>
#include <mutex>

namespace tesseract
{
class TessBaseAPI;
}

namespace slipsort
{

// Tesseract-backed OCR. One initialized API per language is kept for the
// lifetime of the engine; initialization reads the traineddata once.
class TesseractOcrEngine : public IOcrEngine
{
public:
    // Empty datapath lets Tesseract use TESSDATA_PREFIX / its built-in default.
    explicit TesseractOcrEngine(std::string datapath = {});
    ~TesseractOcrEngine() override;

    TesseractOcrEngine(const TesseractOcrEngine&) = delete;
    TesseractOcrEngine& operator=(const TesseractOcrEngine&) = delete;

    std::string recognize(const PageImage& image, const std::string& language) override;

private:
    tesseract::TessBaseAPI& apiFor(const std::string& language);

    std::string datapath_;
    std::mutex mutex_;
    std::map<std::string, std::unique_ptr<tesseract::TessBaseAPI>> apis_;
};

} // namespace slipsort
