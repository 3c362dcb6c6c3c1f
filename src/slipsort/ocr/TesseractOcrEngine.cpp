#include "TesseractOcrEngine.hpp"
#include "../../utils/Profile.hpp"

#include <tesseract/baseapi.h>
#include <plog/Log.h>

namespace slipsort
{

TesseractOcrEngine::TesseractOcrEngine(std::string datapath)
    : datapath_(std::move(datapath))
{
}

TesseractOcrEngine::~TesseractOcrEngine()
{
    for (auto& [language, api] : apis_)
    {
        api->End();
    }
}

tesseract::TessBaseAPI& TesseractOcrEngine::apiFor(const std::string& language)
{
    auto it = apis_.find(language);
    if (it != apis_.end())
    {
        return *it->second;
    }

    auto api = std::make_unique<tesseract::TessBaseAPI>();
    const char* datapath = datapath_.empty() ? nullptr : datapath_.c_str();
    if (api->Init(datapath, language.c_str()) != 0)
    {
        throw OcrError("Could not initialize Tesseract for language '" + language + "'");
    }
    api->SetPageSegMode(tesseract::PSM_AUTO);

    PLOG_INFO << "Tesseract " << tesseract::TessBaseAPI::Version() << " initialized for '" << language << "'";
    auto& ref = *api;
    apis_.emplace(language, std::move(api));
    return ref;
}

std::string TesseractOcrEngine::recognize(const PageImage& image, const std::string& language)
{
    PROFILE_SCOPE_FUNCTION();

    if (image.empty())
    {
        throw OcrError("Empty page image");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& api = apiFor(language);

    api.SetImage(image.rgb.data(), image.width, image.height, 3, image.width * 3);
    api.SetSourceResolution(image.dpi);

    std::unique_ptr<char[]> text(api.GetUTF8Text());
    api.Clear();
    if (!text)
    {
        throw OcrError("Tesseract returned no text");
    }
    return std::string(text.get());
}

} // namespace slipsort
