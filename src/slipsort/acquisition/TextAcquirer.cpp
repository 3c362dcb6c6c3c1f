#include "TextAcquirer.hpp"
#include "../document/IDocument.hpp"
#include "../ocr/IOcrEngine.hpp"

#include "../../processing/Diagnostics.hpp"
#include "../../processing/StageRunner.hpp"
#include "../../processing/TextUtils.hpp"
#include "../../utils/Profile.hpp"

#include <plog/Log.h>

namespace slipsort
{

namespace
{
void appendError(std::optional<std::string>& slot, const std::string& message)
{
    if (slot)
        *slot += "; " + message;
    else
        slot = message;
}
} // namespace

TextAcquirer::TextAcquirer(IOcrEngine* ocr)
    : ocr_(ocr)
{
}

bool TextAcquirer::needsOcr(const std::string& direct_text, int threshold)
{
    auto length = processing::codepointLength(processing::trimWhitespace(direct_text));
    return static_cast<long long>(length) < threshold;
}

TextAcquisition TextAcquirer::acquire(IDocument& document, int page_index, const BatchOptions& options) const
{
    PROFILE_SCOPE_FUNCTION();

    TextAcquisition out;
    const std::string page_label = "page " + std::to_string(page_index + 1);

    auto direct = processing::run_stage<std::string>(
        "extract " + page_label, [&] { return document.extractText(page_index); },
        utils::ErrorCategory::Extraction);
    if (direct.succeeded)
    {
        out.text = std::move(direct.result);
    }
    else
    {
        appendError(out.error, "text extraction failed: " + direct.error.value_or("unknown error"));
    }

    if (!needsOcr(out.text, options.ocr_text_threshold))
    {
        return out;
    }

    if (!ocr_)
    {
        PLOG_WARNING_(processing::Diagnostics::kLogInstance)
            << "Sparse text on " << page_label << " but no OCR engine configured";
        return out;
    }

    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_INFO_(processing::Diagnostics::kLogInstance)
            << "Sparse text on " << page_label << " (" << processing::codepointLength(out.text)
            << " code points), falling back to OCR";
    }

    auto raster = processing::run_stage<PageImage>(
        "render " + page_label, [&] { return document.renderPage(page_index, options.ocr_upscale_factor); },
        utils::ErrorCategory::Recognition);
    if (!raster.succeeded)
    {
        appendError(out.error, "render failed: " + raster.error.value_or("unknown error"));
        out.text.clear();
        return out;
    }

    auto recognized = processing::run_stage<std::string>(
        "ocr " + page_label, [&] { return ocr_->recognize(raster.result, options.ocr_language); },
        utils::ErrorCategory::Recognition);
    if (!recognized.succeeded)
    {
        appendError(out.error, "OCR failed: " + recognized.error.value_or("unknown error"));
        out.text.clear();
        return out;
    }

    out.text = std::move(recognized.result);
    out.method = AcquisitionMethod::Ocr;
    return out;
}

} // namespace slipsort
