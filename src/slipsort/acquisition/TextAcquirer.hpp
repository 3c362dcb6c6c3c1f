#pragma once

#include "../batch/BatchTypes.hpp"

#include <optional>
#include <string>

namespace slipsort
{

class IDocument;
class IOcrEngine;

struct TextAcquisition
{
    std::string text;
    AcquisitionMethod method = AcquisitionMethod::Direct;
    // Set when a stage failed. A failed render or OCR leaves the text empty,
    // a failed direct extraction leaves whatever OCR produced.
    std::optional<std::string> error;
};

/**
 * @brief Obtains the text of one page.
 *
 * Direct extraction first; when the trimmed text has fewer than
 * `ocr_text_threshold` code points the page is rendered at
 * `ocr_upscale_factor` and recognized in `ocr_language`, and the OCR text
 * replaces the direct text. A sparse page whose render or recognition fails
 * yields empty text; its few direct characters are not trusted for
 * matching. Stage failures never propagate.
 */
class TextAcquirer
{
public:
    // ocr may be null: sparse pages then keep their direct text.
    explicit TextAcquirer(IOcrEngine* ocr);

    TextAcquisition acquire(IDocument& document, int page_index, const BatchOptions& options) const;

    // True when the direct text is too sparse to trust.
    static bool needsOcr(const std::string& direct_text, int threshold);

private:
    IOcrEngine* ocr_;
};

} // namespace slipsort
