#pragma once

#include "IDocument.hpp"

#include <memory>

namespace slipsort
{

// PDF source backed by poppler-cpp (text layer, rasterization) and qpdf
// (page copy into new files).
class PdfDocument : public IDocument
{
public:
    // Throws SourceUnavailableError if the file cannot be opened as a PDF.
    explicit PdfDocument(std::string path);
    ~PdfDocument() override;

    PdfDocument(const PdfDocument&) = delete;
    PdfDocument& operator=(const PdfDocument&) = delete;

    int pageCount() const override;
    std::string extractText(int page_index) override;
    PageImage renderPage(int page_index, double scale) override;
    void exportPages(const std::vector<int>& page_indices, const std::string& output_path) override;
    const std::string& path() const override { return path_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string path_;
};

} // namespace slipsort
