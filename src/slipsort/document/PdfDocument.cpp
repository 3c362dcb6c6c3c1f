#include "PdfDocument.hpp"

#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page.h>
#include <poppler-page-renderer.h>

#include <qpdf/QPDFJob.hh>

#include <plog/Log.h>

#include <filesystem>
#include <sstream>

namespace slipsort
{

struct PdfDocument::Impl
{
    std::unique_ptr<poppler::document> doc;
    poppler::page_renderer renderer;
    int page_count = 0;

    std::unique_ptr<poppler::page> loadPage(int page_index, const std::string& path) const
    {
        if (page_index < 0 || page_index >= page_count)
        {
            throw DocumentError("Page index " + std::to_string(page_index) + " out of range for " + path);
        }
        std::unique_ptr<poppler::page> page(doc->create_page(page_index));
        if (!page)
        {
            throw DocumentError("Unable to load page " + std::to_string(page_index + 1) + " of " + path);
        }
        return page;
    }
};

PdfDocument::PdfDocument(std::string path)
    : impl_(std::make_unique<Impl>())
    , path_(std::move(path))
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec))
    {
        throw SourceUnavailableError("Source document not found: " + path_);
    }

    impl_->doc.reset(poppler::document::load_from_file(path_));
    if (!impl_->doc)
    {
        throw SourceUnavailableError("Unable to open PDF: " + path_);
    }
    if (impl_->doc->is_locked())
    {
        throw SourceUnavailableError("PDF is password protected: " + path_);
    }

    impl_->page_count = impl_->doc->pages();
    impl_->renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    impl_->renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    impl_->renderer.set_image_format(poppler::image::format_argb32);

    PLOG_DEBUG << "Opened " << path_ << " (" << impl_->page_count << " pages)";
}

PdfDocument::~PdfDocument() = default;

int PdfDocument::pageCount() const { return impl_->page_count; }

std::string PdfDocument::extractText(int page_index)
{
    auto page = impl_->loadPage(page_index, path_);
    poppler::byte_array utf8 = page->text().to_utf8();
    return std::string(utf8.begin(), utf8.end());
}

PageImage PdfDocument::renderPage(int page_index, double scale)
{
    auto page = impl_->loadPage(page_index, path_);

    const double dpi = 72.0 * scale;
    poppler::image raster = impl_->renderer.render_page(page.get(), dpi, dpi);
    if (!raster.is_valid())
    {
        throw DocumentError("Failed to render page " + std::to_string(page_index + 1) + " of " + path_);
    }

    PageImage out;
    out.width = raster.width();
    out.height = raster.height();
    out.dpi = static_cast<int>(dpi);
    out.rgb.resize(static_cast<size_t>(out.width) * static_cast<size_t>(out.height) * 3);

    // argb32 is stored as native-endian 32-bit words: B, G, R, A in memory
    const char* data = raster.const_data();
    const int stride = raster.bytes_per_row();
    for (int y = 0; y < out.height; ++y)
    {
        const auto* row = reinterpret_cast<const unsigned char*>(data + static_cast<ptrdiff_t>(y) * stride);
        std::uint8_t* dst = out.rgb.data() + static_cast<size_t>(y) * out.width * 3;
        for (int x = 0; x < out.width; ++x)
        {
            dst[x * 3 + 0] = row[x * 4 + 2];
            dst[x * 3 + 1] = row[x * 4 + 1];
            dst[x * 3 + 2] = row[x * 4 + 0];
        }
    }
    return out;
}

void PdfDocument::exportPages(const std::vector<int>& page_indices, const std::string& output_path)
{
    if (page_indices.empty())
    {
        throw DocumentError("No pages to export to " + output_path);
    }

    // qpdf page spec, 1-based, order preserved: "3,1,2"
    std::ostringstream page_spec;
    for (size_t i = 0; i < page_indices.size(); ++i)
    {
        int index = page_indices[i];
        if (index < 0 || index >= impl_->page_count)
        {
            throw DocumentError("Page index " + std::to_string(index) + " out of range for " + path_);
        }
        if (i > 0)
            page_spec << ',';
        page_spec << (index + 1);
    }

    try
    {
        QPDFJob job;
        auto config = job.config();
        config->inputFile(path_);
        config->outputFile(output_path);
        config->pages()->pageSpec(".", page_spec.str())->endPages();
        config->checkConfiguration();
        job.run();
    }
    catch (const std::exception& ex)
    {
        throw DocumentError("Failed to export pages " + page_spec.str() + " to " + output_path + ": " + ex.what());
    }
}

} // namespace slipsort
