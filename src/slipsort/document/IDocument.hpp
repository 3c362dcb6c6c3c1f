#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace slipsort
{

// Raised before any page is read: the source is missing, unreadable, locked
// or not a document we can open.
class SourceUnavailableError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Raised by an open document when a single operation (text, raster, export) fails.
class DocumentError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Rendered page raster, 8-bit RGB, rows packed without padding.
struct PageImage
{
    int width = 0;
    int height = 0;
    int dpi = 72;
    std::vector<std::uint8_t> rgb;

    bool empty() const { return width <= 0 || height <= 0 || rgb.empty(); }
};

// Inclusive 0-based page interval. May lie partly outside the document;
// consumers clamp it.
struct PageRange
{
    int first = 0;
    int last = 0;
};

/**
 * @brief Read-only view of a paged source document.
 *
 * The batch never writes to the source; exportPages() copies pages into a
 * new file. Implementations are used from one thread at a time.
 */
class IDocument
{
public:
    virtual ~IDocument() = default;

    virtual int pageCount() const = 0;

    /// Direct text layer of a page (UTF-8). Throws DocumentError.
    virtual std::string extractText(int page_index) = 0;

    /// Raster of a page at 72 dpi * scale. Throws DocumentError.
    virtual PageImage renderPage(int page_index, double scale) = 0;

    /// Write the given pages, in order, as a new document. Throws DocumentError.
    virtual void exportPages(const std::vector<int>& page_indices, const std::string& output_path) = 0;

    virtual const std::string& path() const = 0;
};

} // namespace slipsort
