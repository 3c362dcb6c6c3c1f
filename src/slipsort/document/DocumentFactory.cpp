#include "DocumentFactory.hpp"
#include "PdfDocument.hpp"

#include <filesystem>
#include <fstream>

namespace slipsort
{

std::unique_ptr<IDocument> DocumentFactory::Open(const std::string& path)
{
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec))
    {
        throw SourceUnavailableError("Source document not found: " + path);
    }

    std::ifstream probe(path, std::ios::binary);
    if (!probe)
    {
        throw SourceUnavailableError("Source document is not readable: " + path);
    }

    char magic[5] = {};
    probe.read(magic, sizeof(magic));
    if (probe.gcount() < static_cast<std::streamsize>(sizeof(magic)) || std::string(magic, sizeof(magic)) != "%PDF-")
    {
        throw SourceUnavailableError("Source is not a PDF document: " + path);
    }

    return std::make_unique<PdfDocument>(path);
}

DocumentOpener DocumentFactory::DefaultOpener()
{
    return [](const std::string& path) { return Open(path); };
}

} // namespace slipsort
