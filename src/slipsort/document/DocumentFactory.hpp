#pragma once

#include "IDocument.hpp"

#include <functional>
#include <memory>
#include <string>

namespace slipsort
{

// Opens a source path as a document; the batch takes one of these so tests
// can hand it in-memory documents.
using DocumentOpener = std::function<std::unique_ptr<IDocument>(const std::string& path)>;

class DocumentFactory
{
public:
    // Throws SourceUnavailableError.
    static std::unique_ptr<IDocument> Open(const std::string& path);

    static DocumentOpener DefaultOpener();
};

} // namespace slipsort
