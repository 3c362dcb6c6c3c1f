#include "fake_document.hpp"

#include <fstream>

namespace test_utils {

FakeDocument::FakeDocument(std::vector<FakePage> pages, std::string path)
    : pages_(std::move(pages))
    , path_(std::move(path))
{
}

FakeDocument FakeDocument::withTexts(const std::vector<std::string>& texts)
{
    std::vector<FakePage> pages;
    for (const auto& text : texts)
        pages.push_back(FakePage{text});
    return FakeDocument(std::move(pages));
}

std::string FakeDocument::extractText(int page_index)
{
    ++extract_calls_;
    const auto& page = pages_.at(static_cast<size_t>(page_index));
    if (page.fail_extract)
        throw slipsort::DocumentError("corrupt text layer on page " + std::to_string(page_index + 1));
    return page.text;
}

slipsort::PageImage FakeDocument::renderPage(int page_index, double scale)
{
    ++render_calls_;
    last_scale_ = scale;
    const auto& page = pages_.at(static_cast<size_t>(page_index));
    if (page.fail_render)
        throw slipsort::DocumentError("cannot rasterize page " + std::to_string(page_index + 1));

    slipsort::PageImage image;
    image.width = page_index + 1;
    image.height = 1;
    image.dpi = static_cast<int>(72 * scale);
    image.rgb.assign(static_cast<size_t>(image.width) * 3, 0xFF);
    return image;
}

void FakeDocument::exportPages(const std::vector<int>& page_indices, const std::string& output_path)
{
    for (int index : page_indices)
    {
        if (failing_exports_.count(index))
            throw slipsort::DocumentError("disk full while writing page " + std::to_string(index + 1));
    }

    std::ofstream out(output_path, std::ios::binary);
    if (!out)
        throw slipsort::DocumentError("cannot open " + output_path);
    for (int index : page_indices)
        out << index << "\n";
    exports_.push_back(page_indices);
}

std::vector<int> readExportedPages(const std::string& path)
{
    std::vector<int> pages;
    std::ifstream in(path);
    int index = 0;
    while (in >> index)
        pages.push_back(index);
    return pages;
}

} // namespace test_utils
