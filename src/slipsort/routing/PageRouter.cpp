#include "PageRouter.hpp"
#include "../batch/Period.hpp"

#include "../../utils/ErrorReporter.hpp"
#include "../../utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace slipsort
{

PageRouter::PageRouter(std::string output_root, std::string document_label, Clock clock)
    : output_root_(std::move(output_root))
    , document_label_(std::move(document_label))
    , clock_(std::move(clock))
{
    if (!clock_)
    {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

std::string PageRouter::sanitizeComponent(const std::string& name)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name)
    {
        auto uc = static_cast<unsigned char>(c);
        switch (c)
        {
        case '/':
        case '\\':
        case ':':
        case '*':
        case '?':
        case '"':
        case '<':
        case '>':
        case '|':
            out.push_back('_');
            break;
        default:
            out.push_back(uc < 0x20 ? '_' : c);
            break;
        }
    }

    // Windows drops trailing dots and spaces silently
    while (!out.empty() && (out.back() == '.' || out.back() == ' '))
        out.pop_back();

    if (out.empty() || out == "." || out == "..")
        return "_";
    return out;
}

std::vector<int> PageRouter::clampRanges(const std::vector<PageRange>& ranges, int page_count)
{
    std::vector<int> pages;
    if (page_count <= 0)
        return pages;

    for (const auto& range : ranges)
    {
        int first = std::max(range.first, 0);
        int last = std::min(range.last, page_count - 1);
        for (int page = first; page <= last; ++page)
            pages.push_back(page);
    }
    return pages;
}

std::string PageRouter::routePage(IDocument& document, int page_index, const std::string& identity,
                                  const Period& period)
{
    if (page_index < 0 || page_index >= document.pageCount())
    {
        throw RoutingError("Page index " + std::to_string(page_index) + " out of range");
    }
    return writePages(document, {page_index}, identity, period);
}

std::string PageRouter::routeRanges(IDocument& document, const std::vector<PageRange>& ranges,
                                    const std::string& identity, const Period& period)
{
    auto pages = clampRanges(ranges, document.pageCount());
    if (pages.empty())
    {
        throw RoutingError("No pages left after clamping " + std::to_string(ranges.size()) + " range(s) for " +
                           identity);
    }
    return writePages(document, pages, identity, period);
}

std::string PageRouter::timestamp() const
{
    auto now = std::chrono::system_clock::to_time_t(clock_());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y%m%d%H%M%S");
    return ss.str();
}

std::string PageRouter::writePages(IDocument& document, const std::vector<int>& pages, const std::string& identity,
                                   const Period& period)
{
    PROFILE_SCOPE_FUNCTION();

    const std::string component = sanitizeComponent(identity);
    const fs::path dir = fs::path(output_root_) / component;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Routing, "Cannot create output directory",
                                          dir.string() + ": " + ec.message());
        throw RoutingError("Cannot create output directory " + dir.string() + ": " + ec.message());
    }

    const std::string stem = component + " - " + sanitizeComponent(document_label_) + " - " + period.label() + "_" +
                             timestamp();
    fs::path target = dir / (stem + ".pdf");
    for (int suffix = 2; fs::exists(target, ec); ++suffix)
    {
        target = dir / (stem + "-" + std::to_string(suffix) + ".pdf");
    }

    try
    {
        document.exportPages(pages, target.string());
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Routing, "Failed to write output file",
                                          target.string() + ": " + ex.what());
        throw RoutingError(std::string("Failed to write ") + target.string() + ": " + ex.what());
    }

    PLOG_INFO << "Saved " << pages.size() << " page(s) for " << identity << " to " << target.string();
    return target.string();
}

} // namespace slipsort
