#pragma once

#include "../document/IDocument.hpp"

#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace slipsort
{

struct Period;

// Output location unusable or page export failed. Aborts the batch.
class RoutingError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Writes matched pages under `<output_root>/<identity>/`.
 *
 * File name: `<identity> - <label> - <mm>-<yyyy>_<yyyyMMddHHmmss>.pdf`. A name
 * already taken (same identity within one second) gets `-2`, `-3`, ... before
 * the extension, so earlier outputs are never overwritten.
 */
class PageRouter
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    PageRouter(std::string output_root, std::string document_label, Clock clock = {});

    // Returns the path written. Throws RoutingError.
    std::string routePage(IDocument& document, int page_index, const std::string& identity, const Period& period);

    // Ranges are inclusive and clamped to the document one by one; pages are
    // written in the order given. Throws RoutingError if nothing is left.
    std::string routeRanges(IDocument& document, const std::vector<PageRange>& ranges, const std::string& identity,
                            const Period& period);

    /// Replaces path separators and characters invalid in file names with '_'.
    static std::string sanitizeComponent(const std::string& name);

    static std::vector<int> clampRanges(const std::vector<PageRange>& ranges, int page_count);

    const std::string& outputRoot() const { return output_root_; }

private:
    std::string writePages(IDocument& document, const std::vector<int>& pages, const std::string& identity,
                           const Period& period);
    std::string timestamp() const;

    std::string output_root_;
    std::string document_label_;
    Clock clock_;
};

} // namespace slipsort
