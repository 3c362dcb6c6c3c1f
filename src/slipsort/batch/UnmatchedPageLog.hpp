#pragma once

#include <cstddef>
#include <mutex>
#include <string>

namespace slipsort
{

// Append-only record of pages no roster name matched, for manual follow-up.
//
//   === Unmatched page (2024-03-05 10:11:12) ===
//   Page number: 7
//   Extracted text:
//   <first 500 code points>...
class UnmatchedPageLog
{
public:
    static constexpr std::size_t kMaxTextCodepoints = 500;

    explicit UnmatchedPageLog(std::string path);

    // page_number is 1-based. Failures are reported, never thrown.
    bool append(int page_number, const std::string& text);

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;
};

} // namespace slipsort
