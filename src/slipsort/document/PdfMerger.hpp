#pragma once

#include <string>
#include <vector>

namespace slipsort
{

// Concatenates whole PDFs into one file. Missing inputs are skipped with a
// warning; at least one input must exist.
class PdfMerger
{
public:
    bool merge(const std::vector<std::string>& inputs, const std::string& output, std::string& outError);

    // Inputs actually written by the last successful merge.
    const std::vector<std::string>& mergedInputs() const { return merged_; }

private:
    std::vector<std::string> merged_;
};

} // namespace slipsort
