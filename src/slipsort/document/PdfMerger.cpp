#include "PdfMerger.hpp"
#include "../../utils/ErrorReporter.hpp"

#include <qpdf/QPDFJob.hh>
#include <plog/Log.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace slipsort
{

bool PdfMerger::merge(const std::vector<std::string>& inputs, const std::string& output, std::string& outError)
{
    merged_.clear();

    std::vector<std::string> present;
    for (const auto& input : inputs)
    {
        std::error_code ec;
        if (fs::is_regular_file(input, ec))
        {
            present.push_back(input);
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Document, "Skipping missing merge input", input);
        }
    }

    if (present.empty())
    {
        outError = "No input files to merge";
        PLOG_ERROR << outError;
        return false;
    }

    try
    {
        auto parent = fs::path(output).parent_path();
        if (!parent.empty())
        {
            fs::create_directories(parent);
        }

        QPDFJob job;
        auto config = job.config();
        config->emptyInput();
        config->outputFile(output);
        auto pages = config->pages();
        for (const auto& input : present)
        {
            pages->pageSpec(input, "1-z");
        }
        pages->endPages();
        config->checkConfiguration();
        job.run();
    }
    catch (const fs::filesystem_error& e)
    {
        outError = std::string("Filesystem error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
    catch (const std::exception& e)
    {
        outError = std::string("Merge error: ") + e.what();
        PLOG_ERROR << outError;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Document, "Failed to merge PDFs", e.what());
        return false;
    }

    merged_ = std::move(present);
    PLOG_INFO << "Merged " << merged_.size() << " file(s) into " << output;
    return true;
}

} // namespace slipsort
