#include "PdfSecurer.hpp"
#include "../../utils/ErrorReporter.hpp"

#include <qpdf/QPDFJob.hh>
#include <plog/Log.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace slipsort
{

bool PdfSecurer::secure(const std::string& input, const std::string& output, const std::string& password,
                        std::string& outError) const
{
    if (password.empty())
    {
        outError = "Password must not be empty";
        return false;
    }

    std::error_code ec;
    if (!fs::is_regular_file(input, ec))
    {
        outError = "Input file not found: " + input;
        PLOG_ERROR << outError;
        return false;
    }

    std::error_code in_ec;
    std::error_code out_ec;
    auto in_path = fs::weakly_canonical(input, in_ec);
    auto out_path = fs::weakly_canonical(output, out_ec);
    if (!in_ec && !out_ec && in_path == out_path)
    {
        outError = "Output must differ from the input: " + output;
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
        job.config()
            ->inputFile(input)
            ->outputFile(output)
            ->encrypt(256, password, password)
            ->print("full")
            ->extract("y")
            ->endEncrypt()
            ->checkConfiguration();
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
        outError = std::string("Encryption error: ") + e.what();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Document, "Failed to encrypt PDF",
                                          input + ": " + e.what());
        return false;
    }

    PLOG_INFO << "Encrypted " << input << " -> " << output;
    return true;
}

} // namespace slipsort
