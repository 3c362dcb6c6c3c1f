#include "SourceBackup.hpp"

#include <plog/Log.h>

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace slipsort
{

SourceBackup::SourceBackup(std::string backup_dir, Clock clock)
    : backup_dir_(std::move(backup_dir))
    , clock_(std::move(clock))
{
    if (!clock_)
    {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

bool SourceBackup::backup(const std::string& source_path, std::string& outPath, std::string& outError)
{
    try
    {
        if (!fs::is_regular_file(source_path))
        {
            outError = "Source does not exist: " + source_path;
            PLOG_ERROR << outError;
            return false;
        }

        fs::create_directories(backup_dir_);

        auto now = std::chrono::system_clock::to_time_t(clock_());
        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &now);
#else
        localtime_r(&now, &tm_buf);
#endif
        std::ostringstream name;
        name << std::put_time(&tm_buf, "%Y%m%d%H%M%S") << "_" << fs::path(source_path).filename().string();

        fs::path dest = fs::path(backup_dir_) / name.str();
        fs::copy_file(source_path, dest, fs::copy_options::overwrite_existing);

        outPath = dest.string();
        PLOG_INFO << "Backup created: " << outPath;
        return true;
    }
    catch (const fs::filesystem_error& e)
    {
        outError = std::string("Filesystem error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
    catch (const std::exception& e)
    {
        outError = std::string("Backup error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

} // namespace slipsort
