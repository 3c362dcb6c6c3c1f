#include "RosterRepository.hpp"
#include "Roster.hpp"

#include "../../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace slipsort
{

RosterRepository::RosterRepository(const std::string& path)
    : path_(path)
{
}

bool RosterRepository::load(Roster& out_roster) const
{
    std::error_code ec;
    bool file_exists = std::filesystem::exists(path_, ec);

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open())
    {
        std::string detail = "Path: " + path_;
        if (ec)
            detail += " | Error: " + ec.message();

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Roster,
                                            file_exists ? "Failed to read roster file" : "Roster file not found",
                                            detail);
        return false;
    }

    std::size_t added = 0;
    std::string line;
    bool first = true;
    while (std::getline(file, line))
    {
        // Tolerate a UTF-8 BOM written by spreadsheet exports
        if (first && line.rfind("\xEF\xBB\xBF", 0) == 0)
            line.erase(0, 3);
        first = false;

        if (out_roster.add(line))
            ++added;
    }

    PLOG_INFO << "Loaded " << added << " name(s) from " << path_;
    return true;
}

bool RosterRepository::save(const Roster& roster) const
{
    std::error_code ec;
    auto parent_path = std::filesystem::path(path_).parent_path();
    if (!parent_path.empty())
    {
        std::filesystem::create_directories(parent_path, ec);
        if (ec)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Roster, "Failed to create directory for roster file",
                                              "Path: " + parent_path.string() + " | Error: " + ec.message());
            return false;
        }
    }

    std::vector<std::string> sorted = roster.names();
    std::sort(sorted.begin(), sorted.end());

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc | std::ios::binary);
        if (!file.is_open())
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Roster, "Failed to write roster file",
                                              "Path: " + tmp);
            return false;
        }

        for (const auto& name : sorted)
            file << name << "\n";

        if (!file.good())
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Roster, "Error writing roster file", "Path: " + tmp);
            return false;
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Roster, "Failed to replace roster file",
                                          "Path: " + path_ + " | Error: " + ec.message());
        std::filesystem::remove(tmp, ec);
        return false;
    }

    return true;
}

} // namespace slipsort
