#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace slipsort
{

// Copies the source document aside before a run: <backup_dir>/<yyyyMMddHHmmss>_<filename>.
class SourceBackup
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    explicit SourceBackup(std::string backup_dir, Clock clock = {});

    // Returns false and fills outError on failure; outPath receives the copy.
    bool backup(const std::string& source_path, std::string& outPath, std::string& outError);

    const std::string& backupDir() const { return backup_dir_; }

private:
    std::string backup_dir_;
    Clock clock_;
};

} // namespace slipsort
