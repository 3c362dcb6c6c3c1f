#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Sets up the plog instances of one slipsort run: one rolling file per
// instance under the logs directory, plus the console for --verbose.
class LogManager
{
public:
    // Taken from [paths] logs_dir and [logging] after config.toml is loaded.
    struct Settings
    {
        std::string log_dir = "logs";
        plog::Severity level = plog::info;
        bool append = true;
    };

    struct LoggerConfig
    {
        std::string name;
        std::string filename; // relative to the log directory
        std::optional<plog::Severity> level_override;
        std::size_t max_file_size = 10 * 1024 * 1024;
        int backup_count = 3;
        bool add_console_appender = false;
    };

    // Creates the log directory. False if it cannot be created.
    static bool Initialize(const Settings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // Silences every registered instance, then releases the appenders.
    static void Shutdown();

    static bool IsInitialized() { return s_initialized; }
    static const std::string& GetLogDirectory() { return s_settings.log_dir; }
    static std::string LogPath(const std::string& filename);

    // [logging] level: 0 = none ... 6 = verbose, clamped.
    static plog::Severity SeverityFromLevel(int level);

private:
    LogManager() = default;

    template<int InstanceId>
    static void Silence();

    static bool s_initialized;
    static Settings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::vector<void (*)()> s_silencers;
};

} // namespace utils
