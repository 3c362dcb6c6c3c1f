#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../processing/Diagnostics.hpp"
#include "Profile.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::vector<void (*)()> LogManager::s_silencers;

bool LogManager::Initialize(const Settings& settings)
{
    s_settings = settings;
    if (s_settings.log_dir.empty())
        s_settings.log_dir = "logs";

    std::error_code ec;
    std::filesystem::create_directories(s_settings.log_dir, ec);
    if (ec || !std::filesystem::is_directory(s_settings.log_dir, ec))
    {
        ErrorReporter::ReportFatal(ErrorCategory::Initialization, "Cannot create log directory",
                                   s_settings.log_dir + (ec ? ": " + ec.message() : std::string()));
        s_initialized = false;
        return false;
    }

    s_initialized = true;
    return true;
}

std::string LogManager::LogPath(const std::string& filename)
{
    return (std::filesystem::path(s_settings.log_dir) / filename).string();
}

plog::Severity LogManager::SeverityFromLevel(int level)
{
    return static_cast<plog::Severity>(std::clamp(level, static_cast<int>(plog::none), static_cast<int>(plog::verbose)));
}

template <int InstanceId>
void LogManager::Silence()
{
    if (auto logger = plog::get<InstanceId>())
        logger->setMaxSeverity(plog::none);
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logger registered before the log directory",
                                   config.name);
        return false;
    }

    const std::string path = LogPath(config.filename);
    try
    {
        if (!s_settings.append)
        {
            std::ofstream truncate(path, std::ios::trunc);
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), config.max_file_size, config.backup_count);

        const plog::Severity level = config.level_override.value_or(s_settings.level);
        auto& logger = plog::init<InstanceId>(level, file_appender.get());
        logger.setMaxSeverity(level);
        s_appenders.push_back(std::move(file_appender));

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_silencers.push_back(&LogManager::Silence<InstanceId>);
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log " + config.name,
                                   path + ": " + ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerConfig&);

#if SLIPSORT_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

void LogManager::Shutdown()
{
    for (auto silence : s_silencers)
        silence();
    s_silencers.clear();
    s_appenders.clear();
    s_initialized = false;
}

} // namespace utils
