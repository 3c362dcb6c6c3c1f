#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/temp_dir.hpp"

#include <filesystem>

using namespace utils;
using test_utils::TempDir;

TEST_CASE("LogManager - Log directory", "[logging]")
{
    TempDir dir("log_manager");
    ErrorReporter::BeginRun();

    SECTION("Nested directory is created and paths resolve inside it")
    {
        LogManager::Settings settings;
        settings.log_dir = dir.file("var/log/slipsort");
        REQUIRE(LogManager::Initialize(settings));
        REQUIRE(LogManager::IsInitialized());
        REQUIRE(std::filesystem::is_directory(settings.log_dir));
        REQUIRE(LogManager::LogPath("errors.log") ==
                (std::filesystem::path(settings.log_dir) / "errors.log").string());
    }

    SECTION("A file in the way fails initialization and is reported")
    {
        LogManager::Settings settings;
        settings.log_dir = dir.write("logs", "not a directory");
        REQUIRE_FALSE(LogManager::Initialize(settings));
        REQUIRE_FALSE(LogManager::IsInitialized());
        REQUIRE(ErrorReporter::Summary().count(ErrorCategory::Initialization) == 1);

        // Nothing can be registered without a directory
        REQUIRE_FALSE(LogManager::RegisterLogger<0>({ .name = "main", .filename = "slipsort.log" }));
        REQUIRE(ErrorReporter::Summary().count(ErrorCategory::Initialization) == 2);
    }

    LogManager::Shutdown();
    ErrorReporter::BeginRun();
}

TEST_CASE("LogManager - Level mapping", "[logging]")
{
    REQUIRE(LogManager::SeverityFromLevel(4) == plog::info);
    REQUIRE(LogManager::SeverityFromLevel(0) == plog::none);
    REQUIRE(LogManager::SeverityFromLevel(6) == plog::verbose);
    REQUIRE(LogManager::SeverityFromLevel(-3) == plog::none);
    REQUIRE(LogManager::SeverityFromLevel(42) == plog::verbose);
}
