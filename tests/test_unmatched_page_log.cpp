#include <catch2/catch_test_macros.hpp>
#include "slipsort/batch/UnmatchedPageLog.hpp"
#include "utils/temp_dir.hpp"

using slipsort::UnmatchedPageLog;
using test_utils::TempDir;
using test_utils::readFile;

TEST_CASE("UnmatchedPageLog - Entry format", "[unmatched_log]")
{
    TempDir dir("unmatched_log");
    UnmatchedPageLog log(dir.file("logs/unidentified_pages.log"));

    REQUIRE(log.append(7, "RECIBO SEM NOME"));

    std::string content = readFile(log.path());
    REQUIRE(content.rfind("=== Unmatched page (", 0) == 0);
    REQUIRE(content.find(") ===\nPage number: 7\nExtracted text:\nRECIBO SEM NOME...\n\n") != std::string::npos);
}

TEST_CASE("UnmatchedPageLog - Appends entries", "[unmatched_log]")
{
    TempDir dir("unmatched_log");
    UnmatchedPageLog log(dir.file("unidentified_pages.log"));

    REQUIRE(log.append(1, "first"));
    REQUIRE(log.append(2, "second"));

    std::string content = readFile(log.path());
    auto first = content.find("Page number: 1");
    auto second = content.find("Page number: 2");
    REQUIRE(first != std::string::npos);
    REQUIRE(second != std::string::npos);
    REQUIRE(first < second);
}

TEST_CASE("UnmatchedPageLog - Text truncated by code points", "[unmatched_log]")
{
    TempDir dir("unmatched_log");
    UnmatchedPageLog log(dir.file("unidentified_pages.log"));

    std::string text;
    for (int i = 0; i < 600; ++i)
        text += "Ã";

    REQUIRE(log.append(3, text));

    std::string expected;
    for (std::size_t i = 0; i < UnmatchedPageLog::kMaxTextCodepoints; ++i)
        expected += "Ã";

    std::string content = readFile(log.path());
    REQUIRE(content.find("Extracted text:\n" + expected + "...\n") != std::string::npos);
    REQUIRE(content.find(expected + "Ã") == std::string::npos);
}

TEST_CASE("UnmatchedPageLog - Unwritable path", "[unmatched_log]")
{
    TempDir dir("unmatched_log");
    // A directory where the file should be
    std::filesystem::create_directories(dir.path() / "taken");
    UnmatchedPageLog log(dir.file("taken"));

    REQUIRE_FALSE(log.append(1, "text"));
}
