#include <catch2/catch_test_macros.hpp>
#include "slipsort/batch/BatchReport.hpp"
#include "utils/temp_dir.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

using namespace slipsort;
using test_utils::TempDir;
using test_utils::readFile;
using json = nlohmann::json;

namespace {

BatchResult sampleResult()
{
    BatchResult result;
    result.total_pages = 10;
    result.pages_processed = 4;
    result.identified_pages = 3;
    result.unidentified_pages = 1;
    result.identities_found = {"MARIA SOUZA", "JOÃO SILVA"};
    result.errors = {"Page 2: OCR failed: recognizer crashed"};
    result.outputs = {"out/JOÃO SILVA/a.pdf", "out/MARIA SOUZA/b.pdf", "out/JOÃO SILVA/c.pdf"};
    result.final_state = BatchState::Cancelled;
    return result;
}

BatchReportInfo sampleInfo()
{
    return BatchReportInfo{"folha_marco.pdf", Period{"03", "2024"}, "2024-03-05 14:30:00", "2024-03-05 14:31:10"};
}

} // namespace

TEST_CASE("BatchReport - Serialized fields", "[report]")
{
    BatchReport report;
    json doc = json::parse(report.serialize(sampleResult(), sampleInfo()));

    REQUIRE(doc["source"] == "folha_marco.pdf");
    REQUIRE(doc["period"]["month"] == "03");
    REQUIRE(doc["period"]["year"] == "2024");
    REQUIRE(doc["state"] == "cancelled");
    REQUIRE(doc["total_pages"] == 10);
    REQUIRE(doc["pages_processed"] == 4);
    REQUIRE(doc["identified_pages"] == 3);
    REQUIRE(doc["unidentified_pages"] == 1);
    REQUIRE(doc["identities_found"].size() == 2);
    REQUIRE(doc["errors"][0] == "Page 2: OCR failed: recognizer crashed");
    REQUIRE(doc["outputs"].size() == 3);
    REQUIRE(doc["started_at"] == "2024-03-05 14:30:00");
}

TEST_CASE("BatchReport - Write and read back", "[report]")
{
    TempDir dir("batch_report");
    BatchReport report;

    std::string path;
    std::string error;
    REQUIRE(report.write(dir.file("logs"), sampleResult(), sampleInfo(), path, error));

    auto name = std::filesystem::path(path).filename().string();
    REQUIRE(name.rfind("batch_report_", 0) == 0);
    REQUIRE(name.size() == std::string("batch_report_yyyyMMddHHmmss.json").size());

    BatchResult parsed;
    REQUIRE(BatchReport::parse(readFile(path), parsed, error));
    REQUIRE(parsed.total_pages == 10);
    REQUIRE(parsed.pages_processed == 4);
    REQUIRE(parsed.identities_found == sampleResult().identities_found);
    REQUIRE(parsed.final_state == BatchState::Cancelled);
    REQUIRE(parsed.errors.size() == 1);
}

TEST_CASE("BatchReport - Parse errors", "[report][errors]")
{
    BatchResult parsed;
    std::string error;

    SECTION("Malformed JSON")
    {
        REQUIRE_FALSE(BatchReport::parse("{ not json", parsed, error));
        REQUIRE(error.find("JSON parse error") != std::string::npos);
    }

    SECTION("Missing counters")
    {
        REQUIRE_FALSE(BatchReport::parse(R"({"source": "x.pdf"})", parsed, error));
        REQUIRE(error.find("pages_processed") != std::string::npos);
    }
}
