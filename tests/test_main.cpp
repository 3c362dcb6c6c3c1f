// Catch2WithMain provides main(); this file only holds suite-wide smoke checks.

#include <catch2/catch_test_macros.hpp>
#include "app/Version.hpp"
#include "slipsort/batch/BatchTypes.hpp"

#include <string>

TEST_CASE("Build smoke test", "[smoke]") {
    REQUIRE_FALSE(std::string(SLIPSORT_VERSION_STRING).empty());
    REQUIRE(std::string(slipsort::toString(slipsort::BatchState::Completed)) == "completed");
    REQUIRE(std::string(slipsort::toString(slipsort::MatchMethod::Fuzzy)) == "fuzzy");
    REQUIRE(std::string(slipsort::toString(slipsort::AcquisitionMethod::Ocr)) == "ocr");
}
