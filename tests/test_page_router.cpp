#include <catch2/catch_test_macros.hpp>
#include "slipsort/batch/Period.hpp"
#include "slipsort/routing/PageRouter.hpp"
#include "utils/fake_document.hpp"
#include "utils/fixed_clock.hpp"
#include "utils/temp_dir.hpp"

#include <filesystem>

using namespace slipsort;
using test_utils::FakeDocument;
using test_utils::TempDir;
using test_utils::localTime;
using test_utils::readExportedPages;

namespace fs = std::filesystem;

namespace {

PageRouter::Clock fixedClock()
{
    return [] { return localTime(2024, 3, 5, 14, 30, 15); };
}

const Period kMarch2024{"03", "2024"};

} // namespace

TEST_CASE("PageRouter - Output naming", "[router]")
{
    TempDir dir("page_router");
    PageRouter router(dir.str(), "Recibo", fixedClock());
    auto doc = FakeDocument::withTexts({"a", "b", "c"});

    std::string path = router.routePage(doc, 1, "JOÃO SILVA", kMarch2024);

    fs::path expected = dir.path() / "JOÃO SILVA" / "JOÃO SILVA - Recibo - 03-2024_20240305143015.pdf";
    REQUIRE(fs::path(path) == expected);
    REQUIRE(fs::exists(expected));
    REQUIRE(readExportedPages(path) == std::vector<int>{1});
}

TEST_CASE("PageRouter - Same identity within one second", "[router]")
{
    TempDir dir("page_router");
    PageRouter router(dir.str(), "Recibo", fixedClock());
    auto doc = FakeDocument::withTexts({"a", "b", "c"});

    std::string first = router.routePage(doc, 0, "MARIA SOUZA", kMarch2024);
    std::string second = router.routePage(doc, 1, "MARIA SOUZA", kMarch2024);
    std::string third = router.routePage(doc, 2, "MARIA SOUZA", kMarch2024);

    REQUIRE(first != second);
    REQUIRE(second != third);
    REQUIRE(fs::path(second).filename().string() == "MARIA SOUZA - Recibo - 03-2024_20240305143015-2.pdf");
    REQUIRE(fs::path(third).filename().string() == "MARIA SOUZA - Recibo - 03-2024_20240305143015-3.pdf");

    // Nothing was overwritten
    REQUIRE(readExportedPages(first) == std::vector<int>{0});
    REQUIRE(readExportedPages(second) == std::vector<int>{1});
    REQUIRE(readExportedPages(third) == std::vector<int>{2});
}

TEST_CASE("PageRouter - Sanitizing names", "[router][sanitize]")
{
    REQUIRE(PageRouter::sanitizeComponent("JOÃO SILVA") == "JOÃO SILVA");
    REQUIRE(PageRouter::sanitizeComponent("A/B\\C") == "A_B_C");
    REQUIRE(PageRouter::sanitizeComponent("X:Y*Z?\"<>|") == "X_Y_Z_____");
    REQUIRE(PageRouter::sanitizeComponent("NAME. ") == "NAME");
    REQUIRE(PageRouter::sanitizeComponent("..") == "_");
    REQUIRE(PageRouter::sanitizeComponent("") == "_");
    REQUIRE(PageRouter::sanitizeComponent(std::string("A\tB")) == "A_B");

    TempDir dir("page_router");
    PageRouter router(dir.str(), "Recibo", fixedClock());
    auto doc = FakeDocument::withTexts({"a"});
    std::string path = router.routePage(doc, 0, "../ESCAPE", kMarch2024);
    REQUIRE(fs::path(path).parent_path() == dir.path() / ".._ESCAPE");
}

TEST_CASE("PageRouter - Range clamping", "[router][ranges]")
{
    SECTION("Ranges are clamped individually and kept in order")
    {
        std::vector<PageRange> ranges{{3, 4}, {-2, 0}, {8, 20}};
        REQUIRE(PageRouter::clampRanges(ranges, 10) == std::vector<int>{3, 4, 0, 8, 9});
    }

    SECTION("Ranges outside the document vanish")
    {
        REQUIRE(PageRouter::clampRanges({{10, 12}}, 10).empty());
        REQUIRE(PageRouter::clampRanges({{5, 2}}, 10).empty());
        REQUIRE(PageRouter::clampRanges({{0, 3}}, 0).empty());
    }

    SECTION("routeRanges writes one file with all pages")
    {
        TempDir dir("page_router");
        PageRouter router(dir.str(), "Recibo", fixedClock());
        auto doc = FakeDocument::withTexts({"a", "b", "c", "d"});

        std::string path = router.routeRanges(doc, {{2, 3}, {0, 0}}, "ANA LIMA", kMarch2024);
        REQUIRE(readExportedPages(path) == std::vector<int>{2, 3, 0});
        REQUIRE(doc.exports().size() == 1);
    }

    SECTION("routeRanges with nothing left throws")
    {
        TempDir dir("page_router");
        PageRouter router(dir.str(), "Recibo", fixedClock());
        auto doc = FakeDocument::withTexts({"a"});
        REQUIRE_THROWS_AS(router.routeRanges(doc, {{4, 9}}, "ANA LIMA", kMarch2024), RoutingError);
    }
}

TEST_CASE("PageRouter - Failures", "[router][errors]")
{
    TempDir dir("page_router");
    auto doc = FakeDocument::withTexts({"a", "b"});

    SECTION("Export failure becomes RoutingError")
    {
        PageRouter router(dir.str(), "Recibo", fixedClock());
        doc.failExportOf(1);
        REQUIRE_NOTHROW(router.routePage(doc, 0, "ANA LIMA", kMarch2024));
        REQUIRE_THROWS_AS(router.routePage(doc, 1, "ANA LIMA", kMarch2024), RoutingError);
    }

    SECTION("Output root that is a file")
    {
        std::string blocker = dir.write("not_a_dir", "x");
        PageRouter router(blocker, "Recibo", fixedClock());
        REQUIRE_THROWS_AS(router.routePage(doc, 0, "ANA LIMA", kMarch2024), RoutingError);
    }

    SECTION("Page index out of range")
    {
        PageRouter router(dir.str(), "Recibo", fixedClock());
        REQUIRE_THROWS_AS(router.routePage(doc, 2, "ANA LIMA", kMarch2024), RoutingError);
    }
}
