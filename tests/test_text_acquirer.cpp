#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "slipsort/acquisition/TextAcquirer.hpp"
#include "utils/fake_document.hpp"
#include "utils/fake_ocr.hpp"

using namespace slipsort;
using test_utils::FakeDocument;
using test_utils::FakeOcrEngine;
using test_utils::FakePage;
using Catch::Matchers::WithinAbs;

namespace {

const std::string kDenseText =
    "RECIBO DE PAGAMENTO DE SALARIO - JOAO SILVA - Competencia 03/2024 - Salario base 3.000,00";

} // namespace

TEST_CASE("TextAcquirer - Sparse threshold", "[acquirer][threshold]")
{
    SECTION("Counts code points of the trimmed text")
    {
        REQUIRE(TextAcquirer::needsOcr("", 50));
        REQUIRE(TextAcquirer::needsOcr("   \n\t  ", 1));
        REQUIRE(TextAcquirer::needsOcr("  abcd  ", 5));
        REQUIRE_FALSE(TextAcquirer::needsOcr("  abcde  ", 5));
        // five code points, ten bytes
        REQUIRE_FALSE(TextAcquirer::needsOcr("ÃÃÃÃÃ", 5));
        REQUIRE(TextAcquirer::needsOcr("ÃÃÃÃ", 5));
    }

    SECTION("Zero threshold never asks for OCR")
    {
        REQUIRE_FALSE(TextAcquirer::needsOcr("", 0));
    }
}

TEST_CASE("TextAcquirer - Direct text", "[acquirer][direct]")
{
    FakeOcrEngine ocr;
    TextAcquirer acquirer(&ocr);
    auto doc = FakeDocument::withTexts({kDenseText});

    auto result = acquirer.acquire(doc, 0, BatchOptions{});
    REQUIRE(result.text == kDenseText);
    REQUIRE(result.method == AcquisitionMethod::Direct);
    REQUIRE_FALSE(result.error.has_value());
    REQUIRE(ocr.calls() == 0);
    REQUIRE(doc.renderCalls() == 0);
}

TEST_CASE("TextAcquirer - OCR fallback", "[acquirer][ocr]")
{
    FakeOcrEngine ocr;
    TextAcquirer acquirer(&ocr);
    BatchOptions options;
    options.ocr_upscale_factor = 3.0;
    options.ocr_language = "por+eng";

    SECTION("Sparse page is rendered and recognized")
    {
        auto doc = FakeDocument::withTexts({"12", "   "});
        ocr.setText(1, "MARIA SOUZA RECIBO");

        auto result = acquirer.acquire(doc, 1, options);
        REQUIRE(result.text == "MARIA SOUZA RECIBO");
        REQUIRE(result.method == AcquisitionMethod::Ocr);
        REQUIRE_FALSE(result.error.has_value());
        REQUIRE(ocr.calls() == 1);
        REQUIRE(ocr.lastLanguage() == "por+eng");
        REQUIRE_THAT(doc.lastRenderScale(), WithinAbs(3.0, 1e-9));
    }

    SECTION("Failed direct extraction still tries OCR")
    {
        FakeDocument doc({FakePage{"", true}});
        ocr.setText(0, "JOAO SILVA");

        auto result = acquirer.acquire(doc, 0, options);
        REQUIRE(result.text == "JOAO SILVA");
        REQUIRE(result.method == AcquisitionMethod::Ocr);
        REQUIRE(result.error.has_value());
        REQUIRE(result.error->find("text extraction failed") != std::string::npos);
    }

    SECTION("OCR failure discards the sparse direct text and records the error")
    {
        auto doc = FakeDocument::withTexts({"JOAO"});
        ocr.failOn(0);

        auto result = acquirer.acquire(doc, 0, options);
        REQUIRE(result.text.empty());
        REQUIRE(result.method == AcquisitionMethod::Direct);
        REQUIRE(result.error.has_value());
        REQUIRE(result.error->find("OCR failed") != std::string::npos);
    }

    SECTION("Render failure skips recognition and discards the direct text")
    {
        FakeDocument doc({FakePage{"ANA", false, true}});

        auto result = acquirer.acquire(doc, 0, options);
        REQUIRE(result.text.empty());
        REQUIRE(result.error.has_value());
        REQUIRE(result.error->find("render failed") != std::string::npos);
        REQUIRE(ocr.calls() == 0);
    }

    SECTION("Both stages failing yields empty text and both errors")
    {
        FakeDocument doc({FakePage{"", true, true}});

        auto result = acquirer.acquire(doc, 0, options);
        REQUIRE(result.text.empty());
        REQUIRE(result.error->find("text extraction failed") != std::string::npos);
        REQUIRE(result.error->find("render failed") != std::string::npos);
    }
}

TEST_CASE("TextAcquirer - Without OCR engine", "[acquirer]")
{
    TextAcquirer acquirer(nullptr);
    auto doc = FakeDocument::withTexts({"x"});

    auto result = acquirer.acquire(doc, 0, BatchOptions{});
    REQUIRE(result.text == "x");
    REQUIRE(result.method == AcquisitionMethod::Direct);
    REQUIRE(doc.renderCalls() == 0);
}
