#include <catch2/catch_test_macros.hpp>
#include "processing/NameNormalizer.hpp"

using namespace processing;

TEST_CASE("NameNormalizer - Canonical form", "[normalizer]")
{
    NameNormalizer normalizer;

    SECTION("Case and spacing differences disappear")
    {
        REQUIRE(normalizer.normalize("  joão   silva ") == "JOÃO SILVA");
        REQUIRE(normalizer.normalize("JOÃO SILVA") == "JOÃO SILVA");
    }

    SECTION("Decomposed accents compose")
    {
        // "a" + combining tilde
        REQUIRE(normalizer.normalize("joa\xCC\x83o") == "JOÃO");
    }

    SECTION("Full-width letters fold to ASCII")
    {
        REQUIRE(normalizer.normalize("ＪＯＡＯ") == "JOAO");
    }

    SECTION("Line breaks inside names become single spaces")
    {
        REQUIRE(normalizer.normalize("MARIA\r\nSOUZA") == "MARIA SOUZA");
        REQUIRE(normalizer.normalize("MARIA\rSOUZA") == "MARIA SOUZA");
    }

    SECTION("Invalid bytes do not cut the text short")
    {
        REQUIRE(normalizer.normalize("andr\xC9 luiz") == "ANDR\xEF\xBF\xBD LUIZ");
        REQUIRE(normalizer.normalize("funcionario:\xFF joão silva") == "FUNCIONARIO:\xEF\xBF\xBD JOÃO SILVA");
    }

    SECTION("Empty and blank input")
    {
        REQUIRE(normalizer.normalize("").empty());
        REQUIRE(normalizer.normalize(" \t\n").empty());
    }
}

TEST_CASE("NameNormalizer - Line endings", "[normalizer]")
{
    NameNormalizer normalizer;
    REQUIRE(normalizer.normalizeLineEndings("a\r\nb\rc\n") == "a\nb\nc\n");
}
