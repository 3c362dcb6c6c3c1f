#include <catch2/catch_test_macros.hpp>
#include "slipsort/roster/Roster.hpp"
#include "slipsort/roster/RosterRepository.hpp"
#include "utils/temp_dir.hpp"

using namespace slipsort;
using test_utils::TempDir;
using test_utils::readFile;

TEST_CASE("Roster - Canonical names", "[roster]")
{
    Roster roster;

    SECTION("Stored upper case with collapsed whitespace")
    {
        REQUIRE(roster.add("  joão   silva "));
        REQUIRE(roster.names() == std::vector<std::string>{"JOÃO SILVA"});
    }

    SECTION("Variants of one name are a single entry")
    {
        REQUIRE(roster.add("JOÃO SILVA"));
        REQUIRE_FALSE(roster.add("joão silva"));
        // decomposed A + combining tilde
        REQUIRE_FALSE(roster.add("JOA\xCC\x83O SILVA"));
        REQUIRE(roster.size() == 1);
        REQUIRE(roster.contains("João Silva"));
    }

    SECTION("Blank names rejected")
    {
        REQUIRE_FALSE(roster.add(""));
        REQUIRE_FALSE(roster.add(" \t "));
        REQUIRE(roster.empty());
    }

    SECTION("Names that are not UTF-8 are rejected")
    {
        REQUIRE_FALSE(roster.add("ANDR\xC9 LUIZ"));
        REQUIRE(roster.empty());
        REQUIRE(Roster::fromNames({"ANDR\xC9 LUIZ", "CARLOS ANDRADE"}).names() ==
                std::vector<std::string>{"CARLOS ANDRADE"});
    }

    SECTION("Insertion order kept")
    {
        Roster r = Roster::fromNames({"MARIA SOUZA", "ANA LIMA", "BRUNO COSTA"});
        REQUIRE(r.names() == std::vector<std::string>{"MARIA SOUZA", "ANA LIMA", "BRUNO COSTA"});
    }

    SECTION("Remove")
    {
        Roster r = Roster::fromNames({"MARIA SOUZA", "ANA LIMA"});
        REQUIRE(r.remove("maria souza"));
        REQUIRE_FALSE(r.remove("maria souza"));
        REQUIRE(r.names() == std::vector<std::string>{"ANA LIMA"});
        REQUIRE_FALSE(r.contains("MARIA SOUZA"));
    }
}

TEST_CASE("RosterRepository - Load", "[roster][repository]")
{
    TempDir dir("roster");

    SECTION("Skips blank lines, BOM and duplicates")
    {
        auto path = dir.write("all_employee.txt", "\xEF\xBB\xBFJOÃO SILVA\r\n\r\nmaria souza\n   \nJoão Silva\nANA LIMA");
        RosterRepository repo(path);
        Roster roster;
        REQUIRE(repo.load(roster));
        REQUIRE(roster.names() == std::vector<std::string>{"JOÃO SILVA", "MARIA SOUZA", "ANA LIMA"});
    }

    SECTION("Latin-1 line is skipped, the others load")
    {
        auto path = dir.write("latin1.txt", "ANDR\xC9 LUIZ\nCARLOS ANDRADE\n");
        RosterRepository repo(path);
        Roster roster;
        REQUIRE(repo.load(roster));
        REQUIRE(roster.names() == std::vector<std::string>{"CARLOS ANDRADE"});
    }

    SECTION("Missing file")
    {
        RosterRepository repo(dir.file("missing.txt"));
        Roster roster;
        REQUIRE_FALSE(repo.load(roster));
        REQUIRE(roster.empty());
    }
}

TEST_CASE("RosterRepository - Save", "[roster][repository]")
{
    TempDir dir("roster");
    RosterRepository repo(dir.file("data/all_employee.txt"));

    Roster roster = Roster::fromNames({"MARIA SOUZA", "ANA LIMA", "JOÃO SILVA"});
    REQUIRE(repo.save(roster));
    REQUIRE(readFile(repo.path()) == "ANA LIMA\nJOÃO SILVA\nMARIA SOUZA\n");
    REQUIRE_FALSE(std::filesystem::exists(repo.path() + ".tmp"));

    Roster reloaded;
    REQUIRE(repo.load(reloaded));
    REQUIRE(reloaded.size() == 3);
    REQUIRE(reloaded.contains("maria souza"));
}
