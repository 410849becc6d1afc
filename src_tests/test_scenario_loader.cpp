/**
 * @file test_scenario_loader.cpp
 * @brief Parsing of *.scn scenario files and bundle-mode expansion
 *
 * © 2025 Uni-Libraries contributors — MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include "bundle_validation/scenario_loader.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bundle::validation;
namespace fs = std::filesystem;

TEST_CASE("Blocks default to both modes and take their id from the script", "[scenario]")
{
    test_support::TempDir tmp("scn");
    test_support::write_file(tmp / "basic.scn",
                             "# comment\n"
                             "script = test_hello.py\n"
                             "tool_arg=--clean\n"
                             "tool_arg=--strip\n"
                             "app_arg=--verbose\n"
                             "attr.owner = packaging\n");

    const auto pack = ScenarioLoader{}.load(tmp / "basic.scn");
    REQUIRE(pack.scenarios.size() == 2);

    const auto& onedir = pack.scenarios[0];
    REQUIRE(onedir.id == "test_hello[onedir]");
    REQUIRE(onedir.suite == "basic");
    REQUIRE(onedir.mode == BundleMode::OneDir);
    REQUIRE(onedir.tool_args == std::vector<std::string>{"--clean", "--strip"});
    REQUIRE(onedir.app_args == std::vector<std::string>{"--verbose"});
    REQUIRE(onedir.attributes.at("owner") == "packaging");

    const auto& onefile = pack.scenarios[1];
    REQUIRE(onefile.id == "test_hello[onefile]");
    REQUIRE(onefile.mode == BundleMode::OneFile);
    REQUIRE(onefile.script == "test_hello.py");
}

TEST_CASE("Explicit mode, name, suite and manifest are honoured per block", "[scenario]")
{
    test_support::TempDir tmp("scn");
    test_support::write_file(tmp / "multi.scn",
                             "suite=packaging\n"
                             "id=first\n"
                             "script=a.py\n"
                             "mode=onefile\n"
                             "name=custom\n"
                             "manifest=test_multipackage1\n"
                             "---\n"
                             "script=b.py\n"
                             "mode=OneDir\n"
                             "flavour=spicy\n");

    const auto pack = ScenarioLoader{}.load(tmp / "multi.scn");
    REQUIRE(pack.scenarios.size() == 2);

    REQUIRE(pack.scenarios[0].id == "first");
    REQUIRE(pack.scenarios[0].suite == "packaging");
    REQUIRE(pack.scenarios[0].mode == BundleMode::OneFile);
    REQUIRE(pack.scenarios[0].app_name == "custom");
    REQUIRE(pack.scenarios[0].manifest == "test_multipackage1");

    REQUIRE(pack.scenarios[1].id == "b");
    REQUIRE(pack.scenarios[1].suite == "multi");
    REQUIRE(pack.scenarios[1].mode == BundleMode::OneDir);
    REQUIRE(pack.scenarios[1].app_name.empty());
    REQUIRE(pack.scenarios[1].attributes.at("flavour") == "spicy");
}

TEST_CASE("Malformed scenario files are rejected with a location", "[scenario]")
{
    test_support::TempDir tmp("scn");
    const ScenarioLoader loader;

    test_support::write_file(tmp / "noscript.scn", "id=x\n");
    REQUIRE_THROWS_AS(loader.load(tmp / "noscript.scn"), std::runtime_error);

    test_support::write_file(tmp / "badmode.scn", "script=a.py\nmode=sideways\n");
    try {
        (void)loader.load(tmp / "badmode.scn");
        FAIL("expected an exception");
    } catch (const std::runtime_error& ex) {
        REQUIRE(std::string(ex.what()).find("badmode.scn:2") != std::string::npos);
    }

    test_support::write_file(tmp / "nokv.scn", "script=a.py\njust words\n");
    REQUIRE_THROWS_AS(loader.load(tmp / "nokv.scn"), std::runtime_error);

    REQUIRE_THROWS_AS(loader.load(tmp / "absent.scn"), std::runtime_error);
}

TEST_CASE("Empty blocks are skipped", "[scenario]")
{
    test_support::TempDir tmp("scn");
    test_support::write_file(tmp / "sparse.scn", "---\n\n---\nscript=a.py\nmode=onedir\n---\n");
    const auto pack = ScenarioLoader{}.load(tmp / "sparse.scn");
    REQUIRE(pack.scenarios.size() == 1);
}

TEST_CASE("Directories load every .scn file in path order", "[scenario]")
{
    test_support::TempDir tmp("scn");
    test_support::write_file(tmp / "b.scn", "script=b.py\nmode=onedir\n");
    test_support::write_file(tmp / "nested" / "a.scn", "script=a.py\nmode=onedir\n");
    test_support::write_file(tmp / "a.scn", "script=c.py\nmode=onefile\n");
    test_support::write_file(tmp / "notes.txt", "script=ignored.py\n");

    const auto packs = ScenarioLoader{}.load_directory(tmp.path());
    REQUIRE(packs.size() == 3);
    REQUIRE(fs::path(packs[0].source_file).filename() == "a.scn");
    REQUIRE(packs[0].scenarios.front().script == "c.py");
    REQUIRE(fs::path(packs[1].source_file).filename() == "b.scn");
    REQUIRE(packs[2].scenarios.front().script == "a.py");

    const auto single = ScenarioLoader{}.load_directory(tmp / "b.scn");
    REQUIRE(single.size() == 1);
}

TEST_CASE("Loading several roots keeps their order", "[scenario]")
{
    test_support::TempDir tmp("scn");
    test_support::write_file(tmp / "z.scn", "script=z.py\nmode=onedir\n");
    test_support::write_file(tmp / "more" / "a.scn", "script=a.py\nmode=onefile\n");
    test_support::write_file(tmp / "empty.scn", "# nothing here yet\n");

    const auto packs = ScenarioLoader{}.load_all({tmp / "z.scn", tmp / "more", tmp / "empty.scn"});
    REQUIRE(packs.size() == 3);
    REQUIRE(packs[0].scenarios.front().script == "z.py");
    REQUIRE(packs[1].scenarios.front().script == "a.py");
    REQUIRE(packs[2].scenarios.empty());
}

TEST_CASE("Roots without any scenario are rejected", "[scenario]")
{
    test_support::TempDir tmp("scn");
    test_support::write_file(tmp / "empty.scn", "# nothing here yet\n---\n");
    fs::create_directories(tmp / "no_files");
    test_support::write_file(tmp / "no_files" / "readme.txt", "script=ignored.py\n");

    const ScenarioLoader loader;
    REQUIRE_THROWS_AS(loader.load_all({tmp / "empty.scn"}), std::runtime_error);
    REQUIRE_THROWS_AS(loader.load_all({tmp / "no_files"}), std::runtime_error);
    REQUIRE_THROWS_AS(loader.load_all({tmp / "empty.scn", tmp / "no_files"}), std::runtime_error);
    REQUIRE_THROWS_AS(loader.load_all({}), std::runtime_error);
}
