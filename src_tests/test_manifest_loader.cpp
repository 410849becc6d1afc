/**
 * @file test_manifest_loader.cpp
 * @brief Discovery and parsing of .toc manifests
 *
 * © 2025 Uni-Libraries contributors — MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include "bundle_validation/manifest.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using namespace bundle::validation;
namespace fs = std::filesystem;

TEST_CASE("Manifest parses a JSON array of patterns in declaration order", "[manifest]")
{
    test_support::TempDir tmp("toc");
    test_support::write_file(tmp / "hello.toc", R"(["^b.*", "^a\\.py$"])");

    const auto manifest = ManifestLoader{}.load(tmp / "hello.toc");
    REQUIRE(manifest.patterns == std::vector<std::string>{"^b.*", "^a\\.py$"});
    REQUIRE(manifest.artifact_id() == "hello");
    REQUIRE(manifest.source == tmp / "hello.toc");
}

TEST_CASE("Malformed manifests are rejected", "[manifest]")
{
    test_support::TempDir tmp("toc");
    const ManifestLoader loader;

    test_support::write_file(tmp / "broken.toc", "['single', 'quotes']");
    REQUIRE_THROWS_AS(loader.load(tmp / "broken.toc"), std::runtime_error);

    test_support::write_file(tmp / "object.toc", R"({"patterns": ["x"]})");
    REQUIRE_THROWS_AS(loader.load(tmp / "object.toc"), std::runtime_error);

    test_support::write_file(tmp / "numbers.toc", R"(["ok", 42])");
    REQUIRE_THROWS_AS(loader.load(tmp / "numbers.toc"), std::runtime_error);

    REQUIRE_THROWS_AS(loader.load(tmp / "absent.toc"), std::runtime_error);
}

TEST_CASE("Discovery finds the primary and the stripped-name variants", "[manifest]")
{
    test_support::TempDir tmp("toc");
    test_support::write_file(tmp / "test_multipackage1.toc", "[]");
    test_support::write_file(tmp / "multipackage1_3.toc", "[]");
    test_support::write_file(tmp / "multipackage1_2.toc", "[]");
    test_support::write_file(tmp / "multipackage1_10.toc", "[]");   // not a single-character suffix
    test_support::write_file(tmp / "multipackage2_2.toc", "[]");    // other scenario

    const auto files = ManifestLoader{}.discover(tmp.path(), "test_multipackage1");
    REQUIRE(files.size() == 3);
    REQUIRE(files[0].filename() == "test_multipackage1.toc");
    REQUIRE(files[1].filename() == "multipackage1_2.toc");
    REQUIRE(files[2].filename() == "multipackage1_3.toc");
}

TEST_CASE("Names without the conventional prefix are used unchanged", "[manifest]")
{
    test_support::TempDir tmp("toc");
    test_support::write_file(tmp / "hello.toc", "[]");
    test_support::write_file(tmp / "hello_2.toc", "[]");

    const auto files = ManifestLoader{}.discover(tmp.path(), "hello");
    REQUIRE(files.size() == 2);
    REQUIRE(files[0].filename() == "hello.toc");
    REQUIRE(files[1].filename() == "hello_2.toc");

    const auto custom = ManifestLoader{"he"}.discover(tmp.path(), "hello");
    REQUIRE(custom.size() == 1);
    REQUIRE(custom[0].filename() == "hello.toc");
}

TEST_CASE("No manifest directory or no files means nothing to verify", "[manifest]")
{
    test_support::TempDir tmp("toc");
    const ManifestLoader loader;
    REQUIRE(loader.load_for({}, "hello").empty());
    REQUIRE(loader.load_for(tmp.path(), "hello").empty());
    REQUIRE(loader.load_for(tmp / "missing", "hello").empty());

    test_support::write_file(tmp / "hello.toc", R"(["^x"])");
    const auto loaded = loader.load_for(tmp.path(), "hello");
    REQUIRE(loaded.size() == 1);
    REQUIRE(loaded.front().patterns == std::vector<std::string>{"^x"});
}
