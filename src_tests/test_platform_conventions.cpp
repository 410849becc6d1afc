/**
 * @file test_platform_conventions.cpp
 * @brief Convention table lookups, platform/mode parsing and wildcard matching
 *
 * © 2025 Uni-Libraries contributors — MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include "bundle_validation/path_glob.hpp"
#include "bundle_validation/platform.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace bundle::validation;

namespace {

std::vector<std::string> relatives(Platform platform, BundleMode mode)
{
    std::vector<std::string> out;
    for (const auto& t : path_templates(platform, mode)) {
        out.push_back(t.relative);
    }
    return out;
}

bool contains(const std::vector<std::string>& v, const std::string& item)
{
    return std::find(v.begin(), v.end(), item) != v.end();
}

} // namespace

TEST_CASE("Unix conventions list primary and multipackage forms for both modes", "[platform]")
{
    const auto onedir = relatives(Platform::Unix, BundleMode::OneDir);
    REQUIRE(onedir == std::vector<std::string>{"{name}/{name}", "{name}/{name}_?"});

    const auto onefile = relatives(Platform::Unix, BundleMode::OneFile);
    REQUIRE(onefile == std::vector<std::string>{"{name}", "{name}_?"});

    for (const auto& t : path_templates(Platform::Unix, BundleMode::OneDir)) {
        REQUIRE(t.multipackage == (t.relative.find('?') != std::string::npos));
    }
}

TEST_CASE("macOS adds the application bundle form in either mode", "[platform]")
{
    for (const auto mode : {BundleMode::OneDir, BundleMode::OneFile}) {
        const auto rel = relatives(Platform::MacOS, mode);
        REQUIRE(contains(rel, "{name}.app/Contents/MacOS/{name}"));
    }
    REQUIRE_FALSE(contains(relatives(Platform::Unix, BundleMode::OneDir), "{name}.app/Contents/MacOS/{name}"));
}

TEST_CASE("Windows lists .exe forms next to the plain ones", "[platform]")
{
    const auto onedir = relatives(Platform::Windows, BundleMode::OneDir);
    REQUIRE(contains(onedir, "{name}/{name}.exe"));
    REQUIRE(contains(onedir, "{name}/{name}_?.exe"));

    const auto onefile = relatives(Platform::Windows, BundleMode::OneFile);
    REQUIRE(contains(onefile, "{name}.exe"));
    REQUIRE(contains(onefile, "{name}_?.exe"));
}

TEST_CASE("Platform and mode names parse case-insensitively", "[platform]")
{
    REQUIRE(parse_platform("Windows") == Platform::Windows);
    REQUIRE(parse_platform("win32") == Platform::Windows);
    REQUIRE(parse_platform("DARWIN") == Platform::MacOS);
    REQUIRE(parse_platform("macos") == Platform::MacOS);
    REQUIRE(parse_platform("linux") == Platform::Unix);
    REQUIRE_FALSE(parse_platform("amiga").has_value());

    REQUIRE(parse_bundle_mode("OneDir") == BundleMode::OneDir);
    REQUIRE(parse_bundle_mode("onefile") == BundleMode::OneFile);
    REQUIRE_FALSE(parse_bundle_mode("both").has_value());

    REQUIRE(mode_flag(BundleMode::OneDir) == "--onedir");
    REQUIRE(mode_flag(BundleMode::OneFile) == "--onefile");
    REQUIRE(to_string(BundleMode::OneFile) == "onefile");
}

TEST_CASE("Only Windows rebuilds a minimal search path", "[platform]")
{
    REQUIRE(minimal_search_path(Platform::Unix).empty());
    REQUIRE(minimal_search_path(Platform::MacOS).empty());

    const auto windows = minimal_search_path(Platform::Windows);
    REQUIRE(windows.size() == 2);
    REQUIRE(search_path_separator(Platform::Windows) == ';');
    REQUIRE(search_path_separator(Platform::Unix) == ':');
}

TEST_CASE("Wildcards match one character or any run", "[platform][glob]")
{
    REQUIRE(wildcard_match("app_?", "app_2"));
    REQUIRE_FALSE(wildcard_match("app_?", "app_"));
    REQUIRE_FALSE(wildcard_match("app_?", "app_12"));
    REQUIRE(wildcard_match("app*", "app"));
    REQUIRE(wildcard_match("a*e", "apple"));
    REQUIRE_FALSE(wildcard_match("a*e", "apples"));
    REQUIRE(wildcard_match("plain", "plain"));
    REQUIRE_FALSE(wildcard_match("plain", "plain2"));
}

TEST_CASE("A single wildcard spans a whole UTF-8 character", "[platform][glob]")
{
    REQUIRE(wildcard_match("app_?", "app_\xC3\xA9"));
    REQUIRE(wildcard_match("app_?", "app_\xE2\x82\xAC"));
    REQUIRE(wildcard_match("app_?", "app_\xF0\x9F\x98\x80"));
    REQUIRE_FALSE(wildcard_match("app_?", "app_\xC3\xA9x"));
    REQUIRE_FALSE(wildcard_match("app_??", "app_\xC3\xA9"));
    REQUIRE(wildcard_match("*_?", "app_\xC3\xA9"));
    REQUIRE(wildcard_match("*?z", "\xC3\xA9" "az"));
    REQUIRE_FALSE(wildcard_match("*?z", "\xC3\xA9" "a"));

    REQUIRE(last_code_point_offset("app_\xC3\xA9") == 4);
    REQUIRE(last_code_point_offset("app_2") == 4);
    REQUIRE(last_code_point_offset("") == 0);
}

TEST_CASE("glob_files keeps regular files only and sorts them", "[platform][glob]")
{
    test_support::TempDir tmp("glob");
    test_support::write_file(tmp / "app_2", "");
    test_support::write_file(tmp / "app_1", "");
    test_support::write_file(tmp / "app_10", "");
    std::filesystem::create_directories(tmp / "app_d");

    const auto hits = glob_files(tmp.path(), "app_?");
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].filename() == "app_1");
    REQUIRE(hits[1].filename() == "app_2");

    REQUIRE(glob_files(tmp.path(), "app_1").size() == 1);
    REQUIRE(glob_files(tmp.path(), "app_d").empty());
    REQUIRE(glob_files(tmp.path(), "missing/app_?").empty());
}
