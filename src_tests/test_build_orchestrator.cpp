/**
 * @file test_build_orchestrator.cpp
 * @brief Packaging tool argument composition, graph isolation and build failures
 *
 * © 2025 Uni-Libraries contributors — MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include "bundle_validation/build_orchestrator.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace bundle::validation;
namespace fs = std::filesystem;

TEST_CASE("Build request lays out spec, dist, build and config below the scenario directory", "[build]")
{
    const fs::path scenario_dir = "/work/scn";
    const auto request = make_build_request("/scripts/test_hello.py", BundleMode::OneFile, scenario_dir);

    REQUIRE(request.app_name == "test_hello");
    REQUIRE_FALSE(request.explicit_name);
    REQUIRE(request.spec_dir == scenario_dir);
    REQUIRE(request.config_dir == scenario_dir);
    REQUIRE(request.dist_dir == scenario_dir / "dist");
    REQUIRE(request.build_dir == scenario_dir / "build");

    const auto named = make_build_request("/scripts/test_hello.py", BundleMode::OneDir, scenario_dir, {}, "hello");
    REQUIRE(named.app_name == "hello");
    REQUIRE(named.explicit_name);

    const auto blank = make_build_request("/scripts/test_hello.py", BundleMode::OneDir, scenario_dir, {}, "");
    REQUIRE(blank.app_name == "test_hello");
    REQUIRE_FALSE(blank.explicit_name);
}

TEST_CASE("Arguments follow the fixed order with extras and name last", "[build]")
{
    const fs::path dir = "/w";
    auto request = make_build_request("/s/app.py", BundleMode::OneDir, dir, {"--clean", "--onefile"}, "custom");

    const auto args = BuildOrchestrator::compose_arguments(request);
    const std::vector<std::string> expected = {
        fs::path("/s/app.py").string(),
        "--debug",
        "--noupx",
        "--specpath", dir.string(),
        "--distpath", (dir / "dist").string(),
        "--workpath", (dir / "build").string(),
        "--log-level=DEBUG",
        "--onedir",
        "--clean",
        "--onefile",
        "--name", "custom",
    };
    REQUIRE(args == expected);
}

TEST_CASE("Without an explicit name no --name is passed", "[build]")
{
    const auto request = make_build_request("/s/app.py", BundleMode::OneFile, "/w");
    const auto args = BuildOrchestrator::compose_arguments(request);
    REQUIRE(args.back() == "--onefile");
    for (const auto& a : args) {
        REQUIRE(a != "--name");
    }
}

TEST_CASE("A shared modules directory is passed as an absolute search path before the mode", "[build]")
{
    auto request = make_build_request("/s/app.py", BundleMode::OneFile, "/w", {"--clean"});
    request.modules_dir = "/shared/modules";

    auto args = BuildOrchestrator::compose_arguments(request);
    REQUIRE(args.size() == 14);
    REQUIRE(args[9] == "--log-level=DEBUG");
    REQUIRE(args[10] == "--paths");
    REQUIRE(args[11] == fs::absolute("/shared/modules").lexically_normal().string());
    REQUIRE(args[12] == "--onefile");
    REQUIRE(args[13] == "--clean");

    request.modules_dir = "relative/modules";
    args = BuildOrchestrator::compose_arguments(request);
    REQUIRE(fs::path(args[11]).is_absolute());
    REQUIRE(fs::path(args[11]) == fs::absolute("relative/modules").lexically_normal());

    request.modules_dir.clear();
    args = BuildOrchestrator::compose_arguments(request);
    for (const auto& a : args) {
        REQUIRE(a != "--paths");
    }
}

TEST_CASE("A missing script fails the build without calling the tool", "[build]")
{
    test_support::TempDir tmp("build");
    test_support::FakePackager tool;
    const BuildOrchestrator orchestrator(tool);

    const auto request = make_build_request(tmp / "nope.py", BundleMode::OneDir, tmp.path());
    const auto outcome = orchestrator.build(request, DependencyGraph{});

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.message == "Script " + (tmp / "nope.py").string() + " not found.");
    REQUIRE(tool.calls.empty());
}

TEST_CASE("Tool failure is reported with the script name", "[build]")
{
    test_support::TempDir tmp("build");
    test_support::write_file(tmp / "app.py", "print('hi')\n");
    test_support::FakePackager tool;
    tool.succeed = false;

    const auto outcome = BuildOrchestrator(tool).build(
        make_build_request(tmp / "app.py", BundleMode::OneDir, tmp.path()), DependencyGraph{});

    REQUIRE_FALSE(outcome.success);
    REQUIRE(outcome.message == "Build of " + (tmp / "app.py").string() + " failed.");
    REQUIRE(outcome.diagnostics.find("refusing") != std::string::npos);
    REQUIRE(tool.calls.size() == 1);
}

namespace {

/// Tool that checks it was not handed the caller's graph object.
class GraphIdentityCheck : public PackagingTool
{
public:
    const nlohmann::json* shared{nullptr};
    bool isolated{false};

    bool run(const std::vector<std::string>&, const ToolConfig& config, std::string&) override
    {
        isolated = &config.graph.document() != shared && config.graph.document() == *shared;
        return true;
    }
};

} // namespace

TEST_CASE("Every build gets its own copy of the dependency graph", "[build]")
{
    test_support::TempDir tmp("build");
    test_support::write_file(tmp / "app.py", "");

    const DependencyGraph shared{nlohmann::json{{"nodes", {"a", "b"}}}};
    test_support::FakePackager tool;
    const auto request = make_build_request(tmp / "app.py", BundleMode::OneFile, tmp.path());

    REQUIRE(BuildOrchestrator(tool).build(request, shared).success);
    REQUIRE(tool.calls.front().graph == shared.document());
    REQUIRE(tool.calls.front().config_dir == tmp.path());

    GraphIdentityCheck check;
    check.shared = &shared.document();
    REQUIRE(BuildOrchestrator(check).build(request, shared).success);
    REQUIRE(check.isolated);
}

TEST_CASE("Dependency graph loads from JSON and rejects garbage", "[build]")
{
    test_support::TempDir tmp("build");
    test_support::write_file(tmp / "graph.json", R"({"modules": ["os", "sys"]})");
    const auto graph = DependencyGraph::load(tmp / "graph.json");
    REQUIRE_FALSE(graph.empty());
    REQUIRE(graph.document()["modules"].size() == 2);

    test_support::write_file(tmp / "bad.json", "{not json");
    REQUIRE_THROWS_AS(DependencyGraph::load(tmp / "bad.json"), std::runtime_error);
    REQUIRE_THROWS_AS(DependencyGraph::load(tmp / "absent.json"), std::runtime_error);
    REQUIRE(DependencyGraph{}.empty());
}
