#include "bundle_validation/engine.hpp"
#include "bundle_validation/build_orchestrator.hpp"
#include "bundle_validation/manifest.hpp"
#include "bundle_validation/scoped_environment.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool write_text(const fs::path& path, const std::string& text, std::string& diag) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    std::ofstream ofs(path);
    if (!ofs) { diag += "open failed: " + path.string() + "\n"; return false; }
    ofs << text;
    if (!ofs) { diag += "write failed: " + path.string() + "\n"; return false; }
    return true;
}

// Scenario ids and suites become directory names that get wiped before each run.
std::string safe_component(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char ch : raw) {
        const bool keep = std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '[' ||
                          ch == ']' || ch == '#';
        out.push_back(keep ? static_cast<char>(ch) : '_');
    }
    if (out.empty() || out == "." || out == "..") {
        out = "_" + out;
    }
    return out;
}

fs::path absolute_or_empty(const fs::path& path) {
    return path.empty() ? path : fs::absolute(path).lexically_normal();
}

}  // namespace

namespace bundle::validation {

std::string_view to_string(Stage stage) noexcept {
    switch (stage) {
        case Stage::None: return "none";
        case Stage::Build: return "build";
        case Stage::Locate: return "locate";
        case Stage::Execute: return "execute";
        case Stage::Verify: return "verify";
    }
    return "none";
}

Engine::Engine(Config config, PackagingTool& tool, const ContentLister* lister, const DependencyGraph& graph)
    : config_{std::move(config)}, tool_(tool), lister_(lister), graph_(graph) {
    // Scenarios chdir into their own directory; pin everything relative now.
    config_.work_root = absolute_or_empty(config_.work_root.empty() ? fs::path("build/validation")
                                                                    : config_.work_root);
    config_.scripts_dir = absolute_or_empty(config_.scripts_dir);
    config_.manifest_dir = absolute_or_empty(config_.manifest_dir);
    config_.modules_dir = absolute_or_empty(config_.modules_dir);
}

void Engine::drive(const Scenario& scenario,
                   const fs::path& scenario_dir,
                   ScenarioOutcome& outcome,
                   std::string& diag) const {
    auto fail = [&](Stage stage, std::string message) {
        outcome.status = "FAIL";
        outcome.stage = stage;
        outcome.message = std::move(message);
    };

    ScopedEnvironment env;
    env.preserve("PATH");
    env.change_directory(scenario_dir);

    fs::path script{scenario.script};
    if (script.is_relative() && !config_.scripts_dir.empty()) {
        script = config_.scripts_dir / script;
    }

    std::optional<std::string> app_name;
    if (!scenario.app_name.empty()) {
        app_name = scenario.app_name;
    }
    BuildRequest request = make_build_request(script, scenario.mode, scenario_dir, scenario.tool_args, app_name);
    request.modules_dir = config_.modules_dir;

    if (config_.log) {
        *config_.log << "BUILDING: " << request.script.string() << " (" << to_string(request.mode)
                     << ")" << std::endl;
    }

    // Built
    const BuildOrchestrator orchestrator(tool_);
    const BuildOutcome built = orchestrator.build(request, graph_);
    diag += built.diagnostics;
    if (!built.success) {
        fail(Stage::Build, built.message);
        return;
    }

    // Located
    const ArtifactLocator locator(config_.platform);
    const auto artifacts = locator.locate(built.dist_dir, request.app_name);
    for (const auto& artifact : artifacts) {
        outcome.artifacts.push_back(artifact.path());
        diag += "located: " + artifact.path().string() + "\n";
    }
    if (artifacts.empty()) {
        fail(Stage::Locate, "No executable file was found.");
        return;
    }

    // Executed
    const ExecutionRunner runner(ExecutionRunner::Config{.platform = config_.platform,
                                                         .system_path = {},
                                                         .log = config_.log});
    for (const auto& artifact : artifacts) {
        auto result = runner.run(artifact, scenario.app_args);
        diag += "exit " + std::to_string(result.exit_code) + ": " + artifact.path().string() + "\n";
        const bool ok = result.succeeded();
        outcome.executions.push_back(std::move(result));
        if (!ok) {
            fail(Stage::Execute, "Running exe " + artifact.path().string() +
                                     " failed with return-code " +
                                     std::to_string(outcome.executions.back().exit_code) + ".");
            return;
        }
    }

    // Verified
    const std::string manifest_base = scenario.manifest.empty() ? request.app_name : scenario.manifest;
    const ManifestLoader loader;
    const auto manifests = loader.load_for(config_.manifest_dir, manifest_base);
    if (!manifests.empty()) {
        if (lister_ == nullptr) {
            throw std::runtime_error("Scenario has " + std::to_string(manifests.size()) +
                                     " manifest(s) but no content lister is configured");
        }
        const ManifestVerifier verifier(*lister_, config_.log);
        auto verified = verifier.verify(artifacts, manifests);
        outcome.missing = verified.missing;
        if (!verified.ok) {
            fail(Stage::Verify, "Matching .toc of " + request.script.string() + " failed.\n" +
                                    verified.message());
            return;
        }
    }

    outcome.status = "PASS";
    outcome.stage = Stage::None;
    outcome.message = std::to_string(artifacts.size()) + " executable(s) passed";
    if (!manifests.empty()) {
        outcome.message += ", " + std::to_string(manifests.size()) + " manifest(s) matched";
    }
}

ScenarioOutcome Engine::run_scenario(const Scenario& scenario) const {
    ScenarioOutcome outcome{};
    outcome.scenario = scenario;

    std::string diag;
    const fs::path scenario_dir = config_.work_root / safe_component(scenario.suite) / safe_component(scenario.id);

    try {
        std::error_code ec;
        fs::remove_all(scenario_dir, ec);
        fs::create_directories(scenario_dir);
        drive(scenario, scenario_dir, outcome, diag);
    } catch (const std::exception& ex) {
        outcome.status = "ERROR";
        outcome.message = ex.what();
    }

    if (config_.log) {
        *config_.log << scenario.suite << "/" << scenario.id << ": " << outcome.status;
        if (outcome.stage != Stage::None) {
            *config_.log << " (" << to_string(outcome.stage) << ")";
        }
        *config_.log << std::endl;
    }

    // Persist diagnostic accumulator as well
    (void)write_text(scenario_dir / "engine_diag.txt", diag + outcome.message + "\n", diag);
    return outcome;
}

std::vector<ScenarioOutcome> Engine::run(const ScenarioPack& pack) const {
    std::vector<ScenarioOutcome> outcomes;
    outcomes.reserve(pack.scenarios.size());

    for (const auto& scenario : pack.scenarios) {
        outcomes.push_back(run_scenario(scenario));
    }

    return outcomes;
}

}  // namespace bundle::validation
