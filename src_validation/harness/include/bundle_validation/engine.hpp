#pragma once

#include "artifact_locator.hpp"
#include "build_request.hpp"
#include "execution_runner.hpp"
#include "manifest_verifier.hpp"
#include "platform.hpp"
#include "scenario.hpp"

#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace bundle::validation {

/// Stage a scenario stopped at. `None` for scenarios that passed.
enum class Stage {
    None,
    Build,
    Locate,
    Execute,
    Verify,
};

[[nodiscard]] std::string_view to_string(Stage stage) noexcept;

struct ScenarioOutcome {
    Scenario scenario;
    std::string status;   ///< PASS / FAIL / ERROR
    Stage stage{Stage::None};
    std::string message;  ///< Human readable diagnostics
    std::vector<std::filesystem::path> artifacts;
    std::vector<ExecutionResult> executions;
    std::vector<MissingEntry> missing;
};

/**
 * \brief Drives one scenario through build, locate, execute and verify.
 *
 * Every scenario gets a fresh directory `<work_root>/<suite>/<id>` which doubles
 * as spec, config and working directory for the build. The harness' own working
 * directory and `PATH` are restored once the scenario ends.
 *
 * FAIL outcomes name the stage that failed. Exceptions (unlaunchable tool,
 * broken manifest, ...) become ERROR outcomes so the remaining scenarios of a pack
 * still run.
 */
class Engine {
public:
    struct Config {
        std::filesystem::path work_root{};
        std::filesystem::path scripts_dir{};
        std::filesystem::path manifest_dir{};  ///< empty disables manifest checks
        std::filesystem::path modules_dir{};   ///< added to every build's module search path
        Platform platform{host_platform()};
        std::ostream* log{&std::cout};
    };

    /**
     * `tool` and `graph` must outlive the engine. `lister` may be null when no
     * scenario carries manifests.
     */
    Engine(Config config, PackagingTool& tool, const ContentLister* lister, const DependencyGraph& graph);

    [[nodiscard]] ScenarioOutcome run_scenario(const Scenario& scenario) const;

    [[nodiscard]] std::vector<ScenarioOutcome> run(const ScenarioPack& pack) const;

private:
    void drive(const Scenario& scenario,
               const std::filesystem::path& scenario_dir,
               ScenarioOutcome& outcome,
               std::string& diag) const;

    Config config_;
    PackagingTool& tool_;
    const ContentLister* lister_;
    const DependencyGraph& graph_;
};

}  // namespace bundle::validation
