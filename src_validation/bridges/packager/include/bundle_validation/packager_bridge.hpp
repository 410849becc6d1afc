#pragma once

#include "bundle_validation/build_request.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace bundle::validation::packager_bridge
{

using ::bundle::validation::PackagingTool;
using ::bundle::validation::ToolConfig;

/**
 * Command-line packaging tool bridge.
 *
 * Runs an external packager (PyInstaller by default) as a child process in the
 * harness' current directory, which the engine points at the scenario directory.
 * The dependency graph copy is handed over as a JSON file inside the config
 * directory, and the config directory itself through an environment variable set
 * for the child only.
 */
class Session : public PackagingTool
{
public:
    struct Config
    {
        // Packager executable; bare names are resolved through the harness' PATH.
        std::string executable{"pyinstaller"};

        // Arguments placed before the orchestrator's argument list (e.g. "-m", "PyInstaller").
        std::vector<std::string> prefix_args;

        // Variable through which the child learns its configuration directory.
        std::string config_dir_variable{"PYINSTALLER_CONFIG_DIR"};

        // File name of the graph copy below the configuration directory.
        std::string graph_file_name{"dependency_graph.json"};
    };

    explicit Session(Config cfg);

    [[nodiscard]] bool initialized() const noexcept { return ready_; }

    [[nodiscard]] const std::filesystem::path& resolved_executable() const noexcept { return resolved_; }

    /**
     * Resolves the packager executable.
     * Returns true on success. Diagnostics appended to diag_out.
     */
    bool init(std::string& diag_out);

    /**
     * Runs one packaging build.
     *
     * Parameters:
     *  - args:      orchestrator argument list (script first)
     *  - config:    configuration directory and private graph copy
     *  - diag_out:  receives diagnostics
     *
     * Returns true when the packager exits with code 0.
     * Throws std::system_error when the packager cannot be launched.
     */
    bool run(const std::vector<std::string>& args,
             const ToolConfig& config,
             std::string& diag_out) override;

private:
    Config cfg_;
    std::filesystem::path resolved_;
    bool ready_{false};
};

} // namespace bundle::validation::packager_bridge
