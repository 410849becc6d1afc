#include "bundle_validation/build_orchestrator.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace bundle::validation {

DependencyGraph DependencyGraph::load(const fs::path& file) {
    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open dependency graph: " + file.string());
    }
    try {
        return DependencyGraph{nlohmann::json::parse(input)};
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Malformed dependency graph " + file.string() + ": " + ex.what());
    }
}

BuildRequest make_build_request(const fs::path& script,
                                BundleMode mode,
                                const fs::path& scenario_dir,
                                std::vector<std::string> tool_args,
                                std::optional<std::string> app_name) {
    BuildRequest request;
    request.script = script;
    request.mode = mode;
    request.tool_args = std::move(tool_args);
    request.explicit_name = app_name.has_value() && !app_name->empty();
    request.app_name = request.explicit_name ? *app_name : script.stem().string();
    request.spec_dir = scenario_dir;
    request.dist_dir = scenario_dir / "dist";
    request.build_dir = scenario_dir / "build";
    request.config_dir = scenario_dir;
    return request;
}

std::vector<std::string> BuildOrchestrator::compose_arguments(const BuildRequest& request) {
    std::vector<std::string> args = {
        request.script.string(),
        "--debug",
        "--noupx",
        "--specpath", request.spec_dir.string(),
        "--distpath", request.dist_dir.string(),
        "--workpath", request.build_dir.string(),
        "--log-level=DEBUG",
    };
    if (!request.modules_dir.empty()) {
        // The tool runs from the scenario directory; a relative path would resolve there.
        args.emplace_back("--paths");
        args.push_back(std::filesystem::absolute(request.modules_dir).lexically_normal().string());
    }
    args.emplace_back(mode_flag(request.mode));
    args.insert(args.end(), request.tool_args.begin(), request.tool_args.end());
    if (request.explicit_name) {
        args.emplace_back("--name");
        args.push_back(request.app_name);
    }
    return args;
}

BuildOutcome BuildOrchestrator::build(const BuildRequest& request,
                                      const DependencyGraph& shared_graph) const {
    BuildOutcome outcome;
    outcome.dist_dir = request.dist_dir;

    std::error_code ec;
    if (!fs::is_regular_file(request.script, ec)) {
        outcome.message = "Script " + request.script.string() + " not found.";
        return outcome;
    }

    ToolConfig config;
    config.config_dir = request.config_dir;
    config.graph = shared_graph;

    const auto args = compose_arguments(request);
    outcome.success = tool_.run(args, config, outcome.diagnostics);
    if (!outcome.success) {
        outcome.message = "Build of " + request.script.string() + " failed.";
    }
    return outcome;
}

}  // namespace bundle::validation
