#include "bundle_validation/packager_bridge.hpp"
#include "bundle_validation/scoped_environment.hpp"
#include "bundle_validation/subprocess.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace bundle::validation::packager_bridge {

static bool write_graph(const fs::path& p, const nlohmann::json& graph, std::string& diag) {
    std::error_code ec;
    if (auto parent = p.parent_path(); !parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            diag += "Failed to create directory " + parent.string() + ": " + ec.message() + "\n";
            return false;
        }
    }
    std::ofstream ofs(p, std::ios::binary);
    if (!ofs) {
        diag += "Failed to open for write: " + p.string() + "\n";
        return false;
    }
    ofs << graph.dump();
    if (!ofs) {
        diag += "Short write: " + p.string() + "\n";
        return false;
    }
    return true;
}

Session::Session(Config cfg) : cfg_(std::move(cfg)) {}

bool Session::init(std::string& diag_out) {
    if (ready_) return true;

    if (cfg_.executable.empty()) {
        diag_out += "No packager executable configured\n";
        return false;
    }

    const auto search_path = get_variable("PATH").value_or("");
    const auto found = find_program(cfg_.executable, search_path);
    if (!found) {
        diag_out += "Packager executable not found: " + cfg_.executable + "\n";
        return false;
    }

    // Scenarios change the working directory; keep the resolved path usable from anywhere.
    resolved_ = fs::absolute(*found);
    ready_ = true;
    return true;
}

bool Session::run(const std::vector<std::string>& args,
                  const ToolConfig& config,
                  std::string& diag_out) {
    if (!ready_ && !init(diag_out)) {
        return false;
    }

    auto env = current_environment();
    if (!config.config_dir.empty()) {
        std::error_code ec;
        fs::create_directories(config.config_dir, ec);
        if (ec) {
            diag_out += "Failed to create config dir " + config.config_dir.string() + ": " + ec.message() + "\n";
            return false;
        }
        if (!config.graph.empty() &&
            !write_graph(config.config_dir / cfg_.graph_file_name, config.graph.document(), diag_out)) {
            return false;
        }
        if (!cfg_.config_dir_variable.empty()) {
            env[cfg_.config_dir_variable] = config.config_dir.string();
        }
    }

    ProcessSpec spec;
    spec.executable = resolved_;
    spec.argv.push_back(cfg_.executable);
    spec.argv.insert(spec.argv.end(), cfg_.prefix_args.begin(), cfg_.prefix_args.end());
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.env = std::move(env);

    const int rc = run_subprocess(spec);
    if (rc != 0) {
        diag_out += "Packager failed, rc=" + std::to_string(rc) + "\n";
        return false;
    }
    return true;
}

} // namespace bundle::validation::packager_bridge
