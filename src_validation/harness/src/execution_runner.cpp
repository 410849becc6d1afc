#include "bundle_validation/execution_runner.hpp"

#include <cctype>
#include <filesystem>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

namespace bundle::validation {

Environment make_child_environment(Environment base,
                                   Platform platform,
                                   const std::vector<std::string>& system_path) {
    for (auto it = base.begin(); it != base.end();) {
        const bool is_path = platform == Platform::Windows ? iequals(it->first, "PATH")
                                                           : it->first == "PATH";
        it = is_path ? base.erase(it) : std::next(it);
    }

    if (!system_path.empty()) {
        std::string joined;
        for (const auto& dir : system_path) {
            if (!joined.empty()) {
                joined.push_back(search_path_separator(platform));
            }
            joined += dir;
        }
        base["PATH"] = std::move(joined);
    }
    return base;
}

ExecutionRunner::ExecutionRunner(Config config) : config_{std::move(config)} {
    if (config_.system_path.empty()) {
        config_.system_path = minimal_search_path(config_.platform);
    }
}

std::string ExecutionRunner::invocation(const Artifact& artifact) const {
    if (config_.platform == Platform::Windows) {
        return fs::absolute(artifact.path()).make_preferred().string();
    }
    return (fs::path(".") / artifact.path().filename()).string();
}

Environment ExecutionRunner::child_environment() const {
    return make_child_environment(current_environment(), config_.platform, config_.system_path);
}

ExecutionResult ExecutionRunner::run(const Artifact& artifact,
                                     const std::vector<std::string>& args) const {
    ProcessSpec spec;
    spec.argv.push_back(invocation(artifact));
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.cwd = fs::absolute(artifact.path()).parent_path();
    spec.env = child_environment();

    if (config_.log) {
        *config_.log << "RUNNING: " << spec.argv.front() << std::endl;
    }

    const int code = run_subprocess(spec);
    return ExecutionResult{artifact, code};
}

}  // namespace bundle::validation
