#pragma once

#include "artifact_locator.hpp"
#include "platform.hpp"
#include "subprocess.hpp"

#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace bundle::validation {

struct ExecutionResult {
    Artifact artifact;
    int exit_code{0};

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

/**
 * \brief Derives the environment an artifact runs under.
 *
 * `PATH` is dropped so the artifact cannot reach anything it did not ship.
 * When `system_path` is non-empty (Windows) `PATH` is rebuilt from those
 * directories alone. On Windows the variable name is matched case-insensitively.
 * Every other variable is carried over untouched.
 */
[[nodiscard]] Environment make_child_environment(Environment base,
                                                 Platform platform,
                                                 const std::vector<std::string>& system_path);

/**
 * \brief Executes located artifacts in isolation.
 *
 * Each artifact runs with its own directory as working directory and is invoked
 * as `./<file>` on POSIX, by absolute path on Windows (CreateProcess does not
 * look in the child's working directory). Output goes straight to the harness'
 * stdout/stderr.
 */
class ExecutionRunner {
public:
    struct Config {
        Platform platform{host_platform()};
        /// Empty selects minimal_search_path(platform).
        std::vector<std::string> system_path{};
        std::ostream* log{&std::cout};
    };

    ExecutionRunner() : ExecutionRunner(Config{}) {}
    explicit ExecutionRunner(Config config);

    /// \throws std::system_error when the artifact cannot be launched at all.
    [[nodiscard]] ExecutionResult run(const Artifact& artifact,
                                      const std::vector<std::string>& args) const;

    /// How the artifact is named on its own command line.
    [[nodiscard]] std::string invocation(const Artifact& artifact) const;

    [[nodiscard]] Environment child_environment() const;

private:
    Config config_;
};

}  // namespace bundle::validation
