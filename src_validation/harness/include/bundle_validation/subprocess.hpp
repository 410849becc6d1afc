#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bundle::validation {

/// Environment block handed to a child process, keyed by variable name.
using Environment = std::map<std::string, std::string>;

/// Snapshot of the calling process' environment.
[[nodiscard]] Environment current_environment();

/**
 * \brief Description of one synchronous child process.
 *
 * - argv:        argument vector; argv[0] is what the child sees as its own name.
 * - executable:  file to launch. Empty means argv[0]. A relative path is resolved
 *                against `cwd`, never against a search path.
 * - cwd:         working directory of the child; empty inherits the caller's.
 * - env:         complete child environment; nullopt inherits the caller's.
 * - stdout_path: redirect stdout into this file (truncated); empty inherits the
 *                caller's stdout. stderr is always inherited.
 */
struct ProcessSpec {
    std::vector<std::string> argv;
    std::filesystem::path executable{};
    std::filesystem::path cwd{};
    std::optional<Environment> env{};
    std::filesystem::path stdout_path{};
};

/**
 * \brief Runs a child process to completion and returns its exit status.
 *
 * A normal exit yields the exit code. On POSIX a child terminated by signal `s`
 * yields `-s`. The call blocks with no timeout.
 *
 * \throws std::invalid_argument if argv is empty.
 * \throws std::system_error if the child could not be started (missing file,
 *         permission denied, bad working directory, redirect failure).
 */
int run_subprocess(const ProcessSpec& spec);

/**
 * \brief Resolves a program name through a `PATH`-style list.
 *
 * Names containing a directory separator are returned unchanged when they name
 * an existing file. On Windows `.exe` is tried as well.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_program(std::string_view name,
                                                                std::string_view search_path);

}  // namespace bundle::validation
