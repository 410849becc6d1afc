#pragma once

#include "bundle_validation/manifest_verifier.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace bundle::validation::archive_bridge
{

using ::bundle::validation::ContentLister;

/**
 * External archive viewer bridge.
 *
 * Lists the internal files of a bundled executable by running a command with the
 * artifact path appended, e.g. `pyi-archive_viewer --list --brief`. The command's
 * stdout is captured into a file below `work_dir`; each non-empty line is one
 * internal name.
 */
class Session : public ContentLister
{
public:
    struct Config
    {
        // Command prefix; the artifact path is appended as the last argument.
        std::vector<std::string> command;

        // Directory for captured listings (system temp when empty).
        std::filesystem::path work_dir;
    };

    explicit Session(Config cfg);

    [[nodiscard]] bool initialized() const noexcept { return ready_; }

    /**
     * Resolves the lister command and prepares the work directory.
     * Returns true on success. Diagnostics appended to diag_out.
     */
    bool init(std::string& diag_out);

    /// \throws std::runtime_error when the command fails or its output cannot be read.
    [[nodiscard]] std::vector<std::string> list(const std::filesystem::path& artifact) const override;

private:
    Config cfg_;
    std::filesystem::path resolved_;
    std::filesystem::path work_root_;
    bool ready_{false};
    mutable unsigned sequence_{0};
};

/**
 * Splits a command line on whitespace.
 *
 * Single quotes keep everything literally; double quotes allow `\"` and `\\`.
 * Outside quotes a backslash only escapes a quote or a space.
 * \throws std::runtime_error on an unterminated quote.
 */
[[nodiscard]] std::vector<std::string> split_command(const std::string& command_line);

} // namespace bundle::validation::archive_bridge
