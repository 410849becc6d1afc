#pragma once

#include "scenario.hpp"

#include <filesystem>
#include <vector>

namespace bundle::validation {

/**
 * \brief Loads declarative build scenarios from disk.
 *
 * Each file is composed of one or more scenario blocks separated by a line
 * containing three dashes (`---`). Within a block, key/value pairs take the form
 * `key=value` with leading/trailing whitespace ignored.
 *
 * Recognised keys:
 *   - `suite`:    Optional logical grouping name. Falls back to the file stem.
 *   - `id`:       Optional identifier. Falls back to the script stem.
 *   - `script`:   Script to package (required).
 *   - `name`:     Explicit application name, forwarded as `--name`.
 *   - `mode`:     `onedir`, `onefile` or `both` (default). `both` emits two
 *                 scenarios suffixed `[onedir]` and `[onefile]`.
 *   - `tool_arg`: One extra packaging-tool argument. Repeat the key for more;
 *                 order is preserved.
 *   - `app_arg`:  One argument for the built executable. Repeatable.
 *   - `manifest`: Manifest base name (defaults to the application name).
 *   - `attr.<name>`: Arbitrary attribute propagated to the reports.
 *
 * Example:
 * \code{.txt}
 * suite=multipackage
 * script=test_multipackage1.py
 * tool_arg=--clean
 * ---
 * script=test_hello.py
 * mode=onefile
 * app_arg=--verbose
 * \endcode
 *
 * Lines starting with `#` or empty lines are ignored. Unknown keys are preserved as
 * generic attributes.
 */
class ScenarioLoader {
public:
    ScenarioLoader() = default;

    [[nodiscard]] ScenarioPack load(const std::filesystem::path& file) const;

    /// Loads every `*.scn` file below `root` (or `root` itself when it is a file), sorted by path.
    [[nodiscard]] std::vector<ScenarioPack> load_directory(const std::filesystem::path& root) const;

    /**
     * Loads every root in order.
     * \throws std::runtime_error when the roots hold no scenario at all.
     */
    [[nodiscard]] std::vector<ScenarioPack> load_all(const std::vector<std::filesystem::path>& roots) const;
};

}  // namespace bundle::validation
