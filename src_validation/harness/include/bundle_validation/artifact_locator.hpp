#pragma once

#include "platform.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace bundle::validation {

/**
 * \brief Executable produced by a build, identified through naming conventions.
 *
 * Instances only come out of ArtifactLocator::locate(); nothing else knows how
 * a path maps to a variant suffix.
 */
class Artifact {
public:
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Empty for the primary executable, the `_?` character for multipackage variants.
    [[nodiscard]] const std::string& suffix() const noexcept { return suffix_; }

    [[nodiscard]] bool is_variant() const noexcept { return !suffix_.empty(); }

    /// File name without a trailing `.exe`; pairs the artifact with its `.toc` manifest.
    [[nodiscard]] std::string id() const;

private:
    friend class ArtifactLocator;

    Artifact(std::filesystem::path path, std::string suffix)
        : path_(std::move(path)), suffix_(std::move(suffix)) {}

    std::filesystem::path path_;
    std::string suffix_;
};

/**
 * \brief Reconstructs the set of runnable artifacts of a build.
 *
 * The build tool never reports where it put its output, so the locator expands
 * the platform convention table of both bundle modes against `dist_dir`:
 *
 *   - one-dir primary        `<dist>/<name>/<name>`
 *   - one-file primary       `<dist>/<name>`
 *   - one-dir multipackage   `<dist>/<name>/<name>_?`
 *   - one-file multipackage  `<dist>/<name>_?`
 *   - Windows adds the `.exe` form of each, macOS adds `<name>.app/Contents/MacOS/<name>`.
 *
 * Only regular files are kept. The union is de-duplicated and ordered with the
 * primary executables first, then variants by suffix.
 */
class ArtifactLocator {
public:
    explicit ArtifactLocator(Platform platform = host_platform()) : platform_(platform) {}

    [[nodiscard]] std::vector<Artifact> locate(const std::filesystem::path& dist_dir,
                                               const std::string& name) const;

    [[nodiscard]] Platform platform() const noexcept { return platform_; }

private:
    Platform platform_;
};

}  // namespace bundle::validation
