#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bundle::validation {

enum class Platform {
    Windows,
    MacOS,
    Unix,  ///< Linux, BSDs and any other POSIX host
};

enum class BundleMode {
    OneDir,   ///< executable plus loose support files in `<dist>/<name>/`
    OneFile,  ///< single self-contained executable in `<dist>/`
};

/**
 * \brief One candidate location of an executable below a dist directory.
 *
 * `relative` is a '/'-separated path in which every `{name}` is replaced by the
 * artifact base name. Only the final component may carry wildcards (`?` for
 * exactly one character, `*` for any run of characters).
 */
struct PathTemplate {
    std::string relative;
    bool multipackage{false};  ///< `?` stands for the variant suffix
};

/**
 * \brief Convention table lookup.
 *
 * Every `(Platform, BundleMode)` pair maps to a fixed template list. Supporting a
 * new platform means adding rows to the table in platform.cpp.
 */
[[nodiscard]] const std::vector<PathTemplate>& path_templates(Platform platform, BundleMode mode);

/// Platform the harness itself was compiled for.
[[nodiscard]] Platform host_platform() noexcept;

[[nodiscard]] std::string_view to_string(Platform platform) noexcept;
[[nodiscard]] std::string_view to_string(BundleMode mode) noexcept;

/// Accepts `windows/win32`, `macos/darwin`, `unix/linux` (case-insensitive).
[[nodiscard]] std::optional<Platform> parse_platform(std::string_view raw);

/// Accepts `onedir` and `onefile` (case-insensitive).
[[nodiscard]] std::optional<BundleMode> parse_bundle_mode(std::string_view raw);

/// Packaging tool flag selecting the mode (`--onedir` / `--onefile`).
[[nodiscard]] std::string_view mode_flag(BundleMode mode) noexcept;

/**
 * \brief Directories the child `PATH` is rebuilt from on `platform`.
 *
 * An empty result means the variable is removed from the child environment.
 * Only Windows needs a minimal path (system32 and the Windows directory) for
 * console and DLL resolution.
 */
[[nodiscard]] std::vector<std::string> minimal_search_path(Platform platform);

[[nodiscard]] char search_path_separator(Platform platform) noexcept;

}  // namespace bundle::validation
