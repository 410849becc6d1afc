#pragma once

#include "platform.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace bundle::validation {

/**
 * \brief Precomputed dependency graph shared by every scenario of a run.
 *
 * The harness never looks inside; it only loads, copies and hands it over.
 * Copies are deep, so a tool that mutates its copy cannot leak into the next
 * scenario.
 */
class DependencyGraph {
public:
    DependencyGraph() = default;
    explicit DependencyGraph(nlohmann::json document) : document_(std::move(document)) {}

    /// \throws std::runtime_error if the file is unreadable or not valid JSON.
    [[nodiscard]] static DependencyGraph load(const std::filesystem::path& file);

    [[nodiscard]] const nlohmann::json& document() const noexcept { return document_; }
    [[nodiscard]] nlohmann::json& document() noexcept { return document_; }
    [[nodiscard]] bool empty() const noexcept { return document_.is_null(); }

private:
    nlohmann::json document_{};
};

/**
 * \brief Everything needed to package one script in one bundle mode.
 *
 * Built once per scenario by make_build_request() and only read afterwards.
 */
struct BuildRequest {
    std::filesystem::path script;
    std::string app_name;
    bool explicit_name{false};  ///< pass `--name <app_name>` to the tool
    BundleMode mode{BundleMode::OneDir};
    std::vector<std::string> tool_args;
    std::filesystem::path modules_dir;  ///< shared module search directory, empty for none
    std::filesystem::path spec_dir;
    std::filesystem::path dist_dir;
    std::filesystem::path build_dir;
    std::filesystem::path config_dir;
};

/**
 * \brief Lays out a request under `scenario_dir`.
 *
 * spec and config files go to `scenario_dir`, output to `scenario_dir/dist`,
 * intermediates to `scenario_dir/build`. Without `app_name` the application is
 * named after the script stem.
 */
[[nodiscard]] BuildRequest make_build_request(const std::filesystem::path& script,
                                              BundleMode mode,
                                              const std::filesystem::path& scenario_dir,
                                              std::vector<std::string> tool_args = {},
                                              std::optional<std::string> app_name = std::nullopt);

/// Side-channel configuration the packaging tool receives with its arguments.
struct ToolConfig {
    std::filesystem::path config_dir;  ///< where the tool persists its own settings
    DependencyGraph graph;             ///< private copy
};

struct BuildOutcome {
    bool success{false};
    std::filesystem::path dist_dir;
    std::string message;      ///< failure summary, empty on success
    std::string diagnostics;  ///< whatever the tool adapter reported
};

/**
 * \brief The packaging tool as seen by the harness.
 *
 * Implementations turn the argument list into files below the dist directory.
 */
class PackagingTool {
public:
    virtual ~PackagingTool() = default;

    /**
     * Runs one build.
     * Returns true when the tool reports success. Diagnostics are appended to diag_out.
     */
    virtual bool run(const std::vector<std::string>& args,
                     const ToolConfig& config,
                     std::string& diag_out) = 0;
};

}  // namespace bundle::validation
