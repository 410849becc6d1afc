#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace bundle::validation {

/**
 * \brief Scenario-lifetime override of the harness' working directory and
 * environment variables.
 *
 * The first touch of the working directory or of a variable records its prior
 * state; the destructor puts every recorded value back, whether the scenario
 * passed, failed, or unwound through an exception. Working directory and
 * environment are process-wide, so at most one guard should be live at a time.
 */
class ScopedEnvironment {
public:
    ScopedEnvironment() = default;
    ~ScopedEnvironment();

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

    /// \throws std::filesystem::filesystem_error if `dir` cannot be entered.
    void change_directory(const std::filesystem::path& dir);

    void set_variable(const std::string& name, const std::string& value);
    void unset_variable(const std::string& name);

    /// Records `name` so it is restored on exit even if something else edits it.
    void preserve(const std::string& name);

    /// Puts everything back now; the destructor then has nothing left to do.
    void restore() noexcept;

private:
    std::optional<std::filesystem::path> saved_cwd_;
    std::map<std::string, std::optional<std::string>> saved_vars_;
};

/// Reads one variable of the harness process.
[[nodiscard]] std::optional<std::string> get_variable(const std::string& name);

}  // namespace bundle::validation
