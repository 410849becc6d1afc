#include "bundle_validation/scoped_environment.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace {

void write_variable(const std::string& name, const std::optional<std::string>& value) noexcept {
#ifdef _WIN32
    // An empty value removes the variable.
    ::_putenv_s(name.c_str(), value ? value->c_str() : "");
#else
    if (value) {
        ::setenv(name.c_str(), value->c_str(), 1);
    } else {
        ::unsetenv(name.c_str());
    }
#endif
}

}  // namespace

namespace bundle::validation {

std::optional<std::string> get_variable(const std::string& name) {
    if (const char* value = std::getenv(name.c_str()); value != nullptr) {
        return std::string{value};
    }
    return std::nullopt;
}

ScopedEnvironment::~ScopedEnvironment() {
    restore();
}

void ScopedEnvironment::change_directory(const fs::path& dir) {
    if (!saved_cwd_) {
        saved_cwd_ = fs::current_path();
    }
    fs::current_path(dir);
}

void ScopedEnvironment::preserve(const std::string& name) {
    if (saved_vars_.count(name) == 0) {
        saved_vars_.emplace(name, get_variable(name));
    }
}

void ScopedEnvironment::set_variable(const std::string& name, const std::string& value) {
    preserve(name);
    write_variable(name, value);
}

void ScopedEnvironment::unset_variable(const std::string& name) {
    preserve(name);
    write_variable(name, std::nullopt);
}

void ScopedEnvironment::restore() noexcept {
    for (const auto& [name, value] : saved_vars_) {
        write_variable(name, value);
    }
    saved_vars_.clear();

    if (saved_cwd_) {
        std::error_code ec;
        fs::current_path(*saved_cwd_, ec);
        saved_cwd_.reset();
    }
}

}  // namespace bundle::validation
