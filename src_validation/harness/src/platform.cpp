#include "bundle_validation/platform.hpp"

#include <array>
#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
  #include <windows.h>
#endif

namespace {

using bundle::validation::BundleMode;
using bundle::validation::PathTemplate;
using bundle::validation::Platform;

struct ConventionRow {
    Platform platform;
    BundleMode mode;
    std::vector<PathTemplate> templates;
};

const std::vector<ConventionRow>& convention_table() {
    static const std::vector<ConventionRow> table = {
        {Platform::Unix, BundleMode::OneDir, {
            {"{name}/{name}", false},
            {"{name}/{name}_?", true},
        }},
        {Platform::Unix, BundleMode::OneFile, {
            {"{name}", false},
            {"{name}_?", true},
        }},
        // .app bundles are emitted next to the plain layout in either mode.
        {Platform::MacOS, BundleMode::OneDir, {
            {"{name}/{name}", false},
            {"{name}/{name}_?", true},
            {"{name}.app/Contents/MacOS/{name}", false},
        }},
        {Platform::MacOS, BundleMode::OneFile, {
            {"{name}", false},
            {"{name}_?", true},
            {"{name}.app/Contents/MacOS/{name}", false},
        }},
        {Platform::Windows, BundleMode::OneDir, {
            {"{name}/{name}", false},
            {"{name}/{name}.exe", false},
            {"{name}/{name}_?", true},
            {"{name}/{name}_?.exe", true},
        }},
        {Platform::Windows, BundleMode::OneFile, {
            {"{name}", false},
            {"{name}.exe", false},
            {"{name}_?", true},
            {"{name}_?.exe", true},
        }},
    };
    return table;
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

#ifdef _WIN32
std::string narrow(const wchar_t* wide, UINT length) {
    if (length == 0) {
        return {};
    }
    const int size = ::WideCharToMultiByte(CP_UTF8, 0, wide, static_cast<int>(length),
                                           nullptr, 0, nullptr, nullptr);
    std::string out(static_cast<std::size_t>(size), '\0');
    ::WideCharToMultiByte(CP_UTF8, 0, wide, static_cast<int>(length),
                          out.data(), size, nullptr, nullptr);
    return out;
}
#endif

}  // namespace

namespace bundle::validation {

const std::vector<PathTemplate>& path_templates(Platform platform, BundleMode mode) {
    for (const auto& row : convention_table()) {
        if (row.platform == platform && row.mode == mode) {
            return row.templates;
        }
    }
    static const std::vector<PathTemplate> none;
    return none;
}

Platform host_platform() noexcept {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#else
    return Platform::Unix;
#endif
}

std::string_view to_string(Platform platform) noexcept {
    switch (platform) {
        case Platform::Windows: return "windows";
        case Platform::MacOS: return "macos";
        case Platform::Unix: return "unix";
    }
    return "unix";
}

std::string_view to_string(BundleMode mode) noexcept {
    switch (mode) {
        case BundleMode::OneDir: return "onedir";
        case BundleMode::OneFile: return "onefile";
    }
    return "onedir";
}

std::optional<Platform> parse_platform(std::string_view raw) {
    const auto lowered = to_lower_copy(raw);
    if (lowered == "windows" || lowered == "win32") return Platform::Windows;
    if (lowered == "macos" || lowered == "darwin") return Platform::MacOS;
    if (lowered == "unix" || lowered == "linux") return Platform::Unix;
    return std::nullopt;
}

std::optional<BundleMode> parse_bundle_mode(std::string_view raw) {
    const auto lowered = to_lower_copy(raw);
    if (lowered == "onedir") return BundleMode::OneDir;
    if (lowered == "onefile") return BundleMode::OneFile;
    return std::nullopt;
}

std::string_view mode_flag(BundleMode mode) noexcept {
    return mode == BundleMode::OneFile ? "--onefile" : "--onedir";
}

std::vector<std::string> minimal_search_path(Platform platform) {
    if (platform != Platform::Windows) {
        return {};
    }

#ifdef _WIN32
    std::array<wchar_t, MAX_PATH> buffer{};
    std::vector<std::string> dirs;
    UINT len = ::GetSystemDirectoryW(buffer.data(), static_cast<UINT>(buffer.size()));
    if (len > 0 && len < buffer.size()) {
        dirs.push_back(narrow(buffer.data(), len));
    }
    len = ::GetWindowsDirectoryW(buffer.data(), static_cast<UINT>(buffer.size()));
    if (len > 0 && len < buffer.size()) {
        dirs.push_back(narrow(buffer.data(), len));
    }
    if (!dirs.empty()) {
        return dirs;
    }
#endif

    std::string root = "C:\\Windows";
    if (const char* system_root = std::getenv("SystemRoot"); system_root && *system_root) {
        root = system_root;
    }
    return {root + "\\system32", root};
}

char search_path_separator(Platform platform) noexcept {
    return platform == Platform::Windows ? ';' : ':';
}

}  // namespace bundle::validation
