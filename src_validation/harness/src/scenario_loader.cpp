#include "bundle_validation/scenario_loader.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";
constexpr std::string_view kScenarioExtension = ".scn";

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

std::string location(const std::filesystem::path& file, std::size_t line_no) {
    return file.string() + ":" + std::to_string(line_no);
}

}  // namespace

namespace bundle::validation {

ScenarioPack ScenarioLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("Scenario file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Scenario path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open scenario file: " + file.string());
    }

    ScenarioPack pack;
    pack.source_file = file.string();

    std::string default_suite = file.stem().string();
    if (default_suite.empty()) {
        default_suite = file.filename().string();
    }

    Scenario current;
    current.suite = default_suite;
    bool both_modes = true;
    bool touched = false;
    std::size_t block_line = 0;

    auto reset_current = [&]() {
        current = Scenario{};
        current.suite = default_suite;
        both_modes = true;
        touched = false;
    };

    auto push_current = [&]() {
        if (!touched) {
            reset_current();
            return;
        }
        if (current.script.empty()) {
            throw std::runtime_error("Scenario block without 'script' at " +
                                     location(file, block_line));
        }
        if (current.suite.empty()) {
            current.suite = default_suite;
        }
        if (current.id.empty()) {
            current.id = std::filesystem::path(current.script).stem().string();
        }
        if (current.id.empty()) {
            current.id = default_suite + "#" + std::to_string(pack.scenarios.size() + 1);
        }

        if (both_modes) {
            Scenario onedir = current;
            onedir.mode = BundleMode::OneDir;
            onedir.id += "[onedir]";
            Scenario onefile = std::move(current);
            onefile.mode = BundleMode::OneFile;
            onefile.id += "[onefile]";
            pack.scenarios.push_back(std::move(onedir));
            pack.scenarios.push_back(std::move(onefile));
        } else {
            pack.scenarios.push_back(std::move(current));
        }
        reset_current();
    };

    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;

        const auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        if (trimmed == "---") {
            push_current();
            continue;
        }

        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            throw std::runtime_error("Expected 'key=value' entry at " + location(file, line_no));
        }

        auto key = trim_copy(std::string_view{trimmed}.substr(0, delimiter));
        auto value = trim_copy(std::string_view{trimmed}.substr(delimiter + 1));

        if (key.empty()) {
            throw std::runtime_error("Empty key at " + location(file, line_no));
        }

        if (!touched) {
            block_line = line_no;
        }
        touched = true;

        if (key == "suite") {
            current.suite = std::move(value);
        } else if (key == "id") {
            current.id = std::move(value);
        } else if (key == "script") {
            current.script = std::move(value);
        } else if (key == "name") {
            current.app_name = std::move(value);
        } else if (key == "mode") {
            const auto lowered = to_lower_copy(value);
            if (lowered == "both") {
                both_modes = true;
            } else if (const auto mode = parse_bundle_mode(lowered)) {
                both_modes = false;
                current.mode = *mode;
            } else {
                throw std::runtime_error("Invalid mode '" + value + "' at " + location(file, line_no) +
                                         " (expected onedir, onefile or both)");
            }
        } else if (key == "tool_arg") {
            current.tool_args.push_back(std::move(value));
        } else if (key == "app_arg") {
            current.app_args.push_back(std::move(value));
        } else if (key == "manifest") {
            current.manifest = std::move(value);
        } else if (key.rfind("attr.", 0) == 0) {
            const auto attr_key = key.substr(5);
            if (attr_key.empty()) {
                throw std::runtime_error("Empty attribute name at " + location(file, line_no));
            }
            current.attributes[attr_key] = std::move(value);
        } else {
            current.attributes[std::move(key)] = std::move(value);
        }
    }

    push_current();
    return pack;
}

std::vector<ScenarioPack> ScenarioLoader::load_directory(const std::filesystem::path& root) const {
    if (!std::filesystem::exists(root)) {
        throw std::runtime_error("Scenario root does not exist: " + root.string());
    }

    if (!std::filesystem::is_directory(root)) {
        return {load(root)};
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.is_regular_file() && entry.path().extension().string() == kScenarioExtension) {
            files.emplace_back(entry.path());
        }
    }

    std::sort(files.begin(), files.end());

    std::vector<ScenarioPack> packs;
    packs.reserve(files.size());
    for (const auto& path : files) {
        packs.emplace_back(load(path));
    }
    return packs;
}

std::vector<ScenarioPack> ScenarioLoader::load_all(const std::vector<std::filesystem::path>& roots) const {
    std::vector<ScenarioPack> packs;
    std::size_t total = 0;
    for (const auto& root : roots) {
        for (auto& pack : load_directory(root)) {
            total += pack.scenarios.size();
            packs.push_back(std::move(pack));
        }
    }

    if (total == 0) {
        std::string names;
        for (const auto& root : roots) {
            names += (names.empty() ? "" : ", ") + root.string();
        }
        throw std::runtime_error("No scenarios found in " + names);
    }
    return packs;
}

}  // namespace bundle::validation
