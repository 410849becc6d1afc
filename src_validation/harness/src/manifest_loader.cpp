#include "bundle_validation/manifest.hpp"
#include "bundle_validation/path_glob.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace {

constexpr const char* kManifestExtension = ".toc";

}  // namespace

namespace bundle::validation {

std::string Manifest::artifact_id() const {
    return source.stem().string();
}

ManifestLoader::ManifestLoader(std::string strip_prefix) : strip_prefix_{std::move(strip_prefix)} {}

Manifest ManifestLoader::load(const fs::path& file) const {
    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open manifest: " + file.string());
    }

    nlohmann::json document;
    try {
        input >> document;
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::runtime_error("Malformed manifest " + file.string() + ": " + ex.what());
    }

    if (!document.is_array()) {
        throw std::runtime_error("Manifest " + file.string() +
                                 " must contain a JSON array of pattern strings");
    }

    Manifest manifest;
    manifest.source = file;
    manifest.patterns.reserve(document.size());
    for (std::size_t index = 0; index < document.size(); ++index) {
        const auto& entry = document[index];
        if (!entry.is_string()) {
            throw std::runtime_error("Manifest " + file.string() + ": entry " +
                                     std::to_string(index) + " is not a string");
        }
        manifest.patterns.push_back(entry.get<std::string>());
    }
    return manifest;
}

std::vector<fs::path> ManifestLoader::discover(const fs::path& dir, const std::string& base_name) const {
    std::vector<fs::path> files = glob_files(dir, base_name + kManifestExtension);

    std::string stripped = base_name;
    if (!strip_prefix_.empty() && stripped.rfind(strip_prefix_, 0) == 0) {
        stripped = stripped.substr(strip_prefix_.size());
    }
    auto variants = glob_files(dir, stripped + "_?" + kManifestExtension);
    for (auto& variant : variants) {
        if (files.empty() || files.front() != variant) {
            files.push_back(std::move(variant));
        }
    }
    return files;
}

std::vector<Manifest> ManifestLoader::load_for(const fs::path& dir, const std::string& base_name) const {
    std::vector<Manifest> manifests;
    if (dir.empty()) {
        return manifests;
    }
    for (const auto& file : discover(dir, base_name)) {
        manifests.push_back(load(file));
    }
    return manifests;
}

}  // namespace bundle::validation
