#include "bundle_validation/artifact_locator.hpp"
#include "bundle_validation/path_glob.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kExeSuffix = ".exe";

bool ends_with_exe(std::string_view text) {
    if (text.size() < kExeSuffix.size()) {
        return false;
    }
    const auto tail = text.substr(text.size() - kExeSuffix.size());
    for (std::size_t i = 0; i < tail.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(tail[i])) != kExeSuffix[i]) {
            return false;
        }
    }
    return true;
}

std::string strip_exe(std::string name) {
    if (ends_with_exe(name)) {
        name.resize(name.size() - kExeSuffix.size());
    }
    return name;
}

std::string expand_name(std::string_view relative, const std::string& name) {
    constexpr std::string_view kPlaceholder = "{name}";
    std::string out;
    std::size_t pos = 0;
    while (pos < relative.size()) {
        const auto hit = relative.find(kPlaceholder, pos);
        if (hit == std::string_view::npos) {
            out.append(relative.substr(pos));
            break;
        }
        out.append(relative.substr(pos, hit - pos));
        out.append(name);
        pos = hit + kPlaceholder.size();
    }
    return out;
}

std::string variant_suffix(const fs::path& match) {
    const auto base = strip_exe(match.filename().string());
    if (base.empty()) {
        return {};
    }
    return base.substr(bundle::validation::last_code_point_offset(base));
}

}  // namespace

namespace bundle::validation {

std::string Artifact::id() const {
    return strip_exe(path_.filename().string());
}

std::vector<Artifact> ArtifactLocator::locate(const fs::path& dist_dir,
                                              const std::string& name) const {
    std::map<fs::path, std::string> found;

    constexpr std::array<BundleMode, 2> kModes{BundleMode::OneDir, BundleMode::OneFile};
    for (const auto mode : kModes) {
        for (const auto& tmpl : path_templates(platform_, mode)) {
            const fs::path pattern = fs::path(expand_name(tmpl.relative, name)).make_preferred();
            for (auto& match : glob_files(dist_dir, pattern)) {
                auto key = match.lexically_normal();
                if (found.count(key) == 0) {
                    found.emplace(std::move(key), tmpl.multipackage ? variant_suffix(match) : std::string{});
                }
            }
        }
    }

    std::vector<Artifact> artifacts;
    artifacts.reserve(found.size());
    for (auto& [path, suffix] : found) {
        artifacts.push_back(Artifact{path, suffix});
    }

    std::stable_sort(artifacts.begin(), artifacts.end(), [](const Artifact& a, const Artifact& b) {
        if (a.is_variant() != b.is_variant()) {
            return !a.is_variant();
        }
        return a.suffix() < b.suffix();
    });
    return artifacts;
}

}  // namespace bundle::validation
