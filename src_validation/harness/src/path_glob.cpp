#include "bundle_validation/path_glob.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool has_wildcard(std::string_view component) {
    return component.find_first_of("?*") != std::string_view::npos;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0u) == 0x80u;
}

// Bytes of the UTF-8 code point starting at `pos`. Malformed input counts one byte per character.
std::size_t code_point_length(std::string_view text, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t expected = 1;
    if ((lead & 0xE0u) == 0xC0u) {
        expected = 2;
    } else if ((lead & 0xF0u) == 0xE0u) {
        expected = 3;
    } else if ((lead & 0xF8u) == 0xF0u) {
        expected = 4;
    }

    std::size_t len = 1;
    while (len < expected && pos + len < text.size() &&
           is_continuation(static_cast<unsigned char>(text[pos + len]))) {
        ++len;
    }
    return len;
}

}  // namespace

namespace bundle::validation {

std::size_t last_code_point_offset(std::string_view text) noexcept {
    if (text.empty()) {
        return 0;
    }
    std::size_t pos = text.size() - 1;
    while (pos > 0 && text.size() - pos < 4 && is_continuation(static_cast<unsigned char>(text[pos]))) {
        --pos;
    }
    return pos;
}

bool wildcard_match(std::string_view pattern, std::string_view text) noexcept {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string_view::npos;
    std::size_t resume = 0;

    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (p < pattern.size() && pattern[p] == '?') {
            ++p;
            t += code_point_length(text, t);
        } else if (p < pattern.size() && pattern[p] == text[t]) {
            ++p;
            ++t;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            resume += code_point_length(text, resume);
            t = resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::vector<fs::path> glob_files(const fs::path& root, const fs::path& pattern) {
    std::vector<fs::path> matches;
    std::error_code ec;

    const fs::path full = root / pattern;
    const std::string leaf = full.filename().string();

    if (!has_wildcard(leaf)) {
        if (fs::is_regular_file(full, ec)) {
            matches.push_back(full);
        }
        return matches;
    }

    const fs::path parent = full.parent_path();
    if (!fs::is_directory(parent, ec)) {
        return matches;
    }

    fs::directory_iterator it(parent, ec);
    if (ec) {
        return matches;
    }
    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto& entry = *it;
        if (!wildcard_match(leaf, entry.path().filename().string())) {
            continue;
        }
        if (entry.is_regular_file(ec)) {
            matches.push_back(entry.path());
        }
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}

}  // namespace bundle::validation
