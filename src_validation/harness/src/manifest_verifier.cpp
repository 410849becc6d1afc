#include "bundle_validation/manifest_verifier.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

bool starts_with_at(const std::string& text, std::size_t pos, const char* prefix) {
    return text.compare(pos, std::char_traits<char>::length(prefix), prefix) == 0;
}

// Manifests are often written for Python's `re`. Rewrites the constructs ECMAScript
// lacks: `(?P<name>...)`, `(?P=name)`, `\A`, `\Z` and leading `(?i)` style flags.
std::regex compile_pattern(const std::string& pattern) {
    auto flags = std::regex::ECMAScript;
    std::string out;
    out.reserve(pattern.size());

    std::size_t pos = 0;
    if (starts_with_at(pattern, 0, "(?") && pattern.size() > 2 &&
        std::islower(static_cast<unsigned char>(pattern[2]))) {
        const auto close = pattern.find(')');
        if (close != std::string::npos) {
            for (std::size_t i = 2; i < close; ++i) {
                switch (pattern[i]) {
                    case 'i': flags |= std::regex::icase; break;
                    case 'u': break;
                    default:
                        throw std::runtime_error("unsupported inline flag '" + std::string(1, pattern[i]) + "'");
                }
            }
            pos = close + 1;
        }
    }

    std::map<std::string, std::size_t> groups;
    std::size_t group_count = 0;
    bool in_class = false;

    while (pos < pattern.size()) {
        const char ch = pattern[pos];
        if (ch == '\\' && pos + 1 < pattern.size()) {
            const char next = pattern[pos + 1];
            if (!in_class && next == 'A') {
                out += '^';
            } else if (!in_class && next == 'Z') {
                out += '$';
            } else {
                out.append(pattern, pos, 2);
            }
            pos += 2;
            continue;
        }
        if (in_class) {
            in_class = ch != ']';
            out += ch;
            ++pos;
            continue;
        }
        if (ch == '[') {
            in_class = true;
            out += ch;
            // A leading `]` (or `^]`) is literal in Python; ECMAScript reads `[]` as empty.
            std::size_t skip = pos + 1;
            if (skip < pattern.size() && pattern[skip] == '^') ++skip;
            if (skip < pattern.size() && pattern[skip] == ']') {
                out.append(pattern, pos + 1, skip - pos - 1);
                out += "\\]";
                pos = skip + 1;
            } else {
                ++pos;
            }
            continue;
        }
        if (ch == '(' && starts_with_at(pattern, pos, "(?P<")) {
            const auto close = pattern.find('>', pos + 4);
            if (close == std::string::npos) {
                throw std::runtime_error("unterminated group name");
            }
            groups[pattern.substr(pos + 4, close - pos - 4)] = ++group_count;
            out += '(';
            pos = close + 1;
            continue;
        }
        if (ch == '(' && starts_with_at(pattern, pos, "(?P=")) {
            const auto close = pattern.find(')', pos + 4);
            if (close == std::string::npos) {
                throw std::runtime_error("unterminated group reference");
            }
            const auto name = pattern.substr(pos + 4, close - pos - 4);
            const auto it = groups.find(name);
            if (it == groups.end()) {
                throw std::runtime_error("unknown group name '" + name + "'");
            }
            out += "(?:\\" + std::to_string(it->second) + ")";
            pos = close + 1;
            continue;
        }
        if (ch == '(' && !starts_with_at(pattern, pos, "(?")) {
            ++group_count;
        }
        out += ch;
        ++pos;
    }

    try {
        return std::regex(out, flags);
    } catch (const std::regex_error& ex) {
        throw std::runtime_error(ex.what());
    }
}

}  // namespace

namespace bundle::validation {

std::string MissingEntry::describe() const {
    if (kind == Kind::Artifact) {
        return "Executable for " + target + " missing";
    }
    return "Missing " + pattern + " in " + target;
}

std::string VerifyOutcome::message() const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) {
            oss << '\n';
        }
        oss << missing[i].describe();
    }
    return oss.str();
}

std::vector<std::string> find_missing_patterns(std::vector<std::string> patterns,
                                               const std::vector<std::string>& listing,
                                               std::ostream* log) {
    std::sort(patterns.begin(), patterns.end());

    std::vector<std::string> missing;
    for (const auto& pattern : patterns) {
        std::regex re;
        try {
            re = compile_pattern(pattern);
        } catch (const std::runtime_error& ex) {
            throw std::runtime_error("Invalid manifest pattern '" + pattern + "': " + ex.what());
        }

        const auto hit = std::find_if(listing.begin(), listing.end(), [&](const std::string& name) {
            return std::regex_search(name, re, std::regex_constants::match_continuous);
        });

        if (hit != listing.end()) {
            if (log) *log << "MATCH: " << pattern << " --> " << *hit << "\n";
        } else {
            if (log) *log << "MISSING: " << pattern << "\n";
            missing.push_back(pattern);
        }
    }
    return missing;
}

ManifestVerifier::ManifestVerifier(const ContentLister& lister, std::ostream* log)
    : lister_(lister), log_(log) {}

VerifyOutcome ManifestVerifier::verify(const std::vector<Artifact>& artifacts,
                                       const std::vector<Manifest>& manifests) const {
    // macOS one-dir builds yield `<name>/<name>` and the `.app` executable under one id.
    std::map<std::string, std::vector<const Artifact*>> by_id;
    for (const auto& artifact : artifacts) {
        by_id[artifact.id()].push_back(&artifact);
    }

    VerifyOutcome outcome;
    for (const auto& manifest : manifests) {
        if (log_) *log_ << "EXECUTING MATCHING " << manifest.source.string() << "\n";

        const auto it = by_id.find(manifest.artifact_id());
        if (it == by_id.end()) {
            outcome.missing.push_back(
                MissingEntry{MissingEntry::Kind::Artifact, {}, manifest.source.string()});
            continue;
        }

        for (const Artifact* artifact : it->second) {
            const auto listing = lister_.list(artifact->path());
            for (auto& pattern : find_missing_patterns(manifest.patterns, listing, log_)) {
                outcome.missing.push_back(
                    MissingEntry{MissingEntry::Kind::Pattern, std::move(pattern), artifact->path().string()});
            }
        }
    }

    if (log_) log_->flush();
    outcome.ok = outcome.missing.empty();
    return outcome;
}

}  // namespace bundle::validation
