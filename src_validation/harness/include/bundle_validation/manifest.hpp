#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace bundle::validation {

/**
 * \brief Expected-content patterns for one artifact.
 *
 * Patterns are regular expressions over the names in the artifact's internal
 * archive, kept in declaration order. They are compiled with the ECMAScript
 * grammar after rewriting the Python `re` forms manifests are commonly written
 * in: `(?P<name>...)` becomes a plain group, `(?P=name)` a numbered
 * back-reference, `\A` and `\Z` become `^` and `$`, a leading `(?i)` turns on
 * case-insensitive matching and a leading `]` in a class is literal. Other
 * Python-only syntax (lookbehind, other inline flags, possessive quantifiers)
 * is rejected as an invalid pattern.
 */
struct Manifest {
    std::filesystem::path source;
    std::vector<std::string> patterns;

    /// File name without `.toc`; equals Artifact::id() of the artifact it describes.
    [[nodiscard]] std::string artifact_id() const;
};

/**
 * \brief Finds and parses `.toc` manifests.
 *
 * A manifest file is a JSON array of strings:
 * \code{.json}
 * ["^lib.*\\.so$", "^multipackage1_2$"]
 * \endcode
 * Nothing in the file is evaluated; any other JSON shape is rejected.
 *
 * For a scenario base name `test_multipackage1` the loader picks up
 * `test_multipackage1.toc` and `multipackage1_?.toc`; the conventional prefix
 * (`test_` by default) is only stripped when present.
 */
class ManifestLoader {
public:
    explicit ManifestLoader(std::string strip_prefix = "test_");

    /// \throws std::runtime_error on unreadable files, malformed JSON, or non-string entries.
    [[nodiscard]] Manifest load(const std::filesystem::path& file) const;

    /// Manifest paths for `base_name` below `dir`, primary first, then variants sorted.
    [[nodiscard]] std::vector<std::filesystem::path> discover(const std::filesystem::path& dir,
                                                              const std::string& base_name) const;

    [[nodiscard]] std::vector<Manifest> load_for(const std::filesystem::path& dir,
                                                 const std::string& base_name) const;

private:
    std::string strip_prefix_;
};

}  // namespace bundle::validation
