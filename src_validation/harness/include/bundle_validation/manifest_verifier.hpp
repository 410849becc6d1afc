#pragma once

#include "artifact_locator.hpp"
#include "manifest.hpp"

#include <filesystem>
#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace bundle::validation {

/**
 * \brief Source of an artifact's internal file listing.
 *
 * The archive format belongs to the packaging tool; the harness only needs the
 * flat list of names, decoded as UTF-8 text.
 */
class ContentLister {
public:
    virtual ~ContentLister() = default;

    /// \throws std::runtime_error if the listing cannot be obtained.
    [[nodiscard]] virtual std::vector<std::string> list(const std::filesystem::path& artifact) const = 0;
};

struct MissingEntry {
    enum class Kind {
        Pattern,   ///< pattern had no match in the artifact listing
        Artifact,  ///< manifest had no located artifact to check against
    };

    Kind kind{Kind::Pattern};
    std::string pattern;  ///< empty for Kind::Artifact
    std::string target;   ///< artifact path, or manifest path for Kind::Artifact

    [[nodiscard]] std::string describe() const;
};

struct VerifyOutcome {
    bool ok{true};
    std::vector<MissingEntry> missing;

    /// One line per missing entry.
    [[nodiscard]] std::string message() const;
};

/**
 * \brief Patterns of `patterns` that match no entry of `listing`, sorted.
 *
 * A pattern matches an entry when it matches a prefix of it (the match is
 * anchored at the first character but need not consume the whole name).
 * Matched pairs are reported to `log` as `MATCH: <pattern> --> <entry>`, misses as
 * `MISSING: <pattern>`.
 *
 * \throws std::runtime_error on an invalid regular expression.
 */
[[nodiscard]] std::vector<std::string> find_missing_patterns(std::vector<std::string> patterns,
                                                             const std::vector<std::string>& listing,
                                                             std::ostream* log = nullptr);

/**
 * \brief Checks every manifest against each artifact that shares its id.
 *
 * All manifests are checked and every miss is collected, so one run reports the
 * full set of missing items. A manifest without a matching artifact is recorded
 * before any of its patterns would be.
 */
class ManifestVerifier {
public:
    explicit ManifestVerifier(const ContentLister& lister, std::ostream* log = &std::cout);

    [[nodiscard]] VerifyOutcome verify(const std::vector<Artifact>& artifacts,
                                       const std::vector<Manifest>& manifests) const;

private:
    const ContentLister& lister_;
    std::ostream* log_;
};

}  // namespace bundle::validation
