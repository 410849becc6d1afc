#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

namespace bundle::validation {

/**
 * Shell-style match of one path component: `?` is one character, `*` any run.
 * Names are taken as UTF-8, so `?` spans a whole multi-byte character.
 */
[[nodiscard]] bool wildcard_match(std::string_view pattern, std::string_view text) noexcept;

/// Byte offset of the last UTF-8 character in `text` (0 when empty).
[[nodiscard]] std::size_t last_code_point_offset(std::string_view text) noexcept;

/**
 * \brief Expands `pattern` (relative to `root`) into the regular files it names.
 *
 * Only the last component of `pattern` is wildcard-expanded. Directories and
 * unreadable locations produce no matches rather than errors, the same way a
 * shell glob simply expands to nothing. The result is sorted.
 */
[[nodiscard]] std::vector<std::filesystem::path> glob_files(const std::filesystem::path& root,
                                                            const std::filesystem::path& pattern);

}  // namespace bundle::validation
