#pragma once

/**
 * @file path_utils.hpp
 * @brief Suffix-chain and URL helpers for documentation paths
 *
 * A filename is treated as a stem followed by an ordered list of
 * dot-separated suffix tokens:
 *
 * @code
 * "intro.fr.md"   -> stem "intro.fr", suffix ".md", suffixes {".fr", ".md"}
 * "data.tar.gz"   -> stem "data.tar", suffix ".gz", suffixes {".tar", ".gz"}
 * ".nojekyll"     -> stem ".nojekyll", no suffixes
 * @endcode
 *
 * Leading dots belong to the stem. A name ending in '.' has no suffixes.
 * All returned path strings use '/' separators.
 */

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace StaticI18n::i18n::paths {

[[nodiscard]] std::vector<std::string> suffixes(const std::filesystem::path& path);

/// Last suffix including its dot, or empty.
[[nodiscard]] std::string suffix(const std::filesystem::path& path);

[[nodiscard]] std::string stem(const std::filesystem::path& path);

/**
 * @brief Replace the last suffix of the filename
 *
 * Appends when the filename has no suffix. An empty @p newSuffix removes
 * the last suffix. Paths without a filename are returned unchanged.
 */
[[nodiscard]] std::filesystem::path withSuffix(const std::filesystem::path& path,
                                               const std::string& newSuffix);

/// Generic ('/') form with "." and ".." segments collapsed.
[[nodiscard]] std::string normalize(const std::filesystem::path& path);

[[nodiscard]] std::string toPosix(const std::filesystem::path& path);

/**
 * @brief Percent-encode a URL path
 *
 * Unreserved characters (A-Z a-z 0-9 - . _ ~) and '/' are kept, every
 * other byte becomes %XX with upper case hex digits.
 */
[[nodiscard]] std::string percentEncode(std::string_view url);

/**
 * @brief Relative URL from @p other to @p url
 *
 * When @p other is not "." and its last segment contains a dot, that
 * segment is taken to be a file and dropped. A trailing slash on @p url is
 * preserved in the result.
 */
[[nodiscard]] std::string relativeUrl(const std::string& url, const std::string& other);

} // namespace StaticI18n::i18n::paths
