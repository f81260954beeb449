#pragma once

/**
 * @file docs_walker.hpp
 * @brief Enumerates a docs directory into SourceFile descriptors
 *
 * Each descriptor carries the destination and URL a build without
 * localization would use. LocalizedFile falls back to these values when no
 * locale candidate exists on disk.
 */

#include "StaticI18n/core/result.hpp"
#include "StaticI18n/i18n/localized_file.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace StaticI18n::i18n {

class DocsWalker {
public:
  DocsWalker(std::filesystem::path docsDir, std::filesystem::path siteDir,
             bool useDirectoryUrls);

  /**
   * @brief Walk the docs directory
   *
   * Within a directory, index and README files come first, then the other
   * files sorted by name, then subdirectories in name order. Entries whose
   * name starts with '.' are skipped.
   */
  [[nodiscard]] Result<std::vector<SourceFile>> walk() const;

  /**
   * @brief Plain descriptor for a path relative to the docs directory
   */
  [[nodiscard]] SourceFile describe(const std::string& srcPath) const;

  /**
   * @brief Markdown extensions are pages, everything else is an asset
   */
  [[nodiscard]] static FileKind classify(const std::filesystem::path& path);

private:
  Result<void> walkDirectory(const std::filesystem::path& dir,
                             std::vector<SourceFile>& out) const;

  std::filesystem::path m_docsDir;
  std::filesystem::path m_siteDir;
  bool m_useDirectoryUrls;
};

} // namespace StaticI18n::i18n
