#pragma once

/**
 * @file localized_file_collection.hpp
 * @brief Ordered set of resolved files for one locale pass
 *
 * Sibling variants (intro.md, intro.en.md, intro.fr.md) all resolve to the
 * same destination. The collection keeps the first one appended and drops
 * the rest, so exactly one physical file is exposed per output location.
 *
 * Lookups by logical path follow the resolver's priority: a link to
 * "guide/intro.md" is answered by "guide/intro.<requested>.md", then
 * "guide/intro.<default>.md", then "guide/intro.md".
 */

#include "StaticI18n/core/types.hpp"
#include "StaticI18n/i18n/localized_file.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace StaticI18n::i18n {

/**
 * @brief Locales shared by every member of a collection
 */
struct LocaleContext {
  std::string requestedLocale;
  std::string defaultLocale;
};

class LocalizedFileCollection {
public:
  using const_iterator = std::vector<LocalizedFile>::const_iterator;

  explicit LocalizedFileCollection(LocaleContext context);

  /**
   * @brief Append unless a member already has the same destination path
   * @return true if the file was added
   */
  bool append(LocalizedFile file);

  [[nodiscard]] bool contains(const std::string& path) const;

  /**
   * @brief Best locale variant present for a logical path
   * @return nullptr when no candidate form is a member
   */
  [[nodiscard]] const LocalizedFile* getFileFromPath(const std::string& path) const;

  [[nodiscard]] const LocalizedFile* getFileFromDestination(const std::string& destPath) const;

  [[nodiscard]] std::vector<const LocalizedFile*> documentationPages() const;
  [[nodiscard]] std::vector<const LocalizedFile*> assets() const;

  /// Normalized source paths in insertion order.
  [[nodiscard]] std::vector<std::string> srcPaths() const;

  [[nodiscard]] const LocaleContext& context() const { return m_context; }
  [[nodiscard]] usize size() const { return m_files.size(); }
  [[nodiscard]] bool empty() const { return m_files.empty(); }
  [[nodiscard]] const LocalizedFile& at(usize index) const { return m_files.at(index); }

  [[nodiscard]] const_iterator begin() const { return m_files.begin(); }
  [[nodiscard]] const_iterator end() const { return m_files.end(); }

private:
  [[nodiscard]] std::vector<std::string> candidatePaths(const std::string& path) const;

  LocaleContext m_context;
  std::vector<LocalizedFile> m_files;
  std::unordered_set<std::string> m_destPaths;
  std::unordered_map<std::string, usize> m_bySrcPath;
};

} // namespace StaticI18n::i18n
