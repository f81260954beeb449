#pragma once

/**
 * @file i18n_config.hpp
 * @brief Site configuration for locale-aware builds
 *
 * Example i18n.json:
 * @code
 * {
 *   "docs_dir": "docs",
 *   "site_dir": "site",
 *   "use_directory_urls": true,
 *   "default_language": "en",
 *   "languages": {
 *     "fr": "Français",
 *     "pt_BR": "Português"
 *   }
 * }
 * @endcode
 *
 * "languages" may also be a plain array of codes. Every code is checked by
 * LocaleValidator while loading; the first invalid one aborts the load.
 */

#include "StaticI18n/core/result.hpp"
#include "StaticI18n/core/types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace StaticI18n::config {

/**
 * @brief One configured language
 */
struct LanguageEntry {
  std::string locale;
  std::string name; // Display name, defaults to the locale code
};

struct I18nConfig {
  std::filesystem::path docsDir = "docs";
  std::filesystem::path siteDir = "site";
  bool useDirectoryUrls = true;
  std::string defaultLanguage;
  std::vector<LanguageEntry> languages;

  /**
   * @brief Default language first, then configured languages, no duplicates
   */
  [[nodiscard]] std::vector<std::string> allLocales() const;

  [[nodiscard]] bool hasLocale(const std::string& locale) const;

  /**
   * @brief Display name for a configured locale, or the code itself
   */
  [[nodiscard]] std::string languageName(const std::string& locale) const;
};

/**
 * @brief Loads and validates I18nConfig from JSON
 */
class I18nConfigLoader {
public:
  /**
   * @brief Load configuration from a file
   *
   * Relative docs_dir and site_dir are resolved against the directory that
   * contains @p path.
   */
  [[nodiscard]] static Result<I18nConfig> loadFromFile(const std::string& path);

  /**
   * @brief Parse configuration from a JSON string
   * @param baseDir Directory relative paths are resolved against
   */
  [[nodiscard]] static Result<I18nConfig>
  loadFromString(const std::string& json, const std::filesystem::path& baseDir = {});

  /**
   * @brief Check every locale code in an already built config
   */
  [[nodiscard]] static Result<void> validate(const I18nConfig& config);
};

} // namespace StaticI18n::config
