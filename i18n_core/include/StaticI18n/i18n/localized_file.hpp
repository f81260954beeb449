#pragma once

/**
 * @file localized_file.hpp
 * @brief Locale-aware resolution of one documentation file
 *
 * A LocalizedFile answers, for one logical document and one requested
 * locale, which physical file backs it and where it is written:
 *
 * @code
 * docs/guide/intro.md
 * docs/guide/intro.fr.md      requested "fr", default "en"
 *
 * srcPath     guide/intro.fr.md
 * destPath    guide/intro/index.html
 * absDestPath <site>/fr/guide/intro/index.html
 * url         fr/guide/intro/
 * @endcode
 *
 * Candidates are probed in a fixed order: requested locale, default locale,
 * then the unsuffixed file. When none exists the descriptor supplied by the
 * walker is used as-is, so a missing translation never fails a build.
 */

#include "StaticI18n/core/types.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace StaticI18n::i18n {

/**
 * @brief Destination rules a file follows
 */
enum class FileKind : u8 {
  Page, // Rendered to HTML
  Asset // Copied with its filename
};

[[nodiscard]] const char* fileKindToString(FileKind kind);

/**
 * @brief A file as enumerated by the docs walker, before localization
 */
struct SourceFile {
  std::string srcPath; // Relative to docs dir, '/' separated
  std::string absSrcPath;
  std::string destPath; // Relative to site dir, no locale prefix
  std::string absDestPath;
  std::string url;
  FileKind kind = FileKind::Asset;

  [[nodiscard]] bool isDocumentationPage() const { return kind == FileKind::Page; }
};

/**
 * @brief Which candidate backed the file
 */
enum class MatchKind : u8 {
  MatchedRequested, // <stem>.<requested>.<ext>
  MatchedDefault,   // <stem>.<default>.<ext>
  MatchedNone,      // <stem>.<ext>
  Unresolved        // nothing on disk, walker descriptor kept
};

[[nodiscard]] const char* matchKindToString(MatchKind kind);

using ExistsPredicate = std::function<bool(const std::filesystem::path&)>;

/**
 * @brief Non-throwing std::filesystem::exists
 */
[[nodiscard]] ExistsPredicate filesystemExists();

/**
 * @brief Everything resolution reads besides the file itself
 */
struct ResolutionContext {
  std::string requestedLocale;
  std::string defaultLocale;
  std::vector<std::string> allLocales; // Every configured locale, scanned in order
  std::filesystem::path docsDir;
  std::filesystem::path siteDir;
  bool useDirectoryUrls = true;
};

class LocalizedFile {
public:
  LocalizedFile(const SourceFile& source, const ResolutionContext& context,
                const ExistsPredicate& exists = filesystemExists());

  [[nodiscard]] const std::string& requestedLocale() const { return m_requestedLocale; }
  [[nodiscard]] const std::string& defaultLocale() const { return m_defaultLocale; }
  [[nodiscard]] FileKind kind() const { return m_kind; }
  [[nodiscard]] bool isDocumentationPage() const { return m_kind == FileKind::Page; }

  [[nodiscard]] const std::string& initialSrcPath() const { return m_initialSrcPath; }
  [[nodiscard]] const std::optional<std::string>& detectedLocaleSuffix() const {
    return m_detectedLocale;
  }
  [[nodiscard]] const std::string& logicalStemPath() const { return m_logicalStemPath; }
  [[nodiscard]] const std::string& name() const { return m_name; }

  [[nodiscard]] MatchKind match() const { return m_match; }
  [[nodiscard]] const std::optional<std::string>& matchedLocaleSuffix() const {
    return m_matchedLocale;
  }

  [[nodiscard]] const std::string& srcPath() const { return m_srcPath; }
  [[nodiscard]] const std::string& absSrcPath() const { return m_absSrcPath; }
  [[nodiscard]] const std::string& destPath() const { return m_destPath; }
  [[nodiscard]] const std::string& absDestPath() const { return m_absDestPath; }
  [[nodiscard]] const std::string& url() const { return m_url; }

  /**
   * @brief URL of this file relative to another resolved file
   */
  [[nodiscard]] std::string urlRelativeTo(const LocalizedFile& other) const;

  /**
   * @brief URL of this file relative to a raw URL
   */
  [[nodiscard]] std::string urlRelativeTo(const std::string& otherUrl) const;

  /**
   * @brief Build a URL from a destination path the way url() is built
   */
  [[nodiscard]] static std::string urlForDestination(const std::string& destPath,
                                                     const std::string& locale,
                                                     bool useDirectoryUrls);

  [[nodiscard]] std::string toString() const;

private:
  void detectLocale(const std::vector<std::string>& allLocales);
  void resolve(const SourceFile& source, const ResolutionContext& context,
               const ExistsPredicate& exists);
  [[nodiscard]] std::string destinationPath(const std::string& destName,
                                            bool useDirectoryUrls) const;

  std::string m_requestedLocale;
  std::string m_defaultLocale;
  FileKind m_kind;

  std::string m_initialSrcPath;
  std::string m_suffix; // Last suffix of the initial path
  std::optional<std::string> m_detectedLocale;
  std::string m_logicalStemPath;
  std::string m_name;

  MatchKind m_match = MatchKind::Unresolved;
  std::optional<std::string> m_matchedLocale;

  std::string m_srcPath;
  std::string m_absSrcPath;
  std::string m_destPath;
  std::string m_absDestPath;
  std::string m_url;
};

} // namespace StaticI18n::i18n
