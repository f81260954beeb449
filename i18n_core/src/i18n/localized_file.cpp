/**
 * @file localized_file.cpp
 * @brief LocalizedFile implementation
 */

#include "StaticI18n/i18n/localized_file.hpp"
#include "StaticI18n/i18n/path_utils.hpp"
#include <algorithm>
#include <array>
#include <sstream>
#include <system_error>

namespace StaticI18n::i18n {

namespace fs = std::filesystem;

const char* fileKindToString(FileKind kind) {
  switch (kind) {
  case FileKind::Page:
    return "page";
  case FileKind::Asset:
    return "asset";
  }
  return "unknown";
}

const char* matchKindToString(MatchKind kind) {
  switch (kind) {
  case MatchKind::MatchedRequested:
    return "requested";
  case MatchKind::MatchedDefault:
    return "default";
  case MatchKind::MatchedNone:
    return "none";
  case MatchKind::Unresolved:
    return "unresolved";
  }
  return "unknown";
}

ExistsPredicate filesystemExists() {
  return [](const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
  };
}

// ============================================================================
// Construction
// ============================================================================

LocalizedFile::LocalizedFile(const SourceFile& source, const ResolutionContext& context,
                             const ExistsPredicate& exists)
    : m_requestedLocale(context.requestedLocale), m_defaultLocale(context.defaultLocale),
      m_kind(source.kind), m_initialSrcPath(source.srcPath),
      m_suffix(paths::suffix(source.srcPath)) {
  detectLocale(context.allLocales);

  fs::path logicalStem = paths::withSuffix(m_initialSrcPath, "");
  if (m_detectedLocale) {
    logicalStem = paths::withSuffix(logicalStem, "");
  }
  m_logicalStemPath = paths::toPosix(logicalStem);

  const std::string stemName = logicalStem.filename().string();
  m_name = (stemName == "index" || stemName == "README") ? "index" : stemName;

  resolve(source, context, exists);
  m_url = urlForDestination(m_destPath, m_requestedLocale, context.useDirectoryUrls);
}

void LocalizedFile::detectLocale(const std::vector<std::string>& allLocales) {
  const auto chain = paths::suffixes(m_initialSrcPath);
  auto inChain = [&chain](const std::string& token) {
    return std::find(chain.begin(), chain.end(), token) != chain.end();
  };

  for (const auto& locale : allLocales) {
    if (inChain("." + locale) && inChain(m_suffix)) {
      m_detectedLocale = locale;
      return;
    }
  }
}

// ============================================================================
// Resolution
// ============================================================================

void LocalizedFile::resolve(const SourceFile& source, const ResolutionContext& context,
                            const ExistsPredicate& exists) {
  struct Candidate {
    MatchKind kind;
    std::optional<std::string> locale;
    std::string relativePath;
  };

  const std::array<Candidate, 3> candidates = {{
      {MatchKind::MatchedRequested, m_requestedLocale,
       m_logicalStemPath + "." + m_requestedLocale + m_suffix},
      {MatchKind::MatchedDefault, m_defaultLocale,
       m_logicalStemPath + "." + m_defaultLocale + m_suffix},
      {MatchKind::MatchedNone, std::nullopt, m_logicalStemPath + m_suffix},
  }};

  for (const auto& candidate : candidates) {
    const fs::path absolute = context.docsDir / candidate.relativePath;
    if (!exists(absolute)) {
      continue;
    }

    m_match = candidate.kind;
    m_matchedLocale = candidate.locale;
    m_srcPath = candidate.relativePath;
    m_absSrcPath = paths::toPosix(absolute);

    // The bare variant keeps the discovered filename, locale token included
    const std::string destName =
        m_matchedLocale ? m_name + m_suffix : fs::path(m_initialSrcPath).filename().string();

    m_destPath = destinationPath(destName, context.useDirectoryUrls);
    m_absDestPath = paths::toPosix(context.siteDir / m_requestedLocale / m_destPath);
    return;
  }

  m_match = MatchKind::Unresolved;
  m_matchedLocale.reset();
  m_srcPath = source.srcPath;
  m_absSrcPath = source.absSrcPath;
  m_destPath = source.destPath;
  m_absDestPath = source.absDestPath;
}

std::string LocalizedFile::destinationPath(const std::string& destName,
                                           bool useDirectoryUrls) const {
  const fs::path parent = fs::path(m_srcPath).parent_path();

  switch (m_kind) {
  case FileKind::Page:
    // index.md / README.md => index.html, foo.md => foo/index.html
    if (!useDirectoryUrls || m_name == "index") {
      return paths::toPosix(parent / (m_name + ".html"));
    }
    return paths::toPosix(parent / m_name / "index.html");
  case FileKind::Asset:
    return paths::toPosix(parent / destName);
  }
  return paths::toPosix(parent / destName);
}

std::string LocalizedFile::urlForDestination(const std::string& destPath,
                                             const std::string& locale, bool useDirectoryUrls) {
  std::string url = destPath;
  std::replace(url.begin(), url.end(), '\\', '/');

  const size_t slash = url.rfind('/');
  const std::string dirname = slash == std::string::npos ? std::string() : url.substr(0, slash);
  const std::string filename = slash == std::string::npos ? url : url.substr(slash + 1);

  if (useDirectoryUrls && filename == "index.html") {
    url = dirname.empty() ? "." : dirname + "/";
  }

  if (!locale.empty()) {
    url = (url == ".") ? locale + "/" : locale + "/" + url;
  }
  return paths::percentEncode(url);
}

// ============================================================================
// Links
// ============================================================================

std::string LocalizedFile::urlRelativeTo(const LocalizedFile& other) const {
  return paths::relativeUrl(m_url, other.url());
}

std::string LocalizedFile::urlRelativeTo(const std::string& otherUrl) const {
  return paths::relativeUrl(m_url, otherUrl);
}

std::string LocalizedFile::toString() const {
  std::ostringstream ss;
  ss << "LocalizedFile(src_path='" << m_srcPath << "', abs_src_path='" << m_absSrcPath
     << "', dest_path='" << m_destPath << "', abs_dest_path='" << m_absDestPath << "', name='"
     << m_name << "', locale_suffix='" << m_matchedLocale.value_or("None")
     << "', dest_language='" << m_requestedLocale << "', match='" << matchKindToString(m_match)
     << "', url='" << m_url << "')";
  return ss.str();
}

} // namespace StaticI18n::i18n
