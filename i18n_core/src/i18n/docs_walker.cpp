/**
 * @file docs_walker.cpp
 * @brief DocsWalker implementation
 */

#include "StaticI18n/i18n/docs_walker.hpp"
#include "StaticI18n/core/logger.hpp"
#include "StaticI18n/i18n/path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace StaticI18n::i18n {

namespace fs = std::filesystem;

namespace {

bool isHidden(const fs::path& path) {
  const std::string name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

bool isIndexLike(const fs::path& path) {
  const std::string base = paths::stem(path.filename());
  return base == "index" || base == "README";
}

} // namespace

DocsWalker::DocsWalker(fs::path docsDir, fs::path siteDir, bool useDirectoryUrls)
    : m_docsDir(std::move(docsDir)), m_siteDir(std::move(siteDir)),
      m_useDirectoryUrls(useDirectoryUrls) {}

FileKind DocsWalker::classify(const fs::path& path) {
  std::string ext = paths::suffix(path);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == ".md" || ext == ".markdown" || ext == ".mdown" || ext == ".mkdn" || ext == ".mkd") {
    return FileKind::Page;
  }
  return FileKind::Asset;
}

SourceFile DocsWalker::describe(const std::string& srcPath) const {
  SourceFile file;
  file.srcPath = paths::toPosix(fs::path(srcPath));
  file.absSrcPath = paths::toPosix(m_docsDir / srcPath);
  file.kind = classify(srcPath);

  const fs::path src(file.srcPath);
  if (file.kind == FileKind::Page) {
    const std::string base = paths::stem(src);
    const fs::path parent = src.parent_path();
    if (base == "index" || base == "README") {
      file.destPath = paths::toPosix(parent / "index.html");
    } else if (!m_useDirectoryUrls) {
      file.destPath = paths::toPosix(parent / (base + ".html"));
    } else {
      file.destPath = paths::toPosix(parent / base / "index.html");
    }
  } else {
    file.destPath = file.srcPath;
  }
  file.absDestPath = paths::toPosix(m_siteDir / file.destPath);

  // Same URL rules as a localized file, without the locale prefix
  std::string url = LocalizedFile::urlForDestination(file.destPath, "", m_useDirectoryUrls);
  file.url = url == "." ? "./" : url;
  return file;
}

Result<std::vector<SourceFile>> DocsWalker::walk() const {
  std::error_code ec;
  if (!fs::is_directory(m_docsDir, ec)) {
    return Result<std::vector<SourceFile>>::error("Docs directory not found: " +
                                                  m_docsDir.string());
  }

  std::vector<SourceFile> files;
  auto result = walkDirectory(m_docsDir, files);
  if (result.isError()) {
    return Result<std::vector<SourceFile>>::error(result.error());
  }

  STATICI18N_LOG_DEBUG("Discovered " + std::to_string(files.size()) + " file(s) under " +
                       m_docsDir.string());
  return Result<std::vector<SourceFile>>::ok(std::move(files));
}

Result<void> DocsWalker::walkDirectory(const fs::path& dir, std::vector<SourceFile>& out) const {
  std::vector<fs::path> fileEntries;
  std::vector<fs::path> dirEntries;

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    return Result<void>::error("Cannot read directory " + dir.string() + ": " + ec.message());
  }

  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    const auto& entry = *it;
    if (isHidden(entry.path())) {
      continue;
    }
    std::error_code statEc;
    if (entry.is_directory(statEc)) {
      dirEntries.push_back(entry.path());
    } else if (entry.is_regular_file(statEc)) {
      fileEntries.push_back(entry.path());
    }
  }
  if (ec) {
    return Result<void>::error("Cannot read directory " + dir.string() + ": " + ec.message());
  }

  std::sort(fileEntries.begin(), fileEntries.end(), [](const fs::path& a, const fs::path& b) {
    const bool aIndex = isIndexLike(a);
    const bool bIndex = isIndexLike(b);
    if (aIndex != bIndex) {
      return aIndex;
    }
    return a.filename().string() < b.filename().string();
  });
  std::sort(dirEntries.begin(), dirEntries.end());

  for (const auto& path : fileEntries) {
    out.push_back(describe(paths::toPosix(path.lexically_relative(m_docsDir))));
  }

  for (const auto& subdir : dirEntries) {
    auto result = walkDirectory(subdir, out);
    if (result.isError()) {
      return result;
    }
  }

  return Result<void>::ok();
}

} // namespace StaticI18n::i18n
