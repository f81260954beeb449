/**
 * @file localized_file_collection.cpp
 * @brief LocalizedFileCollection implementation
 */

#include "StaticI18n/i18n/localized_file_collection.hpp"
#include "StaticI18n/i18n/path_utils.hpp"

namespace StaticI18n::i18n {

LocalizedFileCollection::LocalizedFileCollection(LocaleContext context)
    : m_context(std::move(context)) {}

bool LocalizedFileCollection::append(LocalizedFile file) {
  const std::string destKey = paths::normalize(file.destPath());
  if (m_destPaths.count(destKey) > 0) {
    return false;
  }

  m_destPaths.insert(destKey);
  m_bySrcPath.emplace(paths::normalize(file.srcPath()), m_files.size());
  m_files.push_back(std::move(file));
  return true;
}

std::vector<std::string> LocalizedFileCollection::candidatePaths(const std::string& path) const {
  const std::string ext = paths::suffix(path);
  return {
      paths::normalize(paths::withSuffix(path, "." + m_context.requestedLocale + ext)),
      paths::normalize(paths::withSuffix(path, "." + m_context.defaultLocale + ext)),
      paths::normalize(path),
  };
}

bool LocalizedFileCollection::contains(const std::string& path) const {
  return getFileFromPath(path) != nullptr;
}

const LocalizedFile* LocalizedFileCollection::getFileFromPath(const std::string& path) const {
  for (const auto& candidate : candidatePaths(path)) {
    auto it = m_bySrcPath.find(candidate);
    if (it != m_bySrcPath.end()) {
      return &m_files[it->second];
    }
  }
  return nullptr;
}

const LocalizedFile*
LocalizedFileCollection::getFileFromDestination(const std::string& destPath) const {
  const std::string key = paths::normalize(destPath);
  for (const auto& file : m_files) {
    if (paths::normalize(file.destPath()) == key) {
      return &file;
    }
  }
  return nullptr;
}

std::vector<const LocalizedFile*> LocalizedFileCollection::documentationPages() const {
  std::vector<const LocalizedFile*> pages;
  for (const auto& file : m_files) {
    if (file.isDocumentationPage()) {
      pages.push_back(&file);
    }
  }
  return pages;
}

std::vector<const LocalizedFile*> LocalizedFileCollection::assets() const {
  std::vector<const LocalizedFile*> result;
  for (const auto& file : m_files) {
    if (!file.isDocumentationPage()) {
      result.push_back(&file);
    }
  }
  return result;
}

std::vector<std::string> LocalizedFileCollection::srcPaths() const {
  std::vector<std::string> result;
  result.reserve(m_files.size());
  for (const auto& file : m_files) {
    result.push_back(paths::normalize(file.srcPath()));
  }
  return result;
}

} // namespace StaticI18n::i18n
