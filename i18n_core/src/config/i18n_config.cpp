/**
 * @file i18n_config.cpp
 * @brief I18nConfig loading and validation
 */

#include "StaticI18n/config/i18n_config.hpp"
#include "StaticI18n/core/logger.hpp"
#include "StaticI18n/i18n/locale_validator.hpp"
#include <algorithm>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace StaticI18n::config {

// Minimal JSON field extraction, enough for a flat config object
namespace json {

inline size_t findValueStart(const std::string& json, const std::string& key) {
  auto keyPos = json.find("\"" + key + "\"");
  if (keyPos == std::string::npos)
    return std::string::npos;

  auto colonPos = json.find(':', keyPos + key.size() + 2);
  if (colonPos == std::string::npos)
    return std::string::npos;

  return json.find_first_not_of(" \t\n\r", colonPos + 1);
}

inline void appendUtf8(std::string& out, u32 codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

/**
 * @brief Read a quoted string starting at @p pos
 * @param end Receives the position just past the closing quote
 */
inline std::optional<std::string> readString(const std::string& json, size_t pos, size_t& end) {
  if (pos >= json.size() || json[pos] != '"')
    return std::nullopt;

  std::string value;
  for (size_t i = pos + 1; i < json.size(); ++i) {
    char c = json[i];
    if (c == '"') {
      end = i + 1;
      return value;
    }
    if (c != '\\') {
      value += c;
      continue;
    }
    if (++i >= json.size())
      break;
    switch (json[i]) {
    case 'n':
      value += '\n';
      break;
    case 't':
      value += '\t';
      break;
    case 'r':
      value += '\r';
      break;
    case 'b':
      value += '\b';
      break;
    case 'f':
      value += '\f';
      break;
    case 'u':
      if (i + 4 < json.size()) {
        try {
          appendUtf8(value, static_cast<u32>(std::stoul(json.substr(i + 1, 4), nullptr, 16)));
        } catch (const std::exception&) {
          return std::nullopt;
        }
        i += 4;
      }
      break;
    default:
      value += json[i];
      break;
    }
  }
  return std::nullopt;
}

inline bool hasKey(const std::string& json, const std::string& key) {
  return findValueStart(json, key) != std::string::npos;
}

inline std::optional<std::string> extractString(const std::string& json, const std::string& key) {
  auto valueStart = findValueStart(json, key);
  if (valueStart == std::string::npos)
    return std::nullopt;
  size_t end = 0;
  return readString(json, valueStart, end);
}

inline bool extractBool(const std::string& json, const std::string& key, bool defaultVal) {
  auto valueStart = findValueStart(json, key);
  if (valueStart == std::string::npos)
    return defaultVal;

  auto remaining = json.substr(valueStart, 5);
  if (remaining.find("true") == 0)
    return true;
  if (remaining.find("false") == 0)
    return false;
  return defaultVal;
}

inline std::string extractObject(const std::string& json, const std::string& key) {
  auto braceStart = findValueStart(json, key);
  if (braceStart == std::string::npos || json[braceStart] != '{')
    return "";

  int depth = 1;
  size_t pos = braceStart + 1;
  while (pos < json.size() && depth > 0) {
    if (json[pos] == '"') {
      size_t end = 0;
      if (!readString(json, pos, end))
        return "";
      pos = end;
      continue;
    }
    if (json[pos] == '{')
      depth++;
    else if (json[pos] == '}')
      depth--;
    pos++;
  }

  return json.substr(braceStart, pos - braceStart);
}

/**
 * @brief Position just past the '}' or ']' closing the composite value at @p start
 */
inline size_t skipComposite(const std::string& json, size_t start) {
  int depth = 0;
  size_t pos = start;
  while (pos < json.size()) {
    if (json[pos] == '"') {
      size_t end = 0;
      if (!readString(json, pos, end))
        return std::string::npos;
      pos = end;
      continue;
    }
    if (json[pos] == '{' || json[pos] == '[') {
      depth++;
    } else if (json[pos] == '}' || json[pos] == ']') {
      if (--depth == 0)
        return pos + 1;
    }
    pos++;
  }
  return std::string::npos;
}

inline std::vector<std::string> extractStringArray(const std::string& json,
                                                   const std::string& key) {
  std::vector<std::string> result;

  auto bracketStart = findValueStart(json, key);
  if (bracketStart == std::string::npos || json[bracketStart] != '[')
    return result;

  size_t pos = bracketStart + 1;
  while (pos < json.size() && json[pos] != ']') {
    if (json[pos] == '"') {
      size_t end = 0;
      auto value = readString(json, pos, end);
      if (!value)
        break;
      result.push_back(*value);
      pos = end;
    } else {
      pos++;
    }
  }

  return result;
}

/**
 * @brief "key": "value" pairs of an object's top level, in document order
 */
inline std::vector<std::pair<std::string, std::string>> extractStringPairs(const std::string& object) {
  std::vector<std::pair<std::string, std::string>> pairs;

  size_t pos = object.find('"');
  while (pos != std::string::npos) {
    size_t end = 0;
    auto key = readString(object, pos, end);
    if (!key)
      break;

    auto colonPos = object.find_first_not_of(" \t\n\r", end);
    if (colonPos == std::string::npos || object[colonPos] != ':')
      break;
    auto valueStart = object.find_first_not_of(" \t\n\r", colonPos + 1);
    if (valueStart == std::string::npos)
      break;

    std::string value;
    if (object[valueStart] == '"') {
      auto parsed = readString(object, valueStart, end);
      if (!parsed)
        break;
      value = *parsed;
    } else if (object[valueStart] == '{' || object[valueStart] == '[') {
      end = skipComposite(object, valueStart);
      if (end == std::string::npos)
        break;
      // {"name": "..."} entries carry the display name
      if (object[valueStart] == '{') {
        value = extractString(object.substr(valueStart, end - valueStart), "name").value_or("");
      }
    } else {
      end = object.find_first_of(",}", valueStart);
      if (end == std::string::npos)
        break;
    }

    pairs.emplace_back(*key, value);
    pos = object.find('"', end);
  }

  return pairs;
}

} // namespace json

// ============================================================================
// I18nConfig
// ============================================================================

std::vector<std::string> I18nConfig::allLocales() const {
  std::vector<std::string> locales;
  if (!defaultLanguage.empty()) {
    locales.push_back(defaultLanguage);
  }
  for (const auto& language : languages) {
    if (std::find(locales.begin(), locales.end(), language.locale) == locales.end()) {
      locales.push_back(language.locale);
    }
  }
  return locales;
}

bool I18nConfig::hasLocale(const std::string& locale) const {
  const auto locales = allLocales();
  return std::find(locales.begin(), locales.end(), locale) != locales.end();
}

std::string I18nConfig::languageName(const std::string& locale) const {
  for (const auto& language : languages) {
    if (language.locale == locale && !language.name.empty()) {
      return language.name;
    }
  }
  return locale;
}

// ============================================================================
// I18nConfigLoader
// ============================================================================

Result<I18nConfig> I18nConfigLoader::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<I18nConfig>::error("Failed to open config file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<I18nConfig>::error("Failed to read config file: " + path);
  }

  auto result = loadFromString(buffer.str(), fs::path(path).parent_path());
  if (result.isOk()) {
    STATICI18N_LOG_INFO("Loaded i18n configuration from " + path);
  }
  return result;
}

Result<I18nConfig> I18nConfigLoader::loadFromString(const std::string& content,
                                                    const fs::path& baseDir) {
  I18nConfig config;

  // default_language
  if (!json::hasKey(content, "default_language")) {
    return Result<I18nConfig>::error("Missing required field: default_language");
  }
  auto defaultLanguage = json::extractString(content, "default_language");
  if (!defaultLanguage) {
    return Result<I18nConfig>::error("Invalid field type: default_language must be a string");
  }
  auto checked = i18n::LocaleValidator::validate(i18n::LocaleOption{*defaultLanguage});
  if (checked.isError()) {
    return Result<I18nConfig>::error(checked.error());
  }
  config.defaultLanguage = *defaultLanguage;

  // languages: object of code -> display name, or array of codes
  auto languagesStart = json::findValueStart(content, "languages");
  if (languagesStart != std::string::npos) {
    if (content[languagesStart] == '{') {
      auto pairs = json::extractStringPairs(json::extractObject(content, "languages"));
      std::map<std::string, std::string> mapping(pairs.begin(), pairs.end());
      auto result = i18n::LocaleValidator::validate(i18n::LocaleOption{mapping});
      if (result.isError()) {
        return Result<I18nConfig>::error(result.error());
      }
      for (auto& [locale, name] : pairs) {
        config.languages.push_back({locale, name.empty() ? locale : name});
      }
    } else if (content[languagesStart] == '[') {
      for (auto& locale : json::extractStringArray(content, "languages")) {
        auto result = i18n::LocaleValidator::validateLocale(locale);
        if (result.isError()) {
          return Result<I18nConfig>::error(result.error());
        }
        config.languages.push_back({locale, locale});
      }
    } else {
      return Result<I18nConfig>::error(
          "Invalid field type: languages must be an object or an array");
    }
  }

  // directories
  if (auto docsDir = json::extractString(content, "docs_dir")) {
    config.docsDir = *docsDir;
  }
  if (auto siteDir = json::extractString(content, "site_dir")) {
    config.siteDir = *siteDir;
  }
  if (!baseDir.empty()) {
    if (config.docsDir.is_relative()) {
      config.docsDir = baseDir / config.docsDir;
    }
    if (config.siteDir.is_relative()) {
      config.siteDir = baseDir / config.siteDir;
    }
  }

  config.useDirectoryUrls = json::extractBool(content, "use_directory_urls", true);

  STATICI18N_LOG_DEBUG("Configured locales: default '" + config.defaultLanguage + "', " +
                       std::to_string(config.languages.size()) + " additional language(s)");
  return Result<I18nConfig>::ok(std::move(config));
}

Result<void> I18nConfigLoader::validate(const I18nConfig& config) {
  if (config.defaultLanguage.empty()) {
    return Result<void>::error("Missing required field: default_language");
  }
  auto result = i18n::LocaleValidator::validateLocale(config.defaultLanguage);
  if (result.isError()) {
    return result;
  }
  for (const auto& language : config.languages) {
    result = i18n::LocaleValidator::validateLocale(language.locale);
    if (result.isError()) {
      return result;
    }
  }
  return Result<void>::ok();
}

} // namespace StaticI18n::config
