/**
 * @file collection_builder.cpp
 * @brief Per-locale collection building
 */

#include "StaticI18n/i18n/collection_builder.hpp"
#include "StaticI18n/core/logger.hpp"
#include <string>

namespace StaticI18n::i18n {

ResolutionContext makeResolutionContext(const config::I18nConfig& config,
                                        const std::string& locale) {
  ResolutionContext context;
  context.requestedLocale = locale;
  context.defaultLocale = config.defaultLanguage;
  context.allLocales = config.allLocales();
  context.docsDir = config.docsDir;
  context.siteDir = config.siteDir;
  context.useDirectoryUrls = config.useDirectoryUrls;
  return context;
}

Result<LocalizedFileCollection> buildLocalizedCollection(const config::I18nConfig& config,
                                                         const std::string& locale,
                                                         const std::vector<SourceFile>& sourceFiles,
                                                         const ExistsPredicate& exists) {
  if (!config.hasLocale(locale)) {
    return Result<LocalizedFileCollection>::error("Locale is not configured: " + locale);
  }

  const ResolutionContext context = makeResolutionContext(config, locale);
  LocalizedFileCollection collection(LocaleContext{locale, config.defaultLanguage});

  for (const auto& source : sourceFiles) {
    LocalizedFile file(source, context, exists);
    if (core::Logger::instance().getLevel() <= core::LogLevel::Trace) {
      STATICI18N_LOG_TRACE(file.toString());
    }

    const std::string srcPath = file.srcPath();
    const MatchKind match = file.match();
    if (collection.append(std::move(file))) {
      STATICI18N_LOG_DEBUG("[" + locale + "] " + source.srcPath + " -> " + srcPath + " (" +
                           matchKindToString(match) + ")");
    } else {
      STATICI18N_LOG_DEBUG("[" + locale + "] " + source.srcPath +
                           " shares its destination, skipped");
    }
  }

  STATICI18N_LOG_INFO("[" + locale + "] kept " + std::to_string(collection.size()) + " of " +
                      std::to_string(sourceFiles.size()) + " discovered file(s)");
  return Result<LocalizedFileCollection>::ok(std::move(collection));
}

} // namespace StaticI18n::i18n
