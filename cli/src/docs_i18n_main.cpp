/**
 * @file docs_i18n_main.cpp
 * @brief docs_i18n - print the locale resolution table of a docs tree
 *
 * Reads the site configuration, walks the docs directory and shows, for
 * each configured locale, which physical file backs every logical document
 * and where it would be written. Nothing is written to disk.
 *
 * Usage:
 *   docs_i18n --config i18n.json            # All configured locales
 *   docs_i18n --config i18n.json --lang fr  # One locale
 *   docs_i18n --config i18n.json --verbose  # Per-file resolution logging
 */

#include "StaticI18n/config/i18n_config.hpp"
#include "StaticI18n/core/logger.hpp"
#include "StaticI18n/i18n/collection_builder.hpp"
#include "StaticI18n/i18n/docs_walker.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct CliOptions {
  std::string configPath = "i18n.json";
  std::string lang;
  bool verbose = false;
  bool help = false;
};

CliOptions parseArgs(int argc, char* argv[]) {
  CliOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--config" && i + 1 < argc) {
      opts.configPath = argv[++i];
    } else if (arg == "--lang" && i + 1 < argc) {
      opts.lang = argv[++i];
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    }
  }

  return opts;
}

void printHelp() {
  std::cout << "Usage: docs_i18n [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --config <path>   Site configuration file (default: i18n.json)\n";
  std::cout << "  --lang <locale>   Only resolve this locale\n";
  std::cout << "  -v, --verbose     Log every resolution\n";
  std::cout << "  -h, --help        Show this help message\n";
}

void printCollection(const StaticI18n::config::I18nConfig& config,
                     const StaticI18n::i18n::LocalizedFileCollection& collection) {
  const auto& locale = collection.context().requestedLocale;
  std::cout << "== " << locale << " (" << config.languageName(locale) << ")\n";
  for (const auto& file : collection) {
    std::cout << "  " << file.srcPath() << " -> " << file.destPath() << " (" << file.url()
              << ")";
    if (file.match() == StaticI18n::i18n::MatchKind::Unresolved) {
      std::cout << " [unresolved]";
    }
    std::cout << "\n";
  }
}

int runDocsI18n(int argc, char* argv[]) {
  using namespace StaticI18n;

  CliOptions opts = parseArgs(argc, argv);
  if (opts.help) {
    printHelp();
    return 0;
  }

  core::Logger::instance().setLevel(opts.verbose ? core::LogLevel::Debug
                                                 : core::LogLevel::Warning);

  auto configResult = config::I18nConfigLoader::loadFromFile(opts.configPath);
  if (configResult.isError()) {
    STATICI18N_LOG_ERROR(configResult.error());
    return 1;
  }
  const config::I18nConfig& config = configResult.value();

  std::vector<std::string> locales;
  if (!opts.lang.empty()) {
    locales.push_back(opts.lang);
  } else {
    locales = config.allLocales();
  }

  i18n::DocsWalker walker(config.docsDir, config.siteDir, config.useDirectoryUrls);
  auto sources = walker.walk();
  if (sources.isError()) {
    STATICI18N_LOG_ERROR(sources.error());
    return 1;
  }

  for (const auto& locale : locales) {
    auto collection = i18n::buildLocalizedCollection(config, locale, sources.value());
    if (collection.isError()) {
      STATICI18N_LOG_ERROR(collection.error());
      return 1;
    }
    printCollection(config, collection.value());
  }

  return 0;
}

} // namespace

int main(int argc, char* argv[]) {
  return runDocsI18n(argc, argv);
}
