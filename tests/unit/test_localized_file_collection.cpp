/**
 * @file test_localized_file_collection.cpp
 * @brief Unit tests for LocalizedFileCollection
 */

#include <catch2/catch_test_macros.hpp>
#include "StaticI18n/i18n/docs_walker.hpp"
#include "StaticI18n/i18n/localized_file_collection.hpp"
#include <filesystem>
#include <set>
#include <string>

using namespace StaticI18n::i18n;
namespace fs = std::filesystem;

namespace {

ExistsPredicate existsIn(std::set<std::string> files) {
  return [files = std::move(files)](const fs::path& path) {
    return files.count(path.generic_string()) > 0;
  };
}

ResolutionContext makeContext(bool useDirectoryUrls = true) {
  ResolutionContext context;
  context.requestedLocale = "fr";
  context.defaultLocale = "en";
  context.allLocales = {"en", "fr"};
  context.docsDir = "docs";
  context.siteDir = "site";
  context.useDirectoryUrls = useDirectoryUrls;
  return context;
}

LocalizedFile resolve(const std::string& srcPath, const std::set<std::string>& onDisk,
                      bool useDirectoryUrls = true) {
  SourceFile source = DocsWalker("docs", "site", useDirectoryUrls).describe(srcPath);
  return LocalizedFile(source, makeContext(useDirectoryUrls), existsIn(onDisk));
}

LocalizedFileCollection emptyCollection() {
  return LocalizedFileCollection(LocaleContext{"fr", "en"});
}

} // namespace

// ============================================================================
// Append
// ============================================================================

TEST_CASE("LocalizedFileCollection keeps one file per destination", "[collection]") {
  const std::set<std::string> onDisk = {"docs/guide/intro.md", "docs/guide/intro.en.md",
                                        "docs/guide/intro.fr.md"};
  auto collection = emptyCollection();

  REQUIRE(collection.append(resolve("guide/intro.en.md", onDisk)));
  REQUIRE_FALSE(collection.append(resolve("guide/intro.fr.md", onDisk)));
  REQUIRE_FALSE(collection.append(resolve("guide/intro.md", onDisk)));

  REQUIRE(collection.size() == 1);
  REQUIRE(collection.at(0).srcPath() == "guide/intro.fr.md");
}

TEST_CASE("LocalizedFileCollection first insertion wins", "[collection]") {
  // Two resolution passes that saw different files on disk
  LocalizedFile fromFrench = resolve("guide/intro.md", {"docs/guide/intro.fr.md"});
  LocalizedFile fromEnglish = resolve("guide/intro.md", {"docs/guide/intro.en.md"});
  REQUIRE(fromFrench.destPath() == fromEnglish.destPath());

  auto collection = emptyCollection();
  collection.append(fromFrench);
  collection.append(fromEnglish);

  REQUIRE(collection.size() == 1);
  REQUIRE(collection.at(0).srcPath() == "guide/intro.fr.md");
}

TEST_CASE("LocalizedFileCollection preserves insertion order", "[collection]") {
  const std::set<std::string> onDisk = {"docs/index.md", "docs/guide/intro.md",
                                        "docs/img/logo.png"};
  auto collection = emptyCollection();
  collection.append(resolve("index.md", onDisk));
  collection.append(resolve("guide/intro.md", onDisk));
  collection.append(resolve("img/logo.png", onDisk));

  std::vector<std::string> urls;
  for (const auto& file : collection) {
    urls.push_back(file.url());
  }
  REQUIRE(urls == std::vector<std::string>{"fr/", "fr/guide/intro/", "fr/img/logo.png"});
  REQUIRE(collection.srcPaths() ==
          std::vector<std::string>{"index.md", "guide/intro.md", "img/logo.png"});

  REQUIRE(collection.documentationPages().size() == 2);
  REQUIRE(collection.assets().size() == 1);
  REQUIRE(collection.assets().front()->srcPath() == "img/logo.png");
}

// ============================================================================
// Lookup
// ============================================================================

TEST_CASE("LocalizedFileCollection contains any locale form of a path", "[collection]") {
  SECTION("requested locale variant") {
    auto collection = emptyCollection();
    collection.append(resolve("guide/intro.md", {"docs/guide/intro.fr.md"}));
    REQUIRE(collection.contains("guide/intro.md"));
    REQUIRE(collection.getFileFromPath("guide/intro.md")->srcPath() == "guide/intro.fr.md");
  }

  SECTION("default locale variant") {
    auto collection = emptyCollection();
    collection.append(resolve("guide/intro.md", {"docs/guide/intro.en.md"}));
    REQUIRE(collection.contains("guide/intro.md"));
  }

  SECTION("bare path") {
    auto collection = emptyCollection();
    collection.append(resolve("guide/intro.md", {"docs/guide/intro.md"}));
    REQUIRE(collection.contains("guide/intro.md"));
    REQUIRE(collection.contains("./guide/intro.md"));
  }

  SECTION("no matching member") {
    auto collection = emptyCollection();
    collection.append(resolve("guide/other.md", {"docs/guide/other.md"}));
    REQUIRE_FALSE(collection.contains("guide/intro.md"));
    REQUIRE(collection.getFileFromPath("guide/intro.md") == nullptr);
  }

  SECTION("other locales are not candidates") {
    auto collection = emptyCollection();
    collection.append(resolve("guide/intro.md", {"docs/guide/intro.fr.md"}));
    REQUIRE_FALSE(collection.contains("guide/intro.de.md"));
  }
}

TEST_CASE("LocalizedFileCollection lookup follows locale priority", "[collection]") {
  // Different destinations so both variants are members; the English one first
  LocalizedFile english = resolve("guide/intro.md", {"docs/guide/intro.en.md"}, false);
  LocalizedFile french = resolve("guide/intro.md", {"docs/guide/intro.fr.md"}, true);
  REQUIRE(english.destPath() != french.destPath());

  auto collection = emptyCollection();
  REQUIRE(collection.append(english));
  REQUIRE(collection.append(french));

  const LocalizedFile* found = collection.getFileFromPath("guide/intro.md");
  REQUIRE(found != nullptr);
  REQUIRE(found->srcPath() == "guide/intro.fr.md");
}

TEST_CASE("LocalizedFileCollection lookup by destination", "[collection]") {
  auto collection = emptyCollection();
  collection.append(resolve("guide/intro.md", {"docs/guide/intro.fr.md"}));

  const LocalizedFile* found = collection.getFileFromDestination("guide/intro/index.html");
  REQUIRE(found != nullptr);
  REQUIRE(found->url() == "fr/guide/intro/");
  REQUIRE(collection.getFileFromDestination("guide/missing/index.html") == nullptr);
  REQUIRE(collection.context().requestedLocale == "fr");
  REQUIRE(collection.context().defaultLocale == "en");
}
