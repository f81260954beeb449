/**
 * @file test_path_utils.cpp
 * @brief Unit tests for suffix-chain and URL helpers
 */

#include <catch2/catch_test_macros.hpp>
#include "StaticI18n/i18n/path_utils.hpp"
#include <string>
#include <vector>

using namespace StaticI18n::i18n;

TEST_CASE("Suffix chain of a filename", "[path_utils]") {
  SECTION("localized page") {
    REQUIRE(paths::suffixes("guide/intro.fr.md") == std::vector<std::string>{".fr", ".md"});
    REQUIRE(paths::suffix("guide/intro.fr.md") == ".md");
    REQUIRE(paths::stem("guide/intro.fr.md") == "intro.fr");
  }

  SECTION("compound extension") {
    REQUIRE(paths::suffixes("data.tar.gz") == std::vector<std::string>{".tar", ".gz"});
    REQUIRE(paths::stem("data.tar.gz") == "data.tar");
  }

  SECTION("no extension") {
    REQUIRE(paths::suffixes("LICENSE").empty());
    REQUIRE(paths::suffix("LICENSE").empty());
    REQUIRE(paths::stem("LICENSE") == "LICENSE");
  }

  SECTION("leading dot belongs to the stem") {
    REQUIRE(paths::suffixes(".nojekyll").empty());
    REQUIRE(paths::stem(".nojekyll") == ".nojekyll");
    REQUIRE(paths::suffixes(".config.json") == std::vector<std::string>{".json"});
  }

  SECTION("trailing dot means no suffix") {
    REQUIRE(paths::suffixes("notes.").empty());
  }
}

TEST_CASE("withSuffix replaces only the last suffix", "[path_utils]") {
  REQUIRE(paths::toPosix(paths::withSuffix("guide/intro.md", "")) == "guide/intro");
  REQUIRE(paths::toPosix(paths::withSuffix("guide/intro.fr.md", "")) == "guide/intro.fr");
  REQUIRE(paths::toPosix(paths::withSuffix("guide/intro", ".fr.md")) == "guide/intro.fr.md");
  REQUIRE(paths::toPosix(paths::withSuffix("data.tar.gz", ".zip")) == "data.tar.zip");
  REQUIRE(paths::toPosix(paths::withSuffix("data.tar", ".tar.gz")) == "data.tar.gz");
}

TEST_CASE("normalize collapses dot segments", "[path_utils]") {
  REQUIRE(paths::normalize("./guide/../guide/intro.md") == "guide/intro.md");
  REQUIRE(paths::normalize("guide//intro.md") == "guide/intro.md");
  REQUIRE(paths::normalize("guide/intro/") == "guide/intro");
}

TEST_CASE("percentEncode keeps unreserved characters and slashes", "[path_utils]") {
  REQUIRE(paths::percentEncode("fr/guide/intro/") == "fr/guide/intro/");
  REQUIRE(paths::percentEncode("fr/my page/") == "fr/my%20page/");
  REQUIRE(paths::percentEncode("fr/caf\xC3\xA9.png") == "fr/caf%C3%A9.png");
  REQUIRE(paths::percentEncode("a?b#c") == "a%3Fb%23c");
  REQUIRE(paths::percentEncode("v1.2_x-y~z") == "v1.2_x-y~z");
}

TEST_CASE("relativeUrl between site URLs", "[path_utils]") {
  SECTION("sibling directories") {
    REQUIRE(paths::relativeUrl("fr/guide/setup/", "fr/guide/intro/") == "../setup/");
  }

  SECTION("up to the root") {
    REQUIRE(paths::relativeUrl("fr/", "fr/guide/intro/") == "../../");
  }

  SECTION("asset from a page") {
    REQUIRE(paths::relativeUrl("fr/img/logo.png", "fr/guide/intro/") == "../../img/logo.png");
  }

  SECTION("file name of the base is dropped") {
    REQUIRE(paths::relativeUrl("fr/img/logo.png", "fr/guide/intro.html") == "../img/logo.png");
  }

  SECTION("same location") {
    REQUIRE(paths::relativeUrl("fr/", "fr/") == "./");
    REQUIRE(paths::relativeUrl("fr/a.html", ".") == "fr/a.html");
  }
}
