/**
 * @file test_locale_validator.cpp
 * @brief Unit tests for locale code validation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "StaticI18n/i18n/locale_validator.hpp"
#include <map>
#include <string>
#include <vector>

using namespace StaticI18n;
using namespace StaticI18n::i18n;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// Single codes
// ============================================================================

TEST_CASE("LocaleValidator accepts both code forms", "[locale_validator]") {
  for (const std::string code : {"en", "fr", "ja", "en_US", "pt_BR", "zh_CN"}) {
    INFO("code: " << code);
    REQUIRE(LocaleValidator::isValidLocale(code));
    REQUIRE(LocaleValidator::validateLocale(code).isOk());
  }
}

TEST_CASE("LocaleValidator rejects malformed codes", "[locale_validator]") {
  for (const std::string code :
       {"", "e", "EN", "eng", "en-US", "en_us", "EN_US", "en_USA", "en_", "_US", "1a", " en", "en ",
        "en_US\n"}) {
    INFO("code: '" << code << "'");
    REQUIRE_FALSE(LocaleValidator::isValidLocale(code));
    REQUIRE(LocaleValidator::validateLocale(code).isError());
  }
}

TEST_CASE("LocaleValidator error names the value and the accepted forms", "[locale_validator]") {
  auto result = LocaleValidator::validateLocale("en-GB");

  REQUIRE(result.isError());
  REQUIRE_THAT(result.error(), ContainsSubstring("'en-GB'"));
  REQUIRE_THAT(result.error(), ContainsSubstring("'en' or 'en_US'"));
}

// ============================================================================
// Option values
// ============================================================================

TEST_CASE("LocaleValidator validates option values by shape", "[locale_validator]") {
  SECTION("string is checked") {
    REQUIRE(LocaleValidator::validate(LocaleOption{std::string("fr")}).isOk());
    REQUIRE(LocaleValidator::validate(LocaleOption{std::string("french")}).isError());
  }

  SECTION("mapping keys are checked, values are not") {
    std::map<std::string, std::string> good = {{"en", ""}, {"fr_CA", "not a locale"}};
    auto result = LocaleValidator::validate(LocaleOption{good});
    REQUIRE(result.isOk());
    REQUIRE(std::get<std::map<std::string, std::string>>(result.value()) == good);

    std::map<std::string, std::string> bad = {{"en", "English"}, {"Deutsch", "de"}};
    auto badResult = LocaleValidator::validate(LocaleOption{bad});
    REQUIRE(badResult.isError());
    REQUIRE_THAT(badResult.error(), ContainsSubstring("'Deutsch'"));
  }

  SECTION("other shapes pass through unchanged") {
    auto flag = LocaleValidator::validate(LocaleOption{true});
    REQUIRE(flag.isOk());
    REQUIRE(std::get<bool>(flag.value()) == true);

    auto number = LocaleValidator::validate(LocaleOption{i64{42}});
    REQUIRE(number.isOk());
    REQUIRE(std::get<i64>(number.value()) == 42);

    std::vector<std::string> list = {"not", "locales"};
    auto listed = LocaleValidator::validate(LocaleOption{list});
    REQUIRE(listed.isOk());
    REQUIRE(std::get<std::vector<std::string>>(listed.value()) == list);

    REQUIRE(LocaleValidator::validate(LocaleOption{nullptr}).isOk());
  }
}

TEST_CASE("LocaleValidator::validateKeys works for any value type", "[locale_validator]") {
  std::map<std::string, int> weights = {{"en", 1}, {"de_AT", 2}};
  REQUIRE(LocaleValidator::validateKeys(weights).isOk());

  weights["x"] = 3;
  REQUIRE(LocaleValidator::validateKeys(weights).isError());
}
