/**
 * @file locale_validator.cpp
 * @brief LocaleValidator implementation
 */

#include "StaticI18n/i18n/locale_validator.hpp"
#include <regex>

namespace StaticI18n::i18n {

bool LocaleValidator::isValidLocale(std::string_view code) {
  static const std::regex localeRe("(^[a-z]{2}_[A-Z]{2}$)|(^[a-z]{2}$)");
  return std::regex_match(code.begin(), code.end(), localeRe);
}

std::string LocaleValidator::invalidLocaleMessage(const std::string& value) {
  return "Language code values must be either ISO-639-1 lower case or represented with "
         "their territory/region/country codes, received '" +
         value + "' expected forms examples: 'en' or 'en_US'.";
}

Result<void> LocaleValidator::validateLocale(const std::string& code) {
  if (!isValidLocale(code)) {
    return Result<void>::error(invalidLocaleMessage(code));
  }
  return Result<void>::ok();
}

Result<LocaleOption> LocaleValidator::validate(LocaleOption value) {
  if (const auto* code = std::get_if<std::string>(&value)) {
    auto result = validateLocale(*code);
    if (result.isError()) {
      return Result<LocaleOption>::error(result.error());
    }
  } else if (const auto* mapping = std::get_if<std::map<std::string, std::string>>(&value)) {
    auto result = validateKeys(*mapping);
    if (result.isError()) {
      return Result<LocaleOption>::error(result.error());
    }
  }
  return Result<LocaleOption>::ok(std::move(value));
}

} // namespace StaticI18n::i18n
