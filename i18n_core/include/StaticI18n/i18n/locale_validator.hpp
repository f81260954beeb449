#pragma once

/**
 * @file locale_validator.hpp
 * @brief Syntax check for locale codes in site configuration
 *
 * Accepted forms:
 * - ISO-639-1 lower case language: "en", "fr"
 * - language with territory: "en_US", "pt_BR"
 *
 * This is the only place the locale pattern is enforced. Everything
 * downstream (resolver, collection) trusts the codes it is given.
 */

#include "StaticI18n/core/result.hpp"
#include "StaticI18n/core/types.hpp"
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace StaticI18n::i18n {

/**
 * @brief Raw value of a locale-bearing configuration option
 *
 * Strings are checked as a code, maps have each key checked. Any other
 * alternative is returned unchanged.
 */
using LocaleOption = std::variant<std::nullptr_t, bool, i64, std::string, std::vector<std::string>,
                                  std::map<std::string, std::string>>;

class LocaleValidator {
public:
  /**
   * @brief Check a code against both accepted forms
   */
  [[nodiscard]] static bool isValidLocale(std::string_view code);

  /**
   * @brief Validate a single code
   * @return Error naming the offending value and the accepted forms
   */
  [[nodiscard]] static Result<void> validateLocale(const std::string& code);

  /**
   * @brief Validate every key of a mapping; values are not interpreted
   */
  template <typename V>
  [[nodiscard]] static Result<void> validateKeys(const std::map<std::string, V>& mapping) {
    for (const auto& [key, value] : mapping) {
      auto result = validateLocale(key);
      if (result.isError()) {
        return result;
      }
    }
    return Result<void>::ok();
  }

  /**
   * @brief Validate a configuration option value
   * @return The value itself when valid or when its shape is not a locale carrier
   */
  [[nodiscard]] static Result<LocaleOption> validate(LocaleOption value);

  [[nodiscard]] static std::string invalidLocaleMessage(const std::string& value);
};

} // namespace StaticI18n::i18n
