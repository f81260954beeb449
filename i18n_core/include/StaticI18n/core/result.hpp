#pragma once

/**
 * @file result.hpp
 * @brief Result<T> - value-or-error return type
 *
 * Every fallible operation in StaticI18n returns a Result instead of
 * throwing. The error side is a human readable message that callers either
 * propagate or report.
 *
 * @code
 * auto config = I18nConfig::loadFromFile("i18n.json");
 * if (config.isError()) {
 *   STATICI18N_LOG_ERROR(config.error());
 *   return 1;
 * }
 * @endcode
 */

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace StaticI18n {

template <typename T> class Result {
public:
  [[nodiscard]] static Result ok(T value) {
    Result result;
    result.m_value = std::move(value);
    return result;
  }

  [[nodiscard]] static Result error(std::string message) {
    Result result;
    result.m_error = std::move(message);
    return result;
  }

  [[nodiscard]] bool isOk() const { return m_value.has_value(); }
  [[nodiscard]] bool isError() const { return !m_value.has_value(); }

  [[nodiscard]] T& value() & {
    checkValue();
    return *m_value;
  }

  [[nodiscard]] const T& value() const& {
    checkValue();
    return *m_value;
  }

  [[nodiscard]] T&& value() && {
    checkValue();
    return std::move(*m_value);
  }

  [[nodiscard]] T valueOr(T fallback) const {
    return m_value.has_value() ? *m_value : std::move(fallback);
  }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result() = default;

  void checkValue() const {
    if (!m_value.has_value()) {
      throw std::logic_error("Result::value() called on error: " + m_error);
    }
  }

  std::optional<T> m_value;
  std::string m_error;
};

template <> class Result<void> {
public:
  [[nodiscard]] static Result ok() { return Result(true, {}); }

  [[nodiscard]] static Result error(std::string message) {
    return Result(false, std::move(message));
  }

  [[nodiscard]] bool isOk() const { return m_ok; }
  [[nodiscard]] bool isError() const { return !m_ok; }

  [[nodiscard]] const std::string& error() const { return m_error; }

private:
  Result(bool ok, std::string message) : m_ok(ok), m_error(std::move(message)) {}

  bool m_ok;
  std::string m_error;
};

} // namespace StaticI18n
