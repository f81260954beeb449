#pragma once

/**
 * @file collection_builder.hpp
 * @brief Builds the localized file collection for one locale pass
 */

#include "StaticI18n/config/i18n_config.hpp"
#include "StaticI18n/core/result.hpp"
#include "StaticI18n/i18n/localized_file.hpp"
#include "StaticI18n/i18n/localized_file_collection.hpp"
#include <string>
#include <vector>

namespace StaticI18n::i18n {

/**
 * @brief Resolution context for @p locale under @p config
 */
[[nodiscard]] ResolutionContext makeResolutionContext(const config::I18nConfig& config,
                                                      const std::string& locale);

/**
 * @brief Resolve every source file for @p locale, in walker order
 *
 * Later files that land on an already used destination are dropped.
 * @return Error when @p locale is not configured
 */
[[nodiscard]] Result<LocalizedFileCollection>
buildLocalizedCollection(const config::I18nConfig& config, const std::string& locale,
                         const std::vector<SourceFile>& sourceFiles,
                         const ExistsPredicate& exists = filesystemExists());

} // namespace StaticI18n::i18n
