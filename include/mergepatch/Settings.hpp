/**
 * @file Settings.hpp
 * @brief Layered settings for the mergepatch tool
 *
 * Settings are resolved with the precedence:
 *   defaults -> settings file -> environment -> command-line flags
 *
 * Recognised keys (at the root, or inside an "output" table/object):
 * - escape_html: boolean
 * - indent: integer >= -1 (-1 means compact)
 * - max_depth: integer >= 1
 *
 * Settings files are JSON (nlohmann::json) or TOML (toml++), selected by
 * extension. Environment variables are PREFIX_ESCAPE_HTML, PREFIX_INDENT
 * and PREFIX_MAX_DEPTH.
 */

#ifndef MERGEPATCH_SETTINGS_HPP
#define MERGEPATCH_SETTINGS_HPP

#include "mergepatch/Value.hpp"
#include "mergepatch/Options.hpp"
#include <optional>
#include <string>

namespace mergepatch {

/// Environment variable prefix used by the command-line tool.
inline constexpr const char* kEnvPrefix = "MERGEPATCH";

/**
 * @brief Read a JSON or TOML settings file into a Value
 *
 * @param path Path ending in .json or .toml
 * @return Parsed settings tree
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError on syntax errors or an unsupported extension
 */
Value load_settings_file(const std::string& path);

/**
 * @brief Overlay recognised keys of a settings tree onto options
 *
 * Keys inside an "output" object take precedence over root-level keys.
 * Unrecognised keys are ignored.
 *
 * @param options Options to update
 * @param settings Settings tree (must be an object)
 * @param source File name used in error messages
 * @throws ConfigParseError if a recognised key has the wrong type or range
 */
void apply_settings(ApplyOptions& options, const Value& settings, const std::string& source);

/**
 * @brief Overlay PREFIX_* environment variables onto options
 *
 * Values are typed the way settings files type them: "true"/"false"
 * (case-insensitive) are booleans, digit strings with an optional '-'
 * are integers.
 *
 * @param options Options to update
 * @param prefix Variable prefix, without the trailing underscore
 * @throws ConfigParseError naming the variable on a bad value
 */
void apply_env_settings(ApplyOptions& options, const std::string& prefix = kEnvPrefix);

/**
 * @brief Resolve options from defaults, an optional file and the environment
 *
 * @param file Settings file, if any
 * @param prefix Environment variable prefix
 * @return Resolved options
 */
ApplyOptions load_options(const std::optional<std::string>& file,
                          const std::string& prefix = kEnvPrefix);

} // namespace mergepatch

#endif // MERGEPATCH_SETTINGS_HPP
