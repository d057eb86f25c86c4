#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include "render.hpp"

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top-level scalars map to `--<key>`. Nested maps act as categories and
 * their scalars are flattened the same way, so `status: {no-renames: true}`
 * yields `--no-renames`.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by long flag.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout as @ref load_yaml_config.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load a color theme.
 *
 * Reads the theme file at @p path (JSON when the extension is `.json`,
 * YAML otherwise) and overrides the fields of @p theme it names.
 *
 * @return `true` if the theme was loaded successfully; `false` otherwise.
 */
bool load_theme(const std::string& path, gitsight::Theme& theme, std::string& error);

#endif // CONFIG_UTILS_HPP
