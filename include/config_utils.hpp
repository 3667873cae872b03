#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>

/**
 * @brief Flattened contents of a configuration document.
 *
 * Top-level scalars land in @ref scalars as strings (booleans become
 * `true`/`false`, numbers their decimal form, null an empty string).
 * Top-level sequences of scalars land in @ref lists. Nested maps are
 * ignored.
 */
struct ConfigValues {
    std::map<std::string, std::string> scalars;
    std::map<std::string, std::vector<std::string>> lists;

    bool has(const std::string& key) const { return scalars.count(key) || lists.count(key); }
};

/**
 * @brief Load configuration values from a YAML file.
 *
 * @param path   Filesystem path to the YAML configuration file.
 * @param values Receives the flattened values on success.
 * @param error  Output string capturing a human-readable error message on
 *               failure.
 * @return `true` if the configuration was loaded successfully; `false`
 *         otherwise.
 */
bool load_yaml_config(const std::string& path, ConfigValues& values, std::string& error);

/**
 * @brief Load configuration values from a JSON file.
 *
 * Same contract as @ref load_yaml_config.
 */
bool load_json_config(const std::string& path, ConfigValues& values, std::string& error);

/**
 * @brief Load a configuration file, choosing the parser by extension.
 *
 * Files ending in `.json` are parsed as JSON, everything else as YAML.
 */
bool load_config_file(const std::string& path, ConfigValues& values, std::string& error);

#endif // CONFIG_UTILS_HPP
