#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>

/**
 * @brief Load configuration options from a YAML file.
 *
 * The root must be a map. Scalar entries become `--<key>` options; nested
 * maps are categories whose entries are flattened into the same namespace,
 * so `Logging: {log-level: debug}` yields `--log-level` = `debug`. Sequences
 * are ignored.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by `--<key>`.
 * @param error Receives a human-readable message on failure.
 * @return `true` if the file was read and parsed.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout and flattening rules as load_yaml_config().
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

#endif // CONFIG_UTILS_HPP
