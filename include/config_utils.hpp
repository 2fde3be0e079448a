#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include <vector>
#include "tui.hpp"

/**
 * @brief Values read from a configuration file.
 *
 * Keys are stored with a leading `--` so they can be checked against the
 * same known-option set as the command line.
 */
struct ConfigData {
    /// Scalar options such as `--concurrency`.
    std::map<std::string, std::string> opts;
    /// Sequence options such as `--ignore`, values in file order.
    std::map<std::string, std::vector<std::string>> lists;
    /// Per-repository overrides keyed by repository path.
    std::map<std::string, std::map<std::string, std::string>> repo_opts;
};

/**
 * @brief Load configuration options from a YAML file.
 *
 * The root must be a map. Scalars become options, sequences of scalars
 * become repeated options. The `repositories` key is either a sequence of
 * paths (stored under `--repo`) or a map from path to per-repository
 * settings; the paths of such a map are listed repositories too.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param cfg   Receives the values; existing entries are overwritten.
 * @param error Human-readable message on failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, ConfigData& cfg, std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Accepts the same layout as load_yaml_config() with a JSON object as root.
 *
 * @param path  Filesystem path to the JSON configuration file.
 * @param cfg   Receives the values; existing entries are overwritten.
 * @param error Human-readable message on failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_json_config(const std::string& path, ConfigData& cfg, std::string& error);

/**
 * @brief Load a theme definition for the text user interface.
 *
 * The file is JSON when its extension is `.json` and YAML otherwise. Known
 * keys (`reset`, `green`, `yellow`, `red`, `cyan`, `gray`, `bold`,
 * `magenta`, `inverse`) replace the corresponding escape sequences.
 *
 * @param path  Filesystem path to the theme file.
 * @param theme Theme updated on success.
 * @param error Human-readable message on failure.
 * @return `true` if the theme was loaded successfully.
 */
bool load_theme(const std::string& path, TuiTheme& theme, std::string& error);

#endif // CONFIG_UTILS_HPP
