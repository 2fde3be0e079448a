#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "config_utils.hpp"
#include "logger.hpp"
#include "repo_options.hpp"
#include "scanner.hpp"
#include "tui.hpp"

class ArgParser;

/// Upper bound for timeouts and the auto-refresh interval.
constexpr std::chrono::hours MAX_DURATION_OPTION{24 * 7};

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
    bool use_syslog = false;
    int syslog_facility = 0;
};

struct Options {
    // Discovery
    std::vector<std::filesystem::path> roots;
    std::vector<std::filesystem::path> repos;
    bool recursive = false;
    size_t max_depth = 0;
    std::vector<std::filesystem::path> ignore;
    std::filesystem::path ignore_file;
    SortMode sort = SortMode::Name;

    // Scheduling
    size_t concurrency = 0; ///< 0 picks min(repository count, 8)
    std::chrono::milliseconds refresh_timeout{30000};
    std::chrono::milliseconds op_timeout{120000};
    std::chrono::milliseconds auto_refresh{0};
    std::chrono::milliseconds tick{250};
    std::string git_binary = "git";
    bool initial_refresh = true;

    LoggingOptions logging;

    // Presentation
    bool no_colors = false;
    std::string custom_color;
    std::filesystem::path theme_file;
    TuiTheme theme;
    bool censor_names = false;
    char censor_char = '*';

    std::filesystem::path config_file;
    bool auto_config = false;
    bool list_mode = false;
    bool show_help = false;
    bool print_version = false;
    std::map<std::filesystem::path, RepoOptions> repo_settings;
};

/**
 * @brief Parse command line and configuration files into Options.
 *
 * Configuration files named by `--config-yaml`, `--config-json` or found by
 * `--auto-config` are read first; command line values override them.
 *
 * @throws std::runtime_error on unknown options, invalid values or
 *         unreadable configuration files.
 */
Options parse_options(int argc, char* argv[]);

/// Options that are boolean switches and never consume a value.
const std::set<std::string>& option_switches();

/// Concurrency applied to a session of @a repo_count repositories.
size_t effective_concurrency(const Options& opts, size_t repo_count);

/// Discovery inputs derived from @a opts, including ignore-file patterns and exclusions.
DiscoveryOptions discovery_options(const Options& opts);

// Helpers implemented in src/options/*.cpp
void load_config_and_auto(int argc, char* argv[], ConfigData& cfg,
                          std::filesystem::path& config_file);
void parse_repo_settings(Options& opts,
                         const std::map<std::string, std::map<std::string, std::string>>&
                             cfg_repo_opts);
void parse_logging_and_ui(Options& opts, ArgParser& parser,
                          const std::function<bool(const std::string&)>& cfg_flag,
                          const std::function<std::string(const std::string&)>& cfg_opt,
                          const std::map<std::string, std::string>& cfg_opts);

#endif // OPTIONS_HPP
