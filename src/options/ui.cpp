// options/ui.cpp
//
// Parse logging and presentation related flags/options.

#include <climits>
#include <map>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

void parse_logging_and_ui(Options& opts, ArgParser& parser,
                          const std::function<bool(const std::string&)>& cfg_flag,
                          const std::function<std::string(const std::string&)>& cfg_opt,
                          const std::map<std::string, std::string>& cfg_opts) {
    auto given = [&](const std::string& k) { return parser.has_flag(k) || cfg_opts.count(k); };
    auto value = [&](const std::string& k) {
        std::string val = parser.get_option(k);
        if (val.empty())
            val = cfg_opt(k);
        return val;
    };
    bool ok = false;

    if (given("--log-file")) {
        opts.logging.log_file = value("--log-file");
        if (opts.logging.log_file.empty())
            throw std::runtime_error("--log-file requires a path");
    }
    if (parser.has_flag("--verbose") || cfg_flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (given("--log-level")) {
        std::string val = value("--log-level");
        if (val.empty())
            throw std::runtime_error("--log-level requires a value");
        if (!parse_log_level(val, opts.logging.log_level))
            throw std::runtime_error("Invalid log level: " + val);
    }
    if (given("--max-log-size")) {
        opts.logging.max_log_size = parse_bytes(value("--max-log-size"), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (given("--max-log-files")) {
        opts.logging.max_log_files = parse_size_t(value("--max-log-files"), 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    opts.logging.json_log = parser.has_flag("--json-log") || cfg_flag("--json-log");
    opts.logging.compress_logs = parser.has_flag("--compress-logs") || cfg_flag("--compress-logs");
    opts.logging.use_syslog = parser.has_flag("--syslog") || cfg_flag("--syslog");
    if (given("--syslog-facility")) {
        opts.logging.syslog_facility = parse_int(value("--syslog-facility"), 0, INT_MAX, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --syslog-facility");
        opts.logging.use_syslog = true;
    }

    opts.no_colors = parser.has_flag("--no-colors") || cfg_flag("--no-colors");
    if (given("--color"))
        opts.custom_color = value("--color");
    if (given("--theme")) {
        std::string val = value("--theme");
        if (val.empty())
            throw std::runtime_error("--theme requires a file");
        opts.theme_file = val;
        std::string err;
        if (!load_theme(val, opts.theme, err))
            throw std::runtime_error("Failed to load theme: " + err);
    }
    opts.censor_names = parser.has_flag("--censor-names") || cfg_flag("--censor-names");
    if (given("--censor-char")) {
        std::string val = value("--censor-char");
        if (val.size() != 1)
            throw std::runtime_error("--censor-char requires a single character");
        opts.censor_char = val[0];
    }
}
