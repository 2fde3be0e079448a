#include <algorithm>
#include <chrono>
#include <climits>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "ignore_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr size_t DEFAULT_MAX_CONCURRENCY = 8;
constexpr size_t MAX_CONCURRENCY = 256;

const std::set<std::string>& known_options() {
    static const std::set<std::string> known{
        "--root",           "--repo",          "--recursive",     "--max-depth",
        "--ignore",         "--ignore-file",   "--sort",          "--concurrency",
        "--refresh-timeout", "--op-timeout",   "--auto-refresh",  "--tick",
        "--git",            "--no-initial-refresh", "--log-file", "--log-level",
        "--verbose",        "--json-log",      "--max-log-size",  "--max-log-files",
        "--compress-logs",  "--syslog",        "--syslog-facility", "--no-colors",
        "--color",          "--theme",         "--censor-names",  "--censor-char",
        "--config-yaml",    "--config-json",   "--auto-config",   "--list",
        "--help",           "--version"};
    return known;
}

const std::set<std::string> REPO_SETTING_KEYS{"--exclude", "--timeout"};

// Seconds-based duration ("30", "2m") converted to milliseconds, at most a week.
std::chrono::milliseconds duration_ms(const std::string& val, const std::string& name,
                                      bool allow_zero) {
    bool ok = false;
    auto dur = parse_duration(val, ok);
    if (!ok || (!allow_zero && dur.count() < 1) || dur > MAX_DURATION_OPTION)
        throw std::runtime_error("Invalid value for " + name);
    return std::chrono::duration_cast<std::chrono::milliseconds>(dur);
}

} // namespace

const std::set<std::string>& option_switches() {
    static const std::set<std::string> switches{
        "--recursive",     "--no-initial-refresh", "--verbose",   "--json-log",
        "--compress-logs", "--syslog",             "--no-colors", "--censor-names",
        "--auto-config",   "--list",               "--help",      "--version"};
    return switches;
}

Options parse_options(int argc, char* argv[]) {
    fs::path config_file;
    ConfigData cfg;
    load_config_and_auto(argc, argv, cfg, config_file);

    const std::map<char, std::string> short_opts{
        {'o', "--root"},        {'e', "--recursive"}, {'D', "--max-depth"},
        {'I', "--ignore"},      {'n', "--concurrency"}, {'l', "--log-file"},
        {'L', "--log-level"},   {'g', "--verbose"},   {'C', "--no-colors"},
        {'y', "--config-yaml"}, {'j', "--config-json"}, {'h', "--help"},
        {'V', "--version"}};
    const auto& known = known_options();
    ArgParser parser(argc, argv, known, short_opts, option_switches());
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    for (const auto& kv : cfg.opts) {
        if (!known.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }
    for (const auto& kv : cfg.lists) {
        if (!known.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first);
    }
    for (const auto& repo : cfg.repo_opts) {
        for (const auto& kv : repo.second) {
            if (!REPO_SETTING_KEYS.count(kv.first))
                throw std::runtime_error("Unknown option in config: " + kv.first + " for " +
                                         repo.first);
        }
    }

    auto cfg_flag = [&](const std::string& k) {
        auto it = cfg.opts.find(k);
        if (it == cfg.opts.end())
            return false;
        bool ok = false;
        bool v = parse_bool(it->second, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for " + k + " in config");
        return v;
    };
    auto cfg_opt = [&](const std::string& k) {
        auto it = cfg.opts.find(k);
        if (it != cfg.opts.end())
            return it->second;
        return std::string();
    };
    auto cfg_list = [&](const std::string& k) {
        std::vector<std::string> out;
        auto it = cfg.lists.find(k);
        if (it != cfg.lists.end())
            out = it->second;
        auto single = cfg.opts.find(k);
        if (single != cfg.opts.end() && !single->second.empty())
            out.push_back(single->second);
        return out;
    };
    auto given = [&](const std::string& k) { return parser.has_flag(k) || cfg.opts.count(k); };
    auto value = [&](const std::string& k) {
        std::string val = parser.get_option(k);
        if (val.empty())
            val = cfg_opt(k);
        return val;
    };

    Options opts;
    bool ok = false;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    opts.list_mode = parser.has_flag("--list") || cfg_flag("--list");
    opts.auto_config = parser.has_flag("--auto-config") || cfg_flag("--auto-config");
    opts.config_file = config_file;

    // Roots given on the command line replace the configured ones; repositories
    // and ignore patterns from both sources are combined.
    std::vector<std::string> roots = parser.get_all_options("--root");
    roots.insert(roots.end(), parser.positional().begin(), parser.positional().end());
    if (roots.empty())
        roots = cfg_list("--root");
    for (const auto& r : roots)
        opts.roots.emplace_back(r);
    for (const auto& r : cfg_list("--repo"))
        opts.repos.emplace_back(r);
    for (const auto& r : parser.get_all_options("--repo"))
        opts.repos.emplace_back(r);
    for (const auto& p : cfg_list("--ignore"))
        opts.ignore.emplace_back(p);
    for (const auto& p : parser.get_all_options("--ignore"))
        opts.ignore.emplace_back(p);
    if (given("--ignore-file")) {
        opts.ignore_file = value("--ignore-file");
        if (opts.ignore_file.empty())
            throw std::runtime_error("--ignore-file requires a path");
    }
    opts.recursive = parser.has_flag("--recursive") || cfg_flag("--recursive");
    if (given("--max-depth")) {
        opts.max_depth = parse_size_t(value("--max-depth"), 1, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-depth");
    }
    if (given("--sort")) {
        if (!parse_sort_mode(value("--sort"), opts.sort))
            throw std::runtime_error("Invalid value for --sort");
    }

    if (given("--concurrency")) {
        opts.concurrency = parse_size_t(value("--concurrency"), 0, MAX_CONCURRENCY, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --concurrency");
    }
    if (given("--refresh-timeout"))
        opts.refresh_timeout = duration_ms(value("--refresh-timeout"), "--refresh-timeout", false);
    if (given("--op-timeout"))
        opts.op_timeout = duration_ms(value("--op-timeout"), "--op-timeout", false);
    if (given("--auto-refresh"))
        opts.auto_refresh = duration_ms(value("--auto-refresh"), "--auto-refresh", true);
    if (given("--tick")) {
        opts.tick = parse_time_ms(value("--tick"), ok);
        if (!ok || opts.tick.count() < 10 || opts.tick.count() > 10000)
            throw std::runtime_error("Invalid value for --tick");
    }
    if (given("--git")) {
        opts.git_binary = value("--git");
        if (opts.git_binary.empty())
            throw std::runtime_error("--git requires a program");
    }
    opts.initial_refresh =
        !(parser.has_flag("--no-initial-refresh") || cfg_flag("--no-initial-refresh"));

    parse_logging_and_ui(opts, parser, cfg_flag, cfg_opt, cfg.opts);
    parse_repo_settings(opts, cfg.repo_opts);
    return opts;
}

size_t effective_concurrency(const Options& opts, size_t repo_count) {
    if (opts.concurrency > 0)
        return opts.concurrency;
    return std::max<size_t>(1, std::min(repo_count, DEFAULT_MAX_CONCURRENCY));
}

DiscoveryOptions discovery_options(const Options& opts) {
    DiscoveryOptions d;
    d.roots = opts.roots;
    d.repos = opts.repos;
    if (d.roots.empty() && d.repos.empty())
        d.roots.push_back(fs::current_path());
    d.recursive = opts.recursive;
    d.max_depth = opts.max_depth;
    d.ignore = opts.ignore;
    if (!opts.ignore_file.empty()) {
        bool ok = false;
        auto extra = ignore::read_ignore_file(opts.ignore_file, ok);
        if (!ok)
            throw std::runtime_error("Cannot read ignore file " + opts.ignore_file.string());
        d.ignore.insert(d.ignore.end(), extra.begin(), extra.end());
    }
    for (const auto& [path, ro] : opts.repo_settings) {
        if (ro.exclude.value_or(false))
            d.exclude.insert(path);
    }
    d.sort = opts.sort;
    return d;
}
