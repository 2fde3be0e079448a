// options/config.cpp
//
// Load configuration from YAML/JSON files and auto-discovery.

#include <cstdlib>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

void load_file(const fs::path& file, bool yaml, ConfigData& cfg) {
    std::string err;
    bool loaded = yaml ? load_yaml_config(file.string(), cfg, err)
                       : load_json_config(file.string(), cfg, err);
    if (!loaded)
        throw std::runtime_error("Failed to load config " + file.string() + ": " + err);
}

fs::path find_cfg(const fs::path& dir) {
    if (dir.empty())
        return {};
    std::error_code ec;
    fs::path y = dir / ".gitfleet.yaml";
    if (fs::exists(y, ec))
        return y;
    fs::path j = dir / ".gitfleet.json";
    if (fs::exists(j, ec))
        return j;
    return {};
}

} // namespace

void load_config_and_auto(int argc, char* argv[], ConfigData& cfg, fs::path& config_file) {
    const std::set<std::string> pre_known{"--config-yaml", "--config-json", "--root",
                                          "--auto-config"};
    const std::map<char, std::string> pre_short{{'y', "--config-yaml"}, {'j', "--config-json"}};
    // Other flags are unknown here and only reported by the full parse.
    ArgParser pre_parser(argc, argv, pre_known, pre_short, option_switches());
    if (pre_parser.has_flag("--config-yaml")) {
        std::string file = pre_parser.get_option("--config-yaml");
        if (file.empty())
            throw std::runtime_error("--config-yaml requires a file");
        load_file(file, true, cfg);
        config_file = file;
    }
    if (pre_parser.has_flag("--config-json")) {
        std::string file = pre_parser.get_option("--config-json");
        if (file.empty())
            throw std::runtime_error("--config-json requires a file");
        load_file(file, false, cfg);
        config_file = file;
    }

    bool want_auto = pre_parser.has_flag("--auto-config");
    auto it = cfg.opts.find("--auto-config");
    if (!want_auto && it != cfg.opts.end()) {
        bool ok = false;
        want_auto = parse_bool(it->second, ok) && ok;
    }
    if (!want_auto)
        return;

    fs::path root_hint;
    if (pre_parser.has_flag("--root"))
        root_hint = pre_parser.get_option("--root");
    else if (!pre_parser.positional().empty())
        root_hint = pre_parser.positional().front();
    else if (cfg.lists.count("--root") && !cfg.lists["--root"].empty())
        root_hint = cfg.lists["--root"].front();
    else if (cfg.opts.count("--root"))
        root_hint = cfg.opts["--root"];

    fs::path cfg_path = find_cfg(root_hint);
    if (cfg_path.empty()) {
        std::error_code ec;
        cfg_path = find_cfg(fs::current_path(ec));
    }
    if (cfg_path.empty()) {
        if (const char* home = std::getenv("HOME"))
            cfg_path = find_cfg(home);
    }
    if (cfg_path.empty())
        return;
    load_file(cfg_path, cfg_path.extension() == ".yaml", cfg);
    config_file = cfg_path;
}
