#include "test_common.hpp"

using namespace gitfleet::test_support;

TEST_CASE("parse_options defaults") {
    const char* argv[] = {"prog"};
    Options opts = parse_options(1, const_cast<char**>(argv));
    REQUIRE(opts.roots.empty());
    REQUIRE(opts.repos.empty());
    REQUIRE_FALSE(opts.recursive);
    REQUIRE(opts.concurrency == 0);
    REQUIRE(opts.refresh_timeout == std::chrono::seconds(30));
    REQUIRE(opts.op_timeout == std::chrono::minutes(2));
    REQUIRE(opts.auto_refresh.count() == 0);
    REQUIRE(opts.tick == std::chrono::milliseconds(250));
    REQUIRE(opts.git_binary == "git");
    REQUIRE(opts.initial_refresh);
    REQUIRE(opts.logging.log_level == LogLevel::INFO);
    REQUIRE(opts.censor_char == '*');
    REQUIRE_FALSE(opts.list_mode);
}

TEST_CASE("parse_options discovery and scheduling flags") {
    const char* argv[] = {"prog",   "--root",      "/a",       "-n",       "4",
                          "--sort", "path",        "-e",       "-D",       "3",
                          "-I",     "vendor",      "--repo",   "/r",       "--ignore=*.bak",
                          "/b",     "--no-initial-refresh",    "--git",    "/opt/git"};
    Options opts = parse_options(19, const_cast<char**>(argv));
    REQUIRE(opts.roots == std::vector<fs::path>{"/a", "/b"});
    REQUIRE(opts.repos == std::vector<fs::path>{"/r"});
    REQUIRE(opts.concurrency == 4);
    REQUIRE(opts.sort == SortMode::Path);
    REQUIRE(opts.recursive);
    REQUIRE(opts.max_depth == 3);
    REQUIRE(opts.ignore == std::vector<fs::path>{"vendor", "*.bak"});
    REQUIRE_FALSE(opts.initial_refresh);
    REQUIRE(opts.git_binary == "/opt/git");
}

TEST_CASE("parse_options duration units") {
    const char* argv[] = {"prog",         "--refresh-timeout", "45", "--op-timeout", "5m",
                          "--auto-refresh", "1h",             "--tick", "2s"};
    Options opts = parse_options(9, const_cast<char**>(argv));
    REQUIRE(opts.refresh_timeout == std::chrono::seconds(45));
    REQUIRE(opts.op_timeout == std::chrono::minutes(5));
    REQUIRE(opts.auto_refresh == std::chrono::hours(1));
    REQUIRE(opts.tick == std::chrono::milliseconds(2000));
}

TEST_CASE("parse_options rejects invalid input") {
    auto fails = [](std::vector<std::string> args) {
        args.insert(args.begin(), "prog");
        std::vector<char*> argv;
        for (auto& a : args)
            argv.push_back(a.data());
        argv.push_back(nullptr);
        return parse_options(static_cast<int>(args.size()), argv.data());
    };
    REQUIRE_THROWS_AS(fails({"--concurrency", "999"}), std::runtime_error);
    REQUIRE_THROWS_AS(fails({"--concurrency", "four"}), std::runtime_error);
    REQUIRE_THROWS_AS(fails({"--max-depth", "0"}), std::runtime_error);
    REQUIRE_THROWS_AS(fails({"--tick", "5"}), std::runtime_error);
    REQUIRE_THROWS_AS(fails({"--refresh-timeout", "0"}), std::runtime_error);
    REQUIRE_THROWS_AS(fails({"--sort", "size"}), std::runtime_error);
    REQUIRE_THROWS_AS(fails({"--log-level", "LOUD"}), std::runtime_error);
    REQUIRE_THROWS_AS(fails({"--censor-char", "ab"}), std::runtime_error);
    REQUIRE_THROWS_AS(fails({"--max-log-files", "0"}), std::runtime_error);
    REQUIRE_THROWS_AS(fails({"--log-file"}), std::runtime_error);
    REQUIRE_THROWS_AS(fails({"-Z"}), std::runtime_error);
    REQUIRE_THROWS_WITH(fails({"--bogus"}), "Unknown option: --bogus");
}

TEST_CASE("durations longer than a week are rejected") {
    auto parse = [](std::vector<std::string> args) {
        args.insert(args.begin(), "prog");
        std::vector<char*> argv;
        for (auto& a : args)
            argv.push_back(a.data());
        argv.push_back(nullptr);
        return parse_options(static_cast<int>(args.size()), argv.data());
    };
    REQUIRE(parse({"--op-timeout", "7d"}).op_timeout == std::chrono::hours(24 * 7));
    REQUIRE(parse({"--auto-refresh", "1w"}).auto_refresh == std::chrono::hours(24 * 7));
    REQUIRE_THROWS_WITH(parse({"--op-timeout", "1000000d"}), "Invalid value for --op-timeout");
    REQUIRE_THROWS_WITH(parse({"--refresh-timeout", "8d"}),
                        "Invalid value for --refresh-timeout");
    REQUIRE_THROWS_WITH(parse({"--auto-refresh", "2w"}), "Invalid value for --auto-refresh");
    REQUIRE_THROWS_WITH(parse({"--op-timeout", "2147483647w"}),
                        "Invalid value for --op-timeout");

    fs::path dir = temp_dir("opts_long_timeout");
    fs::path cfg = dir / "fleet.json";
    std::ofstream(cfg) << R"({"repositories": {"/a": {"timeout": "30d"}}})";
    REQUIRE_THROWS_WITH(parse({"--config-json", cfg.string()}),
                        "Invalid per-repo timeout for /a");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("parse_options logging and display flags") {
    const char* argv[] = {"prog",          "--log-file",  "/tmp/gitfleet.log", "--verbose",
                          "--max-log-size", "10M",        "--max-log-files",   "3",
                          "--json-log",    "--compress-logs", "--syslog-facility", "8",
                          "-C",            "--color",     "\033[35m",          "--censor-names",
                          "--censor-char", "#",           "--list"};
    Options opts = parse_options(19, const_cast<char**>(argv));
    REQUIRE(opts.logging.log_file == "/tmp/gitfleet.log");
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.logging.max_log_size == 10u * 1024 * 1024);
    REQUIRE(opts.logging.max_log_files == 3);
    REQUIRE(opts.logging.json_log);
    REQUIRE(opts.logging.compress_logs);
    REQUIRE(opts.logging.use_syslog);
    REQUIRE(opts.logging.syslog_facility == 8);
    REQUIRE(opts.no_colors);
    REQUIRE(opts.custom_color == "\033[35m");
    REQUIRE(opts.censor_names);
    REQUIRE(opts.censor_char == '#');
    REQUIRE(opts.list_mode);
}

TEST_CASE("explicit log level wins over verbose") {
    const char* argv[] = {"prog", "-g", "-L", "error"};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(opts.logging.log_level == LogLevel::ERR);
}

TEST_CASE("parse_options merges a YAML config") {
    fs::path dir = temp_dir("opts_yaml");
    fs::path cfg = dir / "fleet.yaml";
    std::ofstream(cfg) << "root: [/cfg-root]\n"
                          "concurrency: 2\n"
                          "recursive: yes\n"
                          "ignore: [cache]\n"
                          "repositories:\n"
                          "  /srv/app:\n    timeout: 10m\n"
                          "  /srv/old:\n    exclude: true\n";
    const std::string path = cfg.string();

    SECTION("config values apply") {
        const char* argv[] = {"prog", "--config-yaml", path.c_str()};
        Options opts = parse_options(3, const_cast<char**>(argv));
        REQUIRE(opts.config_file == cfg);
        REQUIRE(opts.roots == std::vector<fs::path>{"/cfg-root"});
        REQUIRE(opts.concurrency == 2);
        REQUIRE(opts.recursive);
        REQUIRE(opts.ignore == std::vector<fs::path>{"cache"});
        REQUIRE(opts.repos == std::vector<fs::path>{"/srv/app", "/srv/old"});
        REQUIRE(opts.repo_settings.at("/srv/app").timeout == std::chrono::minutes(10));
        REQUIRE_FALSE(opts.repo_settings.at("/srv/app").exclude.has_value());
        REQUIRE(opts.repo_settings.at("/srv/old").exclude.value_or(false));

        DiscoveryOptions d = discovery_options(opts);
        REQUIRE(d.exclude.count("/srv/old"));
        REQUIRE_FALSE(d.exclude.count("/srv/app"));
    }
    SECTION("command line overrides config") {
        const char* argv[] = {"prog", "-y", path.c_str(), "-n", "6", "/cli-root",
                              "--ignore", "tmp"};
        Options opts = parse_options(8, const_cast<char**>(argv));
        REQUIRE(opts.concurrency == 6);
        REQUIRE(opts.roots == std::vector<fs::path>{"/cli-root"});
        REQUIRE(opts.ignore == std::vector<fs::path>{"cache", "tmp"});
    }
    FS_REMOVE_ALL(dir);
}

TEST_CASE("parse_options rejects unknown config keys") {
    fs::path dir = temp_dir("opts_bad_cfg");
    fs::path cfg = dir / "fleet.json";
    const std::string path = cfg.string();
    const char* argv[] = {"prog", "--config-json", path.c_str()};

    std::ofstream(cfg) << R"({"nope": 1})";
    REQUIRE_THROWS_WITH(parse_options(3, const_cast<char**>(argv)),
                        "Unknown option in config: --nope");

    std::ofstream(cfg) << R"({"repositories": {"/a": {"colour": "red"}}})";
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), std::runtime_error);

    std::ofstream(cfg) << R"({"repositories": {"/a": {"timeout": "soon"}}})";
    REQUIRE_THROWS_WITH(parse_options(3, const_cast<char**>(argv)),
                        "Invalid per-repo timeout for /a");

    std::ofstream(cfg) << R"({"recursive": "perhaps"})";
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(argv)), std::runtime_error);

    const char* missing[] = {"prog", "--config-json", "/nonexistent/fleet.json"};
    REQUIRE_THROWS_AS(parse_options(3, const_cast<char**>(missing)), std::runtime_error);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("auto config is found beside the root") {
    fs::path dir = temp_dir("opts_auto");
    std::ofstream(dir / ".gitfleet.yaml") << "concurrency: 3\n";
    const std::string root = dir.string();
    const char* argv[] = {"prog", "--auto-config", "--root", root.c_str()};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(opts.auto_config);
    REQUIRE(opts.concurrency == 3);
    REQUIRE(opts.config_file == dir / ".gitfleet.yaml");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("effective concurrency") {
    Options opts;
    REQUIRE(effective_concurrency(opts, 0) == 1);
    REQUIRE(effective_concurrency(opts, 3) == 3);
    REQUIRE(effective_concurrency(opts, 50) == 8);
    opts.concurrency = 16;
    REQUIRE(effective_concurrency(opts, 3) == 16);
}

TEST_CASE("discovery options") {
    fs::path dir = temp_dir("opts_discovery");
    Options opts;
    SECTION("current directory is the default root") {
        DiscoveryOptions d = discovery_options(opts);
        REQUIRE(d.roots == std::vector<fs::path>{fs::current_path()});
    }
    SECTION("explicit repositories alone need no root") {
        opts.repos = {"/srv/app"};
        REQUIRE(discovery_options(opts).roots.empty());
    }
    SECTION("ignore file patterns are appended") {
        std::ofstream(dir / "ignore") << "# comment\nbuild\n";
        opts.ignore = {"tmp"};
        opts.ignore_file = dir / "ignore";
        REQUIRE(discovery_options(opts).ignore == std::vector<fs::path>{"tmp", "build"});
        opts.ignore_file = dir / "missing";
        REQUIRE_THROWS_AS(discovery_options(opts), std::runtime_error);
    }
    FS_REMOVE_ALL(dir);
}
