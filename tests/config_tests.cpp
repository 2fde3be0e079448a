#include "test_common.hpp"

using namespace gitfleet::test_support;

namespace {

fs::path write_file(const fs::path& dir, const std::string& name, const std::string& body) {
    fs::path p = dir / name;
    std::ofstream(p) << body;
    return p;
}

} // namespace

TEST_CASE("YAML config loading") {
    fs::path dir = temp_dir("cfg_yaml");
    fs::path cfg = write_file(dir, "fleet.yaml",
                              "concurrency: 4\n"
                              "recursive: true\n"
                              "log-file:\n"
                              "root:\n  - /src\n  - /work\n"
                              "ignore: [node_modules, \"*.bak\"]\n"
                              "repositories:\n"
                              "  /src/app:\n    timeout: 5m\n"
                              "  /src/lib:\n");
    ConfigData data;
    std::string err;
    REQUIRE(load_yaml_config(cfg.string(), data, err));
    REQUIRE(data.opts["--concurrency"] == "4");
    REQUIRE(data.opts["--recursive"] == "true");
    REQUIRE(data.opts.count("--log-file"));
    REQUIRE(data.opts["--log-file"].empty());
    REQUIRE(data.lists["--root"] == std::vector<std::string>{"/src", "/work"});
    REQUIRE(data.lists["--ignore"] == std::vector<std::string>{"node_modules", "*.bak"});
    REQUIRE(data.lists["--repo"] == std::vector<std::string>{"/src/app", "/src/lib"});
    REQUIRE(data.repo_opts["/src/app"]["--timeout"] == "5m");
    REQUIRE(data.repo_opts["/src/lib"].empty());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("JSON config loading") {
    fs::path dir = temp_dir("cfg_json");
    fs::path cfg = write_file(dir, "fleet.json",
                              R"({"concurrency": 2, "no-colors": true, "tick": 0.5,
                                  "repositories": ["/a", "/b"], "ignore": ["tmp"]})");
    ConfigData data;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), data, err));
    REQUIRE(data.opts["--concurrency"] == "2");
    REQUIRE(data.opts["--no-colors"] == "true");
    REQUIRE(data.opts["--tick"] == "0.5");
    REQUIRE(data.lists["--repo"] == std::vector<std::string>{"/a", "/b"});
    REQUIRE(data.lists["--ignore"] == std::vector<std::string>{"tmp"});
    REQUIRE(data.repo_opts.empty());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("JSON per-repository settings") {
    fs::path dir = temp_dir("cfg_json_repo");
    fs::path cfg = write_file(dir, "fleet.json",
                              R"({"repositories": {"/a": {"exclude": true}, "/b": null}})");
    ConfigData data;
    std::string err;
    REQUIRE(load_json_config(cfg.string(), data, err));
    REQUIRE(data.lists["--repo"] == std::vector<std::string>{"/a", "/b"});
    REQUIRE(data.repo_opts["/a"]["--exclude"] == "true");
    FS_REMOVE_ALL(dir);
}

TEST_CASE("malformed configuration is reported") {
    fs::path dir = temp_dir("cfg_bad");
    ConfigData data;
    std::string err;

    SECTION("missing file") {
        REQUIRE_FALSE(load_yaml_config((dir / "none.yaml").string(), data, err));
        REQUIRE(err == "Failed to open file");
        REQUIRE_FALSE(load_json_config((dir / "none.json").string(), data, err));
    }
    SECTION("syntax errors") {
        auto y = write_file(dir, "bad.yaml", "root: [unterminated\n");
        REQUIRE_FALSE(load_yaml_config(y.string(), data, err));
        REQUIRE_FALSE(err.empty());
        auto j = write_file(dir, "bad.json", "{\"root\": ");
        err.clear();
        REQUIRE_FALSE(load_json_config(j.string(), data, err));
        REQUIRE_FALSE(err.empty());
    }
    SECTION("root must be a mapping") {
        auto y = write_file(dir, "list.yaml", "- a\n- b\n");
        REQUIRE_FALSE(load_yaml_config(y.string(), data, err));
        REQUIRE(err == "Root YAML node is not a map");
        auto j = write_file(dir, "list.json", "[1, 2]");
        REQUIRE_FALSE(load_json_config(j.string(), data, err));
        REQUIRE(err == "Root JSON value is not an object");
    }
    SECTION("nested values outside repositories") {
        auto y = write_file(dir, "nested.yaml", "logging:\n  level: debug\n");
        REQUIRE_FALSE(load_yaml_config(y.string(), data, err));
        REQUIRE(err == "Unsupported value for 'logging'");
        auto j = write_file(dir, "nested.json", R"({"repositories": 3})");
        REQUIRE_FALSE(load_json_config(j.string(), data, err));
        REQUIRE(err == "Unsupported value for 'repositories'");
    }
    SECTION("empty YAML document is fine") {
        auto y = write_file(dir, "empty.yaml", "");
        REQUIRE(load_yaml_config(y.string(), data, err));
        REQUIRE(data.opts.empty());
    }
    FS_REMOVE_ALL(dir);
}

TEST_CASE("theme files override colours") {
    fs::path dir = temp_dir("cfg_theme");
    TuiTheme theme;
    std::string err;
    auto j = write_file(dir, "theme.json", R"({"green": "G", "red": "R", "unknown": "x"})");
    REQUIRE(load_theme(j.string(), theme, err));
    REQUIRE(theme.green == "G");
    REQUIRE(theme.red == "R");
    REQUIRE(theme.cyan == TuiTheme{}.cyan);

    auto y = write_file(dir, "theme.yaml", "cyan: C\nbold: B\n");
    REQUIRE(load_theme(y.string(), theme, err));
    REQUIRE(theme.cyan == "C");
    REQUIRE(theme.bold == "B");
    REQUIRE(theme.green == "G");

    REQUIRE_FALSE(load_theme((dir / "missing.json").string(), theme, err));
    FS_REMOVE_ALL(dir);
}
