#include "test_common.hpp"

using namespace gitfleet::test_support;

namespace {

void fake_repo(const fs::path& dir) { fs::create_directories(dir / ".git"); }

std::vector<std::string> names(const std::vector<RepoPath>& paths) {
    std::vector<std::string> out;
    for (const auto& p : paths)
        out.push_back(p.filename().string());
    return out;
}

} // namespace

TEST_CASE("first-level discovery finds direct children only") {
    fs::path root = temp_dir("scan_flat");
    fake_repo(root / "beta");
    fake_repo(root / "Alpha");
    fake_repo(root / "group" / "nested");
    fake_repo(root / ".hidden");
    fs::create_directories(root / "plain");
    std::ofstream(root / "file.txt") << "x";

    DiscoveryOptions opts;
    opts.roots = {root};
    auto found = build_repo_list(opts);
    REQUIRE(names(found) == std::vector<std::string>{"Alpha", "beta"});
    for (const auto& p : found)
        REQUIRE(p.is_absolute());
    FS_REMOVE_ALL(root);
}

TEST_CASE("recursive discovery honours depth and stops at repositories") {
    fs::path root = temp_dir("scan_deep");
    fake_repo(root / "a");
    fake_repo(root / "a" / "inner");
    fake_repo(root / "g" / "b");
    fake_repo(root / "g" / "h" / "c");

    DiscoveryOptions opts;
    opts.roots = {root};
    opts.recursive = true;
    REQUIRE(names(build_repo_list(opts)) == std::vector<std::string>{"a", "b", "c"});

    opts.max_depth = 2;
    REQUIRE(names(build_repo_list(opts)) == std::vector<std::string>{"a", "b"});
    FS_REMOVE_ALL(root);
}

TEST_CASE("a root that is a repository yields itself") {
    fs::path root = temp_dir("scan_self");
    fake_repo(root);
    fake_repo(root / "sub");
    DiscoveryOptions opts;
    opts.roots = {root};
    auto found = build_repo_list(opts);
    REQUIRE(found.size() == 1);
    REQUIRE(found[0] == normalize_repo_path(root));
    FS_REMOVE_ALL(root);
}

TEST_CASE("ignore patterns, exclusions and explicit repositories") {
    fs::path root = temp_dir("scan_filter");
    fake_repo(root / "keep");
    fake_repo(root / "skip-me");
    fake_repo(root / "drop");

    DiscoveryOptions opts;
    opts.roots = {root};
    opts.ignore = {"skip-*"};
    opts.exclude = {normalize_repo_path(root / "drop")};
    opts.repos = {root / "keep", root / "missing"};
    auto found = build_repo_list(opts);
    REQUIRE(names(found) == std::vector<std::string>{"keep", "missing"});
    FS_REMOVE_ALL(root);
}

TEST_CASE("sort modes") {
    fs::path root = temp_dir("scan_sort");
    fake_repo(root / "x" / "b");
    fake_repo(root / "y" / "a");
    DiscoveryOptions opts;
    opts.roots = {root};
    opts.recursive = true;
    opts.sort = SortMode::Name;
    REQUIRE(names(build_repo_list(opts)) == std::vector<std::string>{"a", "b"});
    opts.sort = SortMode::Path;
    REQUIRE(names(build_repo_list(opts)) == std::vector<std::string>{"b", "a"});

    SortMode mode = SortMode::None;
    REQUIRE(parse_sort_mode("path", mode));
    REQUIRE(mode == SortMode::Path);
    REQUIRE_FALSE(parse_sort_mode("size", mode));
    FS_REMOVE_ALL(root);
}

TEST_CASE("missing root is an error") {
    DiscoveryOptions opts;
    opts.roots = {"/nonexistent/gitfleet/root"};
    REQUIRE_THROWS_AS(build_repo_list(opts), std::runtime_error);
}

TEST_CASE("normalize_repo_path drops trailing separators") {
    REQUIRE(normalize_repo_path("/a/b/") == RepoPath("/a/b"));
    REQUIRE(normalize_repo_path("/a/./c/../b") == RepoPath("/a/b"));
    REQUIRE(normalize_repo_path("rel").is_absolute());
}
