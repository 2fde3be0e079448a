#include <algorithm>
#include <sstream>
#include "test_common.hpp"
#include "help_text.hpp"
#include "tui.hpp"
#include "ui_loop.hpp"

using namespace gitfleet::test_support;

namespace {

RepositoryState clean_state(const RepoPath& path) {
    RepositoryState st;
    st.path = path;
    st.status = RS_CLEAN;
    st.info.branch = "main";
    st.info.has_upstream = true;
    st.info.ahead = 0u;
    st.info.behind = 3u;
    st.info.untracked = 2;
    return st;
}

const TuiColors NO_COLORS = make_tui_colors(true, "", TuiTheme{});

} // namespace

TEST_CASE("render_plain_line summarises a repository") {
    RepositoryState st = clean_state("/src/app");
    REQUIRE(render_plain_line(st, false, '*') == "[Clean] app (main) -3 behind, 2 untracked");

    st.status = RS_ERROR;
    st.error = RepoError{FailureKind::TimedOut, "fetch timed out after 30s\nmore"};
    REQUIRE(render_plain_line(st, false, '*') ==
            "[TimedOut] app (main) - fetch timed out after 30s");

    RepositoryState fresh;
    fresh.path = "/src/lib";
    REQUIRE(render_plain_line(fresh, true, '#') == "[Unknown] ###");
}

TEST_CASE("render_repo_entry marks, labels and censors") {
    RepositoryState st = clean_state("/src/secret-project");
    auto now = std::chrono::system_clock::now();
    st.last_sync = now - std::chrono::minutes(5);
    std::string line = render_repo_entry(st, true, true, 0, false, '*', NO_COLORS, now);
    REQUIRE(line.rfind("*>", 0) == 0);
    REQUIRE(line.find("[Clean      ]") != std::string::npos);
    REQUIRE(line.find("secret-project") != std::string::npos);
    REQUIRE(line.find("-3 behind") != std::string::npos);
    REQUIRE(line.find("5m") != std::string::npos);

    std::string censored = render_repo_entry(st, false, false, 0, true, '*', NO_COLORS, now);
    REQUIRE(censored.rfind("  ", 0) == 0);
    REQUIRE(censored.find("secret") == std::string::npos);
    REQUIRE(censored.find("**************") != std::string::npos);

    st.status = RS_REFRESHING;
    st.pending_operation = OperationKind::Pull;
    std::string busy = render_repo_entry(st, false, false, 1, false, '*', NO_COLORS, now);
    REQUIRE(busy.find("[Pull /") != std::string::npos);

    st.status = RS_ERROR;
    st.pending_operation.reset();
    st.error = RepoError{FailureKind::RepoUnavailable, "path does not exist"};
    std::string err = render_repo_entry(st, false, false, 0, false, '*', NO_COLORS, now);
    REQUIRE(err.find("[Unavailable]") != std::string::npos);
    REQUIRE(err.find("path does not exist") != std::string::npos);
}

TEST_CASE("colours follow the options") {
    TuiTheme theme;
    TuiColors plain = make_tui_colors(true, "", theme);
    REQUIRE(plain.green.empty());
    REQUIRE(plain.reset.empty());
    TuiColors custom = make_tui_colors(false, "\033[35m", theme);
    REQUIRE(custom.green == "\033[35m");
    REQUIRE(custom.reset == theme.reset);
    TuiColors themed = make_tui_colors(false, "", theme);
    REQUIRE(themed.red == theme.red);
}

TEST_CASE("render_frame shows header, rows and footer") {
    UiSnapshot snap;
    snap.rows = {clean_state("/src/a"), clean_state("/src/b")};
    snap.total = 3;
    snap.filter = "src";
    snap.busy = 1;
    snap.queued = 2;
    snap.marked = {"/src/b"};
    snap.cursor = 1;
    DisplayOptions opts;
    opts.no_colors = true;
    std::string frame = render_frame(snap, opts);
    REQUIRE(frame.find(std::string("gitfleet v") + GITFLEET_VERSION) != std::string::npos);
    REQUIRE(frame.find("Repos: 3 (2 shown, filter \"src\")") != std::string::npos);
    REQUIRE(frame.find("Busy: 1") != std::string::npos);
    REQUIRE(frame.find("Queued: 2") != std::string::npos);
    REQUIRE(frame.find("Marked: 1") != std::string::npos);
    REQUIRE(frame.find("Working") != std::string::npos);
    REQUIRE(frame.find("*>") != std::string::npos);
    REQUIRE(frame.find("q quit") != std::string::npos);
    REQUIRE(frame.find("\033[32m") == std::string::npos);

    SECTION("status messages replace the activity line") {
        snap.status_message = "Push: already in progress for a";
        snap.status_is_error = true;
        REQUIRE(render_frame(snap, opts).find("Status: Push: already in progress for a") !=
                std::string::npos);
    }
    SECTION("overlays replace the list") {
        snap.mode = UiMode::Help;
        snap.overlay = help_overlay_lines();
        std::string help = render_frame(snap, opts);
        REQUIRE(help.find("Keys") != std::string::npos);
        REQUIRE(help.find("Esc or q to close") != std::string::npos);
        REQUIRE(help.find("Repository") == std::string::npos);
    }
    SECTION("input prompts") {
        snap.mode = UiMode::Checkout;
        snap.input = "rel";
        REQUIRE(render_frame(snap, opts).find("Checkout branch: rel_") != std::string::npos);
    }
    SECTION("long lists scroll around the cursor") {
        snap.rows.clear();
        for (int i = 0; i < 20; ++i)
            snap.rows.push_back(clean_state("/src/repo" + std::to_string(100 + i)));
        snap.cursor = 15;
        opts.max_rows = 4;
        std::string scrolled = render_frame(snap, opts);
        REQUIRE(scrolled.find("repo115") != std::string::npos);
        REQUIRE(scrolled.find("repo100") == std::string::npos);
        REQUIRE(scrolled.find("repo119") == std::string::npos);
    }
}

TEST_CASE("empty view says so") {
    UiSnapshot snap;
    DisplayOptions opts;
    opts.no_colors = true;
    std::string frame = render_frame(snap, opts);
    REQUIRE(frame.find("(no repositories)") != std::string::npos);
    REQUIRE(frame.find("Idle") != std::string::npos);
}

TEST_CASE("error log and details overlays") {
    std::deque<ErrorLogEntry> log;
    REQUIRE(error_log_lines(log).at(2) == "  no errors");
    log.push_back(ErrorLogEntry{std::chrono::system_clock::now(), "/src/a", OperationKind::Fetch,
                                FailureKind::GitCommandFailed, "first"});
    log.push_back(ErrorLogEntry{std::chrono::system_clock::now(), "/src/b", OperationKind::Push,
                                FailureKind::TimedOut, "second"});
    auto lines = error_log_lines(log);
    REQUIRE(lines[0] == "Error log (2 entries, newest first)");
    REQUIRE(lines[2].find("/src/b: second") != std::string::npos);
    REQUIRE(lines[3].find("/src/a: first") != std::string::npos);

    RepositoryState st = clean_state("/src/a");
    st.info.remote_url = "git@example.com:team/a.git";
    st.error = RepoError{FailureKind::GitCommandFailed, "line one\nline two"};
    auto details = details_lines(st);
    auto has = [&](const std::string& text) {
        return std::any_of(details.begin(), details.end(),
                           [&](const std::string& l) { return l.find(text) != std::string::npos; });
    };
    REQUIRE(has("Path:        /src/a"));
    REQUIRE(has("Remote URL:  git@example.com:team/a.git"));
    REQUIRE(has("Refreshed:   never"));
    REQUIRE(has("  line two"));
}

TEST_CASE("long overlays are clipped to the screen and scroll") {
    std::deque<ErrorLogEntry> log;
    for (int i = 0; i < 200; ++i)
        log.push_back(ErrorLogEntry{std::chrono::system_clock::now(),
                                    "/src/r" + std::to_string(i), OperationKind::Fetch,
                                    FailureKind::GitCommandFailed, "failed"});
    UiSnapshot snap;
    snap.mode = UiMode::ErrorLog;
    snap.overlay = error_log_lines(log);
    DisplayOptions opts;
    opts.no_colors = true;
    opts.max_rows = 20;
    auto line_count = [](const std::string& frame) {
        return static_cast<size_t>(std::count(frame.begin(), frame.end(), '\n'));
    };

    std::string top = render_frame(snap, opts);
    REQUIRE(line_count(top) <= opts.max_rows + 9);
    REQUIRE(top.find("gitfleet v") != std::string::npos);
    REQUIRE(top.find("Error log (200 entries") != std::string::npos);
    REQUIRE(top.find("/src/r199: ") != std::string::npos);
    REQUIRE(top.find("/src/r0: ") == std::string::npos);
    REQUIRE(top.find("lines 1-19 of 202") != std::string::npos);

    snap.overlay_scroll = snap.overlay.size() - 1;
    std::string bottom = render_frame(snap, opts);
    REQUIRE(line_count(bottom) <= opts.max_rows + 9);
    REQUIRE(bottom.find("/src/r0: ") != std::string::npos);
    REQUIRE(bottom.find("Error log (200 entries") == std::string::npos);
    REQUIRE(bottom.find("lines 202-202 of 202") != std::string::npos);

    opts.max_rows = 0;
    REQUIRE(line_count(render_frame(snap, opts)) > 200);
}

TEST_CASE("names are cut at character boundaries") {
    std::string accented;
    for (int i = 0; i < 30; ++i)
        accented += "\xc3\xa9";
    RepositoryState st = clean_state("/src/" + accented);
    std::string line = render_repo_entry(st, false, false, 0, false, '*', NO_COLORS);
    REQUIRE(line.find(accented.substr(0, 46) + "~ main") != std::string::npos);
    REQUIRE(line.find(accented.substr(0, 48)) == std::string::npos);

    RepositoryState short_name = clean_state("/src/caf\xc3\xa9");
    std::string padded = render_repo_entry(short_name, false, false, 0, false, '*', NO_COLORS);
    REQUIRE(padded.find("caf\xc3\xa9" + std::string(20, ' ') + " main") != std::string::npos);
}

TEST_CASE("header shows sort order and hidden repositories") {
    UiSnapshot snap;
    snap.total = 5;
    snap.sort = "status desc";
    snap.hidden = 2;
    DisplayOptions opts;
    opts.no_colors = true;
    std::string frame = render_frame(snap, opts);
    REQUIRE(frame.find("Hidden: 2  Sort: status desc") != std::string::npos);
    snap.showing_hidden = true;
    REQUIRE(render_frame(snap, opts).find("Hidden: 2 (shown)") != std::string::npos);
}

TEST_CASE("help text lists every option group") {
    std::string help = help_text("gitfleet");
    for (const char* needle : {"Usage: gitfleet", "--root", "--concurrency", "--refresh-timeout",
                               "--op-timeout", "--config-yaml", "--log-file", "--list",
                               "--censor-names", "Keys"})
        REQUIRE(help.find(needle) != std::string::npos);
}

TEST_CASE("list mode reports every repository and fails on errors") {
    fs::path dir = temp_dir("list_mode");
    Options opts;
    std::vector<RepoPath> repos{normalize_repo_path(dir / "gone")};
    std::ostringstream out;
    int rc = run_list_mode(opts, repos, out);
    REQUIRE(rc == 2);
    REQUIRE(out.str().rfind("[Unavailable] gone", 0) == 0);

    if (!have_git()) {
        WARN("git not available; skipping");
        FS_REMOVE_ALL(dir);
        return;
    }
    init_repo(dir / "fine");
    std::ostringstream ok_out;
    REQUIRE(run_list_mode(opts, {normalize_repo_path(dir / "fine")}, ok_out) == 0);
    REQUIRE(ok_out.str().rfind("[Clean] fine (main) no remote, clean", 0) == 0);
    FS_REMOVE_ALL(dir);
}
