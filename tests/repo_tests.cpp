#include "test_common.hpp"

TEST_CASE("sync summary wording") {
    StatusSnapshot s;
    REQUIRE(sync_summary(s) == "no remote");
    s.has_upstream = true;
    REQUIRE(sync_summary(s) == "?");
    s.ahead = 0;
    s.behind = 0;
    REQUIRE(sync_summary(s) == "synced");
    s.ahead = 2;
    REQUIRE(sync_summary(s) == "+2 ahead");
    s.behind = 3;
    REQUIRE(sync_summary(s) == "+2/-3");
    s.ahead = 0;
    REQUIRE(sync_summary(s) == "-3 behind");
}

TEST_CASE("worktree summary wording") {
    StatusSnapshot s;
    REQUIRE(worktree_summary(s) == "clean");
    s.dirty = true;
    s.staged = 1;
    s.untracked = 4;
    REQUIRE(worktree_summary(s) == "dirty, 1 staged, 4 untracked");
}

TEST_CASE("results carry task identity") {
    Task t;
    t.path = "/tmp/a";
    t.kind = OperationKind::Push;
    OperationResult ok = make_success(t, StatusSnapshot{}, "pushed");
    REQUIRE(ok.ok);
    REQUIRE(ok.path == t.path);
    REQUIRE(ok.kind == OperationKind::Push);
    REQUIRE(ok.message == "pushed");
    OperationResult bad = make_failure(t, FailureKind::TimedOut, "slow");
    REQUIRE_FALSE(bad.ok);
    REQUIRE(bad.failure == FailureKind::TimedOut);
    REQUIRE(std::string(failure_label(bad.failure)) == "TimedOut");
    REQUIRE(std::string(operation_label(bad.kind)) == "Push");
    REQUIRE(std::string(status_label(RS_CLEAN)) == "Clean");
}

TEST_CASE("repo table serialises begin per repository") {
    RepoTable table({"/r/a", "/r/b"});
    REQUIRE(table.size() == 2);
    REQUIRE(table.contains("/r/a"));
    REQUIRE_FALSE(table.contains("/r/c"));
    REQUIRE(table.try_begin("/r/a", OperationKind::Fetch));
    REQUIRE_FALSE(table.try_begin("/r/a", OperationKind::Pull));
    REQUIRE_FALSE(table.try_begin("/r/c", OperationKind::Pull));
    REQUIRE(table.busy_count() == 1);
    auto st = table.get("/r/a");
    REQUIRE(st);
    REQUIRE(st->status == RS_REFRESHING);
    REQUIRE(st->pending_operation == OperationKind::Fetch);
    REQUIRE(table.paths() == std::vector<RepoPath>{"/r/a", "/r/b"});
}
