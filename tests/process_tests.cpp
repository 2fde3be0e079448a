#include "test_common.hpp"
#include "process_utils.hpp"

using procutil::ProcessSpec;
using procutil::run_process;

TEST_CASE("run_process captures output and exit status") {
    ProcessSpec spec;
    spec.argv = {"sh", "-c", "echo out; echo err >&2; exit 3"};
    auto res = run_process(spec);
    REQUIRE(res.started);
    REQUIRE(res.exit_code == 3);
    REQUIRE_FALSE(res.success());
    REQUIRE(res.out == "out\n");
    REQUIRE(res.err == "err\n");
    REQUIRE(procutil::live_children() == 0);
}

TEST_CASE("run_process applies working directory and environment") {
    fs::path dir = gitfleet::test_support::temp_dir("process_cwd");
    ProcessSpec spec;
    spec.argv = {"sh", "-c", "pwd; echo $GITFLEET_PROBE"};
    spec.cwd = dir;
    spec.env = {{"GITFLEET_PROBE", "42"}};
    auto res = run_process(spec);
    REQUIRE(res.success());
    REQUIRE(res.out.find(dir.filename().string()) != std::string::npos);
    REQUIRE(res.out.find("42") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("run_process kills a child past its deadline") {
    ProcessSpec spec;
    spec.argv = {"sh", "-c", "sleep 5"};
    spec.timeout = std::chrono::milliseconds(200);
    spec.kill_grace = std::chrono::milliseconds(200);
    auto start = std::chrono::steady_clock::now();
    auto res = run_process(spec);
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(res.started);
    REQUIRE(res.timed_out);
    REQUIRE_FALSE(res.success());
    REQUIRE(elapsed < std::chrono::seconds(3));
    REQUIRE(procutil::live_children() == 0);
}

TEST_CASE("run_process stops on cancellation") {
    std::atomic<bool> cancel{false};
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel = true;
    });
    ProcessSpec spec;
    spec.argv = {"sleep", "5"};
    spec.kill_grace = std::chrono::milliseconds(200);
    auto start = std::chrono::steady_clock::now();
    auto res = run_process(spec, &cancel);
    canceller.join();
    REQUIRE(res.cancelled);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));
    REQUIRE(procutil::live_children() == 0);
}

TEST_CASE("run_process reports programs that cannot start") {
    ProcessSpec spec;
    spec.argv = {"/nonexistent/gitfleet-no-such-program"};
    auto res = run_process(spec);
    REQUIRE_FALSE(res.started);
    REQUIRE_FALSE(res.error.empty());

    spec.argv = {"true"};
    spec.cwd = "/nonexistent/gitfleet-dir";
    res = run_process(spec);
    REQUIRE_FALSE(res.started);
    REQUIRE(procutil::live_children() == 0);

    spec.argv.clear();
    spec.cwd.clear();
    res = run_process(spec);
    REQUIRE_FALSE(res.started);
}
