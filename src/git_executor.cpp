#include "git_executor.hpp"

#include <utility>

#include "git_commands.hpp"
#include "git_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace {

std::string first_line(const std::string& s) {
    std::string t = git::trim_copy(s);
    return t.substr(0, t.find('\n'));
}

std::string join_args(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty())
            out += ' ';
        out += a;
    }
    return out;
}

} // namespace

GitExecutor::GitExecutor(ExecutorConfig cfg) : cfg_(std::move(cfg)) {}

std::chrono::milliseconds GitExecutor::timeout_for(const Task& task) const {
    auto it = cfg_.repo_timeouts.find(task.path);
    if (it != cfg_.repo_timeouts.end())
        return it->second;
    return git::is_network_operation(task.kind) ? cfg_.operation_timeout : cfg_.refresh_timeout;
}

bool GitExecutor::run_git(const Task& task, const std::vector<std::string>& args,
                          Clock::time_point deadline, const std::atomic<bool>& cancel,
                          procutil::ProcessResult& proc, OperationResult& failure) const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (left.count() <= 0) {
        failure = make_failure(task, FailureKind::TimedOut,
                               "timed out after " + std::to_string(timeout_for(task).count()) +
                                   "ms");
        return false;
    }
    procutil::ProcessSpec spec;
    spec.argv.push_back(cfg_.git_binary);
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.cwd = task.path;
    spec.env = {{"GIT_TERMINAL_PROMPT", "0"}, {"LC_ALL", "C"}};
    spec.timeout = left;
    spec.kill_grace = cfg_.kill_grace;
    log_debug("Running git", LogFields{{"repo", task.path.string()}, {"args", join_args(args)}});
    proc = procutil::run_process(spec, &cancel);
    if (!proc.started) {
        failure = make_failure(task, FailureKind::RepoUnavailable, proc.error);
        return false;
    }
    if (proc.cancelled) {
        failure = make_failure(task, FailureKind::Cancelled, "cancelled");
        return false;
    }
    if (proc.timed_out) {
        failure = make_failure(task, FailureKind::TimedOut,
                               "timed out after " + std::to_string(timeout_for(task).count()) +
                                   "ms");
        return false;
    }
    if (proc.exit_code != 0) {
        std::string msg = git::trim_copy(proc.err);
        if (msg.empty())
            msg = git::trim_copy(proc.out);
        if (msg.empty())
            msg = "git exited with status " + std::to_string(proc.exit_code);
        failure = make_failure(task, FailureKind::GitCommandFailed, msg);
        return false;
    }
    return true;
}

OperationResult GitExecutor::read_status(const Task& task, Clock::time_point deadline,
                                         const std::atomic<bool>& cancel, std::string message) const {
    procutil::ProcessResult proc;
    OperationResult failure;
    if (!run_git(task, git::status_args(), deadline, cancel, proc, failure))
        return failure;
    git::PorcelainStatus ps;
    std::string err;
    if (!git::parse_porcelain_status(proc.out, ps, err))
        return make_failure(task, FailureKind::ParseError, err);

    StatusSnapshot snap;
    snap.branch = ps.branch;
    snap.dirty = ps.dirty;
    snap.staged = ps.staged;
    snap.untracked = ps.untracked;
    snap.has_upstream = ps.upstream.has_value() && !ps.upstream_gone;
    if (snap.has_upstream && !ps.unborn) {
        if (!run_git(task, git::ahead_behind_args(), deadline, cancel, proc, failure))
            return failure;
        unsigned ahead = 0;
        unsigned behind = 0;
        if (!git::parse_ahead_behind(proc.out, ahead, behind, err))
            return make_failure(task, FailureKind::ParseError, err);
        snap.ahead = ahead;
        snap.behind = behind;
    }
    if (cfg_.read_metadata) {
        // Metadata is informational; failures leave the fields empty.
        snap.remote_url = git::get_remote_url(task.path, cfg_.remote);
        if (!ps.unborn)
            snap.last_commit = git::get_head_commit(task.path);
    }
    return make_success(task, std::move(snap), std::move(message));
}

OperationResult GitExecutor::execute(const Task& task, const std::atomic<bool>& cancel) const {
    std::error_code ec;
    if (!fs::is_directory(task.path, ec))
        return make_failure(task, FailureKind::RepoUnavailable, "path does not exist");
    if (!git::is_git_repo(task.path))
        return make_failure(task, FailureKind::RepoUnavailable, "not a git repository");
    if (task.kind == OperationKind::Checkout && !git::is_valid_branch_name(task.argument))
        return make_failure(task, FailureKind::GitCommandFailed,
                            "invalid branch name '" + task.argument + "'");
    if (cancel.load())
        return make_failure(task, FailureKind::Cancelled, "cancelled");

    const auto deadline = Clock::now() + timeout_for(task);
    std::string message;
    for (const auto& args : git::operation_commands(task.kind, task.argument)) {
        procutil::ProcessResult proc;
        OperationResult failure;
        if (!run_git(task, args, deadline, cancel, proc, failure)) {
            log_warning("git " + args.front() + " failed",
                        LogFields{{"repo", task.path.string()},
                         {"op", operation_label(task.kind)},
                         {"kind", failure_label(failure.failure)},
                         {"error", first_line(failure.message)}});
            return failure;
        }
        if (task.kind == OperationKind::Pull) {
            message = first_line(proc.out);
        } else if (task.kind == OperationKind::Checkout) {
            message = first_line(proc.err.empty() ? proc.out : proc.err);
        }
    }
    if (message.empty() && task.kind != OperationKind::Refresh)
        message = std::string(operation_label(task.kind)) + " ok";
    OperationResult res = read_status(task, deadline, cancel, std::move(message));
    if (!res.ok) {
        log_warning("Status read failed", LogFields{{"repo", task.path.string()},
                                                   {"op", operation_label(task.kind)},
                                                   {"kind", failure_label(res.failure)},
                                                   {"error", first_line(res.message)}});
    }
    return res;
}
