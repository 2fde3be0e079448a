#include "repo.hpp"
#include <utility>

OperationResult make_success(const Task& task, StatusSnapshot status, std::string message) {
    OperationResult r;
    r.path = task.path;
    r.kind = task.kind;
    r.ok = true;
    r.status = std::move(status);
    r.message = std::move(message);
    return r;
}

OperationResult make_failure(const Task& task, FailureKind kind, std::string message) {
    OperationResult r;
    r.path = task.path;
    r.kind = task.kind;
    r.ok = false;
    r.failure = kind;
    r.message = std::move(message);
    return r;
}

const char* operation_label(OperationKind kind) {
    switch (kind) {
    case OperationKind::Refresh:
        return "Refresh";
    case OperationKind::Fetch:
        return "Fetch";
    case OperationKind::Pull:
        return "Pull";
    case OperationKind::Push:
        return "Push";
    case OperationKind::Sync:
        return "Sync";
    case OperationKind::Prune:
        return "Prune";
    case OperationKind::Checkout:
        return "Checkout";
    }
    return "";
}

const char* failure_label(FailureKind kind) {
    switch (kind) {
    case FailureKind::RepoUnavailable:
        return "Unavailable";
    case FailureKind::GitCommandFailed:
        return "GitFailed";
    case FailureKind::TimedOut:
        return "TimedOut";
    case FailureKind::Cancelled:
        return "Cancelled";
    case FailureKind::ParseError:
        return "ParseError";
    }
    return "";
}

const char* status_label(RepoStatus status) {
    switch (status) {
    case RS_UNKNOWN:
        return "Unknown";
    case RS_REFRESHING:
        return "Busy";
    case RS_CLEAN:
        return "Clean";
    case RS_ERROR:
        return "Error";
    }
    return "";
}

std::string sync_summary(const StatusSnapshot& s) {
    if (!s.has_upstream)
        return "no remote";
    if (!s.ahead || !s.behind)
        return "?";
    unsigned a = *s.ahead;
    unsigned b = *s.behind;
    if (a > 0 && b > 0)
        return "+" + std::to_string(a) + "/-" + std::to_string(b);
    if (a > 0)
        return "+" + std::to_string(a) + " ahead";
    if (b > 0)
        return "-" + std::to_string(b) + " behind";
    return "synced";
}

std::string worktree_summary(const StatusSnapshot& s) {
    std::string out;
    auto add = [&](const std::string& part) {
        if (!out.empty())
            out += ", ";
        out += part;
    };
    if (s.dirty)
        add("dirty");
    if (s.staged > 0)
        add(std::to_string(s.staged) + " staged");
    if (s.untracked > 0)
        add(std::to_string(s.untracked) + " untracked");
    return out.empty() ? "clean" : out;
}
