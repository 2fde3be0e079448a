#ifndef REPO_HPP
#define REPO_HPP
#include <chrono>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

/// Absolute path of a working directory; identity key of a repository.
using RepoPath = std::filesystem::path;

/**
 * @brief High level status for a repository in the fleet.
 */
enum RepoStatus {
    RS_UNKNOWN,    ///< Repository has not been refreshed yet
    RS_REFRESHING, ///< An operation is in flight
    RS_CLEAN,      ///< Last operation succeeded
    RS_ERROR       ///< Last operation failed, see RepositoryState::error
};

/**
 * @brief Git operations that can be scheduled against a repository.
 */
enum class OperationKind { Refresh, Fetch, Pull, Push, Sync, Prune, Checkout };

/**
 * @brief Per-repository failure taxonomy.
 */
enum class FailureKind {
    RepoUnavailable,  ///< Path missing, not a repository, or git could not start
    GitCommandFailed, ///< git exited with a non-zero status
    TimedOut,         ///< Operation exceeded its deadline and was killed
    Cancelled,        ///< Operation was cancelled before it finished
    ParseError        ///< git produced output of an unexpected shape
};

/// Metadata of the commit HEAD points to.
struct CommitInfo {
    std::string id; ///< Abbreviated hash
    std::string summary;
    std::string author;
    std::time_t time = 0;
};

/// Failure recorded on a repository record.
struct RepoError {
    FailureKind kind = FailureKind::GitCommandFailed;
    std::string message;
};

/**
 * @brief Parsed repository status as produced by the executor.
 */
struct StatusSnapshot {
    std::optional<std::string> branch;     ///< Branch name or detached marker
    bool dirty = false;                    ///< Work tree has unstaged changes
    unsigned staged = 0;                   ///< Entries with staged changes
    unsigned untracked = 0;                ///< Untracked files
    bool has_upstream = false;             ///< Current branch tracks an upstream
    std::optional<unsigned> ahead;         ///< Commits ahead of upstream
    std::optional<unsigned> behind;        ///< Commits behind upstream
    std::optional<std::string> remote_url; ///< URL of origin
    std::optional<CommitInfo> last_commit; ///< HEAD commit metadata
};

/**
 * @brief Record kept per repository for the whole session.
 *
 * Records are replaced as a whole by the state table; there is no
 * field-level mutation from outside the table.
 */
struct RepositoryState {
    RepoPath path;                                                 ///< Identity
    RepoStatus status = RS_UNKNOWN;                                ///< Current status code
    StatusSnapshot info;                                           ///< Last known parsed state
    std::optional<std::chrono::system_clock::time_point> last_sync; ///< Last successful refresh
    std::optional<RepoError> error;                                ///< Set when status is RS_ERROR
    std::optional<OperationKind> pending_operation; ///< In-flight operation, if any
    std::optional<OperationKind> last_operation;    ///< Last completed operation
    std::string message;                            ///< Short note from the last success

    bool busy() const { return pending_operation.has_value(); }
};

/**
 * @brief One scheduled execution of a git operation against one repository.
 */
struct Task {
    RepoPath path;
    OperationKind kind = OperationKind::Refresh;
    std::string argument; ///< Target branch for checkout, empty otherwise
    std::chrono::steady_clock::time_point submitted_at = std::chrono::steady_clock::now();
};

/**
 * @brief Outcome of a task, consumed once by the state aggregator.
 */
struct OperationResult {
    RepoPath path;
    OperationKind kind = OperationKind::Refresh;
    bool ok = false;
    StatusSnapshot status;                           ///< Valid when ok
    FailureKind failure = FailureKind::GitCommandFailed; ///< Valid when !ok
    std::string message;                             ///< Note on success, reason on failure
};

OperationResult make_success(const Task& task, StatusSnapshot status, std::string message = {});
OperationResult make_failure(const Task& task, FailureKind kind, std::string message);

/** @return Short display label such as "Fetch". */
const char* operation_label(OperationKind kind);

/** @return Short display label such as "TimedOut". */
const char* failure_label(FailureKind kind);

/** @return Short display label such as "Clean". */
const char* status_label(RepoStatus status);

/**
 * @brief Describe divergence from upstream.
 *
 * @return "no remote", "+a/-b", "+N ahead", "-N behind", "synced" or "?"
 *         when counters are unknown.
 */
std::string sync_summary(const StatusSnapshot& s);

/**
 * @brief Describe work tree state.
 *
 * @return Comma separated list of "dirty", "N staged", "N untracked", or
 *         "clean".
 */
std::string worktree_summary(const StatusSnapshot& s);

#endif // REPO_HPP
