#ifndef STATE_AGGREGATOR_HPP
#define STATE_AGGREGATOR_HPP

#include <chrono>
#include <deque>
#include <vector>

#include "repo_table.hpp"

/// Outcome of asking to start an operation on a repository.
enum class BeginResult { Started, AlreadyInProgress, Unknown };

/**
 * @brief One failure kept for the error log overlay.
 */
struct ErrorLogEntry {
    std::chrono::system_clock::time_point time;
    RepoPath path;
    OperationKind kind = OperationKind::Refresh;
    FailureKind failure = FailureKind::GitCommandFailed;
    std::string message;
};

/**
 * @brief Sole writer of the repository table.
 *
 * Marks repositories busy when work is submitted and folds completions back
 * into their records. Used from the control thread only.
 */
class StateAggregator {
  public:
    static constexpr size_t MAX_ERROR_LOG = 200;

    explicit StateAggregator(RepoTable& table) : table_(table) {}

    /**
     * @brief Atomically mark @a path busy with @a kind.
     *
     * @return Started when the repository was idle, AlreadyInProgress when an
     *         operation is in flight, Unknown for a path without a record.
     */
    BeginResult begin(const RepoPath& path, OperationKind kind);

    /**
     * @brief Fold a completion into the table.
     *
     * Success replaces the status fields with the fresh snapshot and marks
     * the repository Clean. Failure marks it Error and keeps the last known
     * data. In both cases the pending operation is cleared. Results for
     * unknown paths are logged and dropped.
     */
    void apply(const OperationResult& result);

    /** @return Failures, oldest first. */
    const std::deque<ErrorLogEntry>& error_log() const { return errors_; }

    size_t busy_count() const { return table_.busy_count(); }

    /** @return Number of results applied so far. */
    size_t applied() const { return applied_; }

    const RepoTable& table() const { return table_; }

  private:
    RepoTable& table_;
    std::deque<ErrorLogEntry> errors_;
    size_t applied_ = 0;
};

#endif // STATE_AGGREGATOR_HPP
