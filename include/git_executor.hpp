#ifndef GIT_EXECUTOR_HPP
#define GIT_EXECUTOR_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "process_utils.hpp"
#include "repo.hpp"

/**
 * @brief Settings shared by every git invocation.
 */
struct ExecutorConfig {
    std::string git_binary = "git";                      ///< Program name or path
    std::string remote = "origin";                       ///< Remote whose URL is reported
    std::chrono::milliseconds refresh_timeout{30000};    ///< Deadline for status reads
    std::chrono::milliseconds operation_timeout{120000}; ///< Deadline for network operations
    std::chrono::milliseconds kill_grace{2000};          ///< SIGTERM to SIGKILL delay
    std::map<RepoPath, std::chrono::milliseconds> repo_timeouts; ///< Per-repository deadlines
    bool read_metadata = true; ///< Read remote URL and HEAD commit through libgit2
};

/**
 * @brief Runs git operations for one repository at a time.
 *
 * The executor knows nothing about other repositories and keeps no mutable
 * state, so one instance is shared by all workers.
 */
class GitExecutor {
  public:
    explicit GitExecutor(ExecutorConfig cfg = {});

    /**
     * @brief Execute @a task to completion, timeout or cancellation.
     *
     * Every spawned git process is reaped before this returns. Successful
     * operations finish with a status read so the result carries fresh
     * state.
     *
     * @param task   Repository, operation and optional argument.
     * @param cancel Checked while git runs; when set the child is killed and
     *               the result is a Cancelled failure.
     * @return Structured outcome; never throws for git or parse failures.
     */
    OperationResult execute(const Task& task, const std::atomic<bool>& cancel) const;

    /** @return Deadline applied to the whole of @a task. */
    std::chrono::milliseconds timeout_for(const Task& task) const;

    const ExecutorConfig& config() const { return cfg_; }

  private:
    using Clock = std::chrono::steady_clock;

    bool run_git(const Task& task, const std::vector<std::string>& args, Clock::time_point deadline,
                 const std::atomic<bool>& cancel, procutil::ProcessResult& proc,
                 OperationResult& failure) const;

    OperationResult read_status(const Task& task, Clock::time_point deadline,
                                const std::atomic<bool>& cancel, std::string message) const;

    ExecutorConfig cfg_;
};

#endif // GIT_EXECUTOR_HPP
