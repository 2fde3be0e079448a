#ifndef PROCESS_UTILS_HPP
#define PROCESS_UTILS_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <sys/types.h>

namespace procutil {

/**
 * @brief Description of an external command to run.
 */
struct ProcessSpec {
    std::vector<std::string> argv;                        ///< Program and arguments, argv[0] looked up in PATH
    std::filesystem::path cwd;                            ///< Working directory, empty for inherited
    std::map<std::string, std::string> env;               ///< Variables added to or overriding the environment
    std::chrono::milliseconds timeout{0};                 ///< Deadline, 0 for none
    std::chrono::milliseconds kill_grace{2000};           ///< Delay between SIGTERM and SIGKILL
};

/**
 * @brief Outcome of a finished (and reaped) child process.
 */
struct ProcessResult {
    bool started = false;   ///< The program was executed
    int exit_code = -1;     ///< Exit status when the child exited normally
    int term_signal = 0;    ///< Signal number when the child was killed
    bool timed_out = false; ///< Deadline expired and the child was terminated
    bool cancelled = false; ///< Cancellation was requested and the child was terminated
    std::string out;        ///< Captured stdout
    std::string err;        ///< Captured stderr
    std::string error;      ///< Reason the program could not be started

    bool success() const { return started && !timed_out && !cancelled && exit_code == 0; }
};

/**
 * @brief RAII owner of a spawned child process group.
 *
 * The child is placed in its own process group. Destroying a handle whose
 * child has not been reaped terminates the whole group and reaps the child,
 * so no code path can leave an orphaned process behind.
 */
class ChildProcess {
  public:
    ChildProcess() = default;
    explicit ChildProcess(pid_t pid);
    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0 && !reaped_; }

    /**
     * @brief Reap the child if it has exited.
     *
     * @return `true` once the child has been reaped.
     */
    bool try_wait();

    /** Block until the child exits and reap it. */
    void wait();

    /**
     * @brief Send SIGTERM to the group, then SIGKILL after @a grace.
     *
     * Always reaps the child before returning.
     */
    void terminate(std::chrono::milliseconds grace);

    /** @return Raw wait status, valid after reaping. */
    int status() const { return status_; }

  private:
    void mark_reaped(int status);

    pid_t pid_ = -1;
    bool reaped_ = false;
    int status_ = 0;
};

/**
 * @brief Run a command, capturing its output.
 *
 * Spawns the program described by @a spec with stdin redirected from
 * `/dev/null`, polls its stdout and stderr, and enforces the deadline. When
 * @a cancel becomes `true` or the deadline expires the child's process group
 * is terminated and reaped before the function returns.
 *
 * @param spec   Command, working directory, environment and timeout.
 * @param cancel Optional flag checked roughly every 50 ms.
 * @return Result describing how the child ended. The child is always reaped.
 */
ProcessResult run_process(const ProcessSpec& spec, const std::atomic<bool>* cancel = nullptr);

/**
 * @brief Number of spawned children that have not been reaped yet.
 */
int live_children();

} // namespace procutil

#endif // PROCESS_UTILS_HPP
