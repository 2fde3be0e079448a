#ifndef UI_LOOP_HPP
#define UI_LOOP_HPP

#include <iosfwd>
#include <vector>

#include "git_executor.hpp"
#include "options.hpp"
#include "repo.hpp"
#include "tui.hpp"

/** Start the file logger and syslog as configured. */
void setup_logging(const LoggingOptions& opts);

/** Executor settings derived from @a opts, including per-repository timeouts. */
ExecutorConfig executor_config(const Options& opts);

/** Presentation settings derived from @a opts. */
DisplayOptions display_options(const Options& opts);

/**
 * @brief Refresh @a repos once without the TUI and print one line each.
 *
 * Blocks until every refresh completed. SIGINT or SIGTERM stops the
 * running git processes and prints what is known so far.
 *
 * @return 0 when every repository is clean, 2 when any failed.
 */
int run_list_mode(const Options& opts, const std::vector<RepoPath>& repos, std::ostream& out);

/**
 * @brief Discover repositories and run the interactive session or list mode.
 *
 * @throws std::runtime_error when discovery fails.
 * @return Process exit code.
 */
int run_event_loop(const Options& opts);

#endif // UI_LOOP_HPP
