/**
 * @file gitfleet.cpp
 * @brief CLI entry point of the repository fleet manager.
 *
 * Parses options, then either prints help or the version, lists the state of
 * every repository once, or runs the interactive session.
 */

#include <iostream>

#include "git_utils.hpp"
#include "help_text.hpp"
#include "options.hpp"
#include "ui_loop.hpp"
#include "version.hpp"

/**
 * @brief Application entry point.
 *
 * @return 0 on success or after help/version output, 2 when `--list` found
 *         failing repositories, 1 on invalid options or startup errors.
 */
int main(int argc, char* argv[]) {
    git::GitInitGuard git_guard;
    try {
        Options opts = parse_options(argc, argv);
        if (opts.show_help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.print_version) {
            std::cout << GITFLEET_VERSION << "\n";
            return 0;
        }
        return run_event_loop(opts);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
}
