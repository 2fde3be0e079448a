#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

#include <string>

/**
 * @brief Build the command line help text.
 *
 * Options are grouped by category and aligned in two columns, followed by a
 * summary of the interactive keys.
 *
 * @param prog Program name shown in the usage lines.
 */
std::string help_text(const char* prog);

/** Print help_text() to stdout. */
void print_help(const char* prog);

#endif // HELP_TEXT_HPP
