#ifndef IGNORE_UTILS_HPP
#define IGNORE_UTILS_HPP
#include <filesystem>
#include <vector>

namespace ignore {

/**
 * Read a list of ignore patterns from a file.
 *
 * Each non-empty line is trimmed of surrounding whitespace and kept as one
 * pattern. Lines beginning with '#' are comments. A trailing carriage return
 * is stripped so files written on Windows work too.
 *
 * @param file  File to read.
 * @param ok    Set to `false` when the file cannot be opened.
 */
std::vector<std::filesystem::path> read_ignore_file(const std::filesystem::path& file, bool& ok);

/**
 * Check a directory against ignore patterns.
 *
 * Patterns without a '/' are compared with the directory name, patterns
 * with one with the full path. '*' and '?' are shell globs; anything else
 * must match exactly.
 */
bool matches(const std::filesystem::path& path,
             const std::vector<std::filesystem::path>& patterns);

} // namespace ignore

#endif // IGNORE_UTILS_HPP
