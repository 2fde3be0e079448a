#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "repo.hpp"

/// Ordering applied to discovered repositories.
enum class SortMode { Name, Path, None };

/**
 * @brief Parse "name", "path" or "none".
 *
 * @return `false` for any other value.
 */
bool parse_sort_mode(const std::string& s, SortMode& mode);

/**
 * @brief Inputs of repository discovery.
 */
struct DiscoveryOptions {
    std::vector<std::filesystem::path> roots;  ///< Directories searched for repositories
    std::vector<std::filesystem::path> repos;  ///< Repositories listed explicitly
    bool recursive = false;                    ///< Descend below the first level
    size_t max_depth = 0;                      ///< 0 picks 5 when recursive, 1 otherwise
    std::vector<std::filesystem::path> ignore; ///< Patterns, see ignore::matches()
    std::set<std::filesystem::path> exclude;   ///< Normalised paths dropped from the result
    SortMode sort = SortMode::Name;
};

/**
 * @brief Make @a p absolute and lexically normal, without a trailing slash.
 */
RepoPath normalize_repo_path(const std::filesystem::path& p);

/**
 * @brief Find the repositories of a session.
 *
 * A root that is itself a working directory yields just that repository.
 * Otherwise its subdirectories are searched up to the maximum depth; a
 * directory containing `.git` is a repository and is not descended into.
 * Hidden and ignored directories are skipped, and symlinks are only followed
 * when they resolve inside the root. Explicit repositories are kept even if
 * they do not exist, so the session can report them as unavailable.
 *
 * @throws std::runtime_error when a root does not exist or cannot be read.
 * @return Absolute, deduplicated paths in the requested order.
 */
std::vector<RepoPath> build_repo_list(const DiscoveryOptions& opts);

#endif // SCANNER_HPP
