#ifndef GIT_COMMANDS_HPP
#define GIT_COMMANDS_HPP

#include <optional>
#include <string>
#include <vector>

#include "repo.hpp"

namespace git {

/// Marker shown as the branch of a detached HEAD.
constexpr const char* DETACHED_HEAD = "HEAD (detached)";

/**
 * @brief Parsed form of `git status --porcelain=v1 --branch`.
 */
struct PorcelainStatus {
    std::optional<std::string> branch;   ///< Local branch, or DETACHED_HEAD
    std::optional<std::string> upstream; ///< Tracking ref such as origin/main
    bool upstream_gone = false;          ///< Upstream configured but missing
    bool unborn = false;                 ///< Branch has no commits yet
    bool dirty = false;
    unsigned staged = 0;
    unsigned untracked = 0;
};

/** @return Arguments of the status read. */
std::vector<std::string> status_args();

/** @return Arguments counting commits on each side of HEAD...@{upstream}. */
std::vector<std::string> ahead_behind_args();

/**
 * @brief Argument lists run for a mutating operation, in order.
 *
 * Refresh has no mutating step and yields an empty list. Sync yields fetch,
 * pull and push.
 *
 * @param kind     Operation to perform.
 * @param argument Target branch for checkout, ignored otherwise.
 */
std::vector<std::vector<std::string>> operation_commands(OperationKind kind,
                                                         const std::string& argument);

/**
 * @brief Check that @a name can safely be passed to `git checkout`.
 *
 * Rejects empty names, names starting with `-` and names containing
 * whitespace, control characters or `..`.
 */
bool is_valid_branch_name(const std::string& name);

/** @return Whether @a kind contacts a remote. */
bool is_network_operation(OperationKind kind);

/**
 * @brief Parse porcelain v1 status output with a branch header.
 *
 * @param out   Raw stdout of the status read.
 * @param st    Receives the parsed status.
 * @param error Receives a description of the first malformed line.
 * @return `false` on malformed output.
 */
bool parse_porcelain_status(const std::string& out, PorcelainStatus& st, std::string& error);

/**
 * @brief Parse `rev-list --left-right --count` output ("<ahead>\t<behind>").
 *
 * @return `false` on malformed output, with @a error describing it.
 */
bool parse_ahead_behind(const std::string& out, unsigned& ahead, unsigned& behind,
                        std::string& error);

/** @return @a s without leading and trailing whitespace. */
std::string trim_copy(const std::string& s);

} // namespace git

#endif // GIT_COMMANDS_HPP
