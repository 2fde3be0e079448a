#ifndef GIT_UTILS_HPP
#define GIT_UTILS_HPP

#include <git2.h>
#include <string>
#include <filesystem>
#include <optional>

#include "repo.hpp"

namespace git {
namespace fs = std::filesystem;

/**
 * @brief RAII helper managing global libgit2 initialization.
 *
 * Instantiate once for the lifetime of the application to ensure all libgit2
 * operations are performed after initialization and before shutdown.
 */
struct GitInitGuard {
    GitInitGuard();  ///< Calls `git_libgit2_init()`
    ~GitInitGuard(); ///< Calls `git_libgit2_shutdown()`
};

// RAII wrappers for libgit2 resources
template <typename T, void (*Free)(T*)> struct GitHandle {
    T* h;
    explicit GitHandle(T* h_ = nullptr) : h(h_) {}
    ~GitHandle() {
        if (h)
            Free(h);
    }
    GitHandle(const GitHandle&) = delete;
    GitHandle& operator=(const GitHandle&) = delete;
    T* get() const { return h; }
};

using repo_ptr = GitHandle<git_repository, git_repository_free>;
using remote_ptr = GitHandle<git_remote, git_remote_free>;
using commit_ptr = GitHandle<git_commit, git_commit_free>;

// The utility functions below assume libgit2 is already initialized.

/**
 * @brief Determine whether the given path looks like a working directory.
 *
 * @param p Filesystem path to check.
 * @return `true` if @a p contains a `.git` directory or a `.git` file
 *         (worktrees and submodules use the latter).
 */
bool is_git_repo(const fs::path& p);

/**
 * @brief Obtain the URL of the specified remote.
 *
 * @param repo   Path to a Git repository.
 * @param remote Remote name, usually `origin`.
 * @param error  Optional output string receiving a libgit2 error message.
 * @return Remote URL as a string or `std::nullopt` on failure.
 */
std::optional<std::string> get_remote_url(const fs::path& repo, const std::string& remote,
                                          std::string* error = nullptr);

/**
 * @brief Read metadata of the commit `HEAD` points to.
 *
 * @param repo  Path to a Git repository.
 * @param error Optional output string receiving a libgit2 error message.
 * @return Commit id, summary, author and time, or `std::nullopt` for an
 *         unborn branch or on error.
 */
std::optional<CommitInfo> get_head_commit(const fs::path& repo, std::string* error = nullptr);

} // namespace git

#endif // GIT_UTILS_HPP
