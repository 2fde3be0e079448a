#include "git_utils.hpp"

using namespace std;

namespace git {

/**
 * @brief Construct the RAII guard and initialize libgit2.
 */
GitInitGuard::GitInitGuard() { git_libgit2_init(); }

/**
 * @brief Destroy the RAII guard and shutdown libgit2.
 */
GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    fs::path dot_git = p / ".git";
    return fs::is_directory(dot_git, ec) || fs::is_regular_file(dot_git, ec);
}

/**
 * @brief Populate an error string with the last libgit2 error message.
 *
 * @param error Output string receiving the error description.
 */
static void set_error(std::string* error) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    if (e && e->message)
        *error = e->message;
    else
        *error = "Unknown libgit2 error";
}

optional<string> get_remote_url(const fs::path& repo, const string& remote, string* error) {
    git_repository* raw_repo = nullptr;
    if (git_repository_open(&raw_repo, repo.string().c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw_repo);
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);
    const char* url = git_remote_url(remote_handle.get());
    if (!url) {
        set_error(error);
        return nullopt;
    }
    return string(url);
}

optional<CommitInfo> get_head_commit(const fs::path& repo, string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    repo_ptr r(raw);
    git_oid oid;
    if (git_reference_name_to_id(&oid, r.get(), "HEAD") != 0) {
        set_error(error);
        return nullopt;
    }
    git_commit* raw_commit = nullptr;
    if (git_commit_lookup(&raw_commit, r.get(), &oid) != 0) {
        set_error(error);
        return nullopt;
    }
    commit_ptr commit(raw_commit);
    CommitInfo info;
    char buf[8];
    git_oid_tostr(buf, sizeof(buf), &oid);
    info.id = buf;
    const char* summary = git_commit_summary(commit.get());
    if (summary)
        info.summary = summary;
    const git_signature* sig = git_commit_author(commit.get());
    if (sig && sig->name)
        info.author = sig->name;
    info.time = static_cast<std::time_t>(git_commit_time(commit.get()));
    return info;
}

} // namespace git
