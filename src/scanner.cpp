#include "scanner.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>
#include <system_error>

#include "git_utils.hpp"
#include "ignore_utils.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

namespace {

constexpr size_t DEFAULT_RECURSIVE_DEPTH = 5;

bool is_hidden(const fs::path& p) {
    std::string name = p.filename().string();
    return !name.empty() && name[0] == '.';
}

bool within_root(const fs::path& root, const fs::path& p) {
    auto norm = p.lexically_normal();
    auto root_it = root.begin();
    auto p_it = norm.begin();
    for (; root_it != root.end() && p_it != norm.end(); ++root_it, ++p_it) {
        if (*root_it != *p_it)
            return false;
    }
    return root_it == root.end();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void walk(const fs::path& root, const fs::path& dir, size_t depth, size_t max_depth,
          const std::vector<fs::path>& ignore, std::vector<RepoPath>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        log_debug("Skipping unreadable directory",
                  LogFields{{"dir", dir.string()}, {"error", ec.message()}});
        return;
    }
    std::vector<fs::path> children;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            ec.clear();
            break;
        }
        fs::path p = it->path();
        if (is_hidden(p) || !it->is_directory(ec))
            continue;
        if (it->is_symlink(ec)) {
            fs::path resolved = fs::weakly_canonical(p, ec);
            if (ec || !within_root(root, resolved))
                continue;
        }
        children.push_back(p);
    }
    std::sort(children.begin(), children.end());
    for (const auto& p : children) {
        if (ignore::matches(p, ignore))
            continue;
        if (git::is_git_repo(p)) {
            out.push_back(normalize_repo_path(p));
            continue;
        }
        if (depth < max_depth)
            walk(root, p, depth + 1, max_depth, ignore, out);
    }
}

} // namespace

bool parse_sort_mode(const std::string& s, SortMode& mode) {
    if (s == "name")
        mode = SortMode::Name;
    else if (s == "path")
        mode = SortMode::Path;
    else if (s == "none")
        mode = SortMode::None;
    else
        return false;
    return true;
}

RepoPath normalize_repo_path(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec)
        abs = p;
    abs = abs.lexically_normal();
    if (abs.filename().empty() && abs.has_parent_path() && abs != abs.root_path())
        abs = abs.parent_path();
    return abs;
}

std::vector<RepoPath> build_repo_list(const DiscoveryOptions& opts) {
    const size_t max_depth =
        opts.max_depth > 0 ? opts.max_depth : (opts.recursive ? DEFAULT_RECURSIVE_DEPTH : 1);
    std::vector<RepoPath> found;
    for (const auto& r : opts.roots) {
        if (r.empty())
            continue;
        fs::path root = normalize_repo_path(r);
        std::error_code ec;
        if (!fs::is_directory(root, ec))
            throw std::runtime_error("Root directory not found: " + r.string());
        if (git::is_git_repo(root)) {
            found.push_back(root);
            continue;
        }
        fs::directory_iterator listing(root, ec);
        if (ec)
            throw std::runtime_error("Cannot read root directory " + r.string() + ": " +
                                     ec.message());
        fs::path canonical_root = fs::weakly_canonical(root, ec);
        if (ec)
            canonical_root = root;
        walk(canonical_root, root, 1, max_depth, opts.ignore, found);
    }
    for (const auto& p : opts.repos)
        found.push_back(normalize_repo_path(p));

    std::vector<RepoPath> result;
    std::set<RepoPath> seen;
    for (auto& p : found) {
        if (opts.exclude.count(p) || !seen.insert(p).second)
            continue;
        result.push_back(std::move(p));
    }
    switch (opts.sort) {
    case SortMode::Name:
        std::stable_sort(result.begin(), result.end(), [](const RepoPath& a, const RepoPath& b) {
            std::string na = lower(a.filename().string());
            std::string nb = lower(b.filename().string());
            if (na != nb)
                return na < nb;
            return a < b;
        });
        break;
    case SortMode::Path:
        std::sort(result.begin(), result.end());
        break;
    case SortMode::None:
        break;
    }
    log_info("Discovered repositories", LogFields{{"count", std::to_string(result.size())}});
    return result;
}
