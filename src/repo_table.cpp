#include "repo_table.hpp"

RepoTable::RepoTable(const std::vector<RepoPath>& paths) {
    for (const auto& p : paths) {
        if (records_.count(p))
            continue;
        RepositoryState st;
        st.path = p;
        records_.emplace(p, std::move(st));
        order_.push_back(p);
    }
}

size_t RepoTable::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return order_.size();
}

bool RepoTable::contains(const RepoPath& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return records_.count(path) > 0;
}

std::vector<RepoPath> RepoTable::paths() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return order_;
}

std::optional<RepositoryState> RepoTable::get(const RepoPath& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(path);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

std::vector<RepositoryState> RepoTable::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<RepositoryState> out;
    out.reserve(order_.size());
    for (const auto& p : order_)
        out.push_back(records_.at(p));
    return out;
}

bool RepoTable::update(const RepoPath& path, const std::function<void(RepositoryState&)>& fn) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(path);
    if (it == records_.end())
        return false;
    RepositoryState copy = it->second;
    fn(copy);
    copy.path = path; // identity never changes
    it->second = std::move(copy);
    return true;
}

bool RepoTable::try_begin(const RepoPath& path, OperationKind kind) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = records_.find(path);
    if (it == records_.end() || it->second.busy())
        return false;
    RepositoryState copy = it->second;
    copy.pending_operation = kind;
    copy.status = RS_REFRESHING;
    it->second = std::move(copy);
    return true;
}

size_t RepoTable::busy_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    size_t n = 0;
    for (const auto& [p, st] : records_) {
        if (st.busy())
            ++n;
    }
    return n;
}
