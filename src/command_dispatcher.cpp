#include "command_dispatcher.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>
#include <utility>

#include "git_commands.hpp"
#include "logger.hpp"

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string repo_count(size_t n) {
    return std::to_string(n) + (n == 1 ? " repository" : " repositories");
}

// Problems first: errors, then running, then clean, then never refreshed.
int status_rank(const RepositoryState& st) {
    switch (st.status) {
    case RS_ERROR:
        return 0;
    case RS_REFRESHING:
        return 1;
    case RS_CLEAN:
        return 2;
    case RS_UNKNOWN:
        return 3;
    }
    return 3;
}

// Local changes, diverged, ahead, behind, synced, no upstream.
int sync_rank(const RepositoryState& st) {
    const StatusSnapshot& s = st.info;
    if (s.dirty || s.staged > 0 || s.untracked > 0)
        return 0;
    if (!s.has_upstream)
        return 5;
    const unsigned ahead = s.ahead.value_or(0);
    const unsigned behind = s.behind.value_or(0);
    if (ahead > 0 && behind > 0)
        return 1;
    if (ahead > 0)
        return 2;
    if (behind > 0)
        return 3;
    return 4;
}

int compare_by(SortColumn col, const RepositoryState& a, const RepositoryState& b) {
    switch (col) {
    case SortColumn::Discovery:
        return 0;
    case SortColumn::Name: {
        int c = lower(a.path.filename().string()).compare(lower(b.path.filename().string()));
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    case SortColumn::Status:
        return status_rank(a) - status_rank(b);
    case SortColumn::Sync:
        return sync_rank(a) - sync_rank(b);
    }
    return 0;
}

} // namespace

const char* sort_column_label(SortColumn col) {
    switch (col) {
    case SortColumn::Discovery:
        return "discovery";
    case SortColumn::Name:
        return "name";
    case SortColumn::Status:
        return "status";
    case SortColumn::Sync:
        return "sync";
    }
    return "discovery";
}

bool matches_filter(const RepoPath& path, const std::string& filter) {
    if (filter.empty())
        return true;
    return lower(path.string()).find(lower(filter)) != std::string::npos;
}

CommandDispatcher::CommandDispatcher(StateAggregator& agg, SubmitFn submit, CancelFn cancel_all)
    : agg_(agg), submit_(std::move(submit)), cancel_all_(std::move(cancel_all)),
      order_(agg.table().paths()) {}

std::vector<RepoPath> CommandDispatcher::visible() const {
    std::vector<RepoPath> out;
    for (const auto& p : order_) {
        if (!show_hidden_ && hidden_.count(p))
            continue;
        if (matches_filter(p, filter_))
            out.push_back(p);
    }
    return out;
}

std::optional<RepoPath> CommandDispatcher::current() const {
    auto view = visible();
    if (view.empty())
        return std::nullopt;
    return view[std::min(cursor_, view.size() - 1)];
}

std::vector<RepoPath> CommandDispatcher::selection() const {
    auto view = visible();
    std::vector<RepoPath> out;
    for (const auto& p : view) {
        if (marked_.count(p))
            out.push_back(p);
    }
    if (out.empty() && !view.empty())
        out.push_back(view[std::min(cursor_, view.size() - 1)]);
    return out;
}

void CommandDispatcher::clamp_cursor() {
    size_t n = visible().size();
    if (n == 0)
        cursor_ = 0;
    else if (cursor_ >= n)
        cursor_ = n - 1;
}

void CommandDispatcher::keep_cursor_on(const std::optional<RepoPath>& path) {
    cursor_ = 0;
    if (!path)
        return;
    auto view = visible();
    auto it = std::find(view.begin(), view.end(), *path);
    if (it != view.end())
        cursor_ = static_cast<size_t>(it - view.begin());
}

// Stable sort of a table snapshot; ties keep discovery order in both directions.
void CommandDispatcher::sort_view() {
    auto cur = current();
    auto records = agg_.table().snapshot();
    std::vector<size_t> idx(records.size());
    std::iota(idx.begin(), idx.end(), 0);
    std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b) {
        int c = sort_ == SortColumn::Discovery ? (a < b ? -1 : (a > b ? 1 : 0))
                                               : compare_by(sort_, records[a], records[b]);
        if (c == 0)
            return false;
        return ascending_ ? c < 0 : c > 0;
    });
    order_.clear();
    for (size_t i : idx)
        order_.push_back(records[i].path);
    keep_cursor_on(cur);
}

std::string CommandDispatcher::sort_notice() const {
    return std::string("Sort: ") + sort_column_label(sort_) +
           (ascending_ ? " ascending" : " descending");
}

DispatchOutcome CommandDispatcher::submit_all(const std::vector<RepoPath>& targets,
                                              OperationKind kind, const std::string& argument) {
    DispatchOutcome out;
    if (targets.empty()) {
        out.notice = "No repository selected";
        out.notice_is_error = true;
        return out;
    }
    for (const auto& p : targets) {
        switch (agg_.begin(p, kind)) {
        case BeginResult::Started: {
            Task t;
            t.path = p;
            t.kind = kind;
            t.argument = argument;
            log_debug("Dispatching task",
                      LogFields{{"repo", p.string()}, {"op", operation_label(kind)}});
            submit_(std::move(t));
            out.submitted.push_back(p);
            break;
        }
        case BeginResult::AlreadyInProgress:
            out.rejected.push_back(p);
            break;
        case BeginResult::Unknown:
            log_warning("Ignoring unknown repository", LogFields{{"repo", p.string()}});
            break;
        }
    }
    std::string label = operation_label(kind);
    if (out.rejected.empty()) {
        out.notice = label + ": " + repo_count(out.submitted.size()) + " queued";
    } else if (out.submitted.empty()) {
        out.notice = label + ": already in progress for " +
                     (out.rejected.size() == 1 ? out.rejected.front().filename().string()
                                               : repo_count(out.rejected.size()));
        out.notice_is_error = true;
    } else {
        out.notice = label + ": " + std::to_string(out.submitted.size()) + " queued, " +
                     std::to_string(out.rejected.size()) + " already in progress";
    }
    return out;
}

DispatchOutcome CommandDispatcher::dispatch(const Command& cmd) {
    DispatchOutcome out;
    switch (cmd.kind) {
    case CommandKind::RefreshOne: {
        auto cur = current();
        return submit_all(cur ? std::vector<RepoPath>{*cur} : std::vector<RepoPath>{},
                          OperationKind::Refresh);
    }
    case CommandKind::RefreshAll:
        return submit_all(agg_.table().paths(), OperationKind::Refresh);
    case CommandKind::FetchAll:
        return submit_all(agg_.table().paths(), OperationKind::Fetch);
    case CommandKind::FetchSelected:
        return submit_all(selection(), OperationKind::Fetch);
    case CommandKind::PullSelected:
        return submit_all(selection(), OperationKind::Pull);
    case CommandKind::PushSelected:
        return submit_all(selection(), OperationKind::Push);
    case CommandKind::SyncSelected:
        return submit_all(selection(), OperationKind::Sync);
    case CommandKind::PruneSelected:
        return submit_all(selection(), OperationKind::Prune);
    case CommandKind::CheckoutSelected:
        if (!git::is_valid_branch_name(cmd.text)) {
            out.notice = cmd.text.empty() ? "Branch name required"
                                          : "Invalid branch name '" + cmd.text + "'";
            out.notice_is_error = true;
            return out;
        }
        return submit_all(selection(), OperationKind::Checkout, cmd.text);
    case CommandKind::Quit:
        out.quit = true;
        return out;
    case CommandKind::NavigateUp:
        if (cursor_ > 0)
            --cursor_;
        break;
    case CommandKind::NavigateDown:
        ++cursor_;
        break;
    case CommandKind::NavigateTop:
        cursor_ = 0;
        break;
    case CommandKind::NavigateBottom: {
        size_t n = visible().size();
        cursor_ = n == 0 ? 0 : n - 1;
        break;
    }
    case CommandKind::ToggleSelect: {
        auto cur = current();
        if (cur && !marked_.erase(*cur))
            marked_.insert(*cur);
        break;
    }
    case CommandKind::SelectAll:
        for (const auto& p : visible())
            marked_.insert(p);
        out.notice = std::to_string(marked_.size()) + " marked";
        break;
    case CommandKind::ClearSelection:
        marked_.clear();
        break;
    case CommandKind::FilterByText: {
        auto cur = current();
        filter_ = cmd.text;
        keep_cursor_on(cur);
        if (!filter_.empty())
            out.notice = "Filter: " + filter_ + " (" + std::to_string(visible().size()) + " shown)";
        break;
    }
    case CommandKind::CancelAll:
        out.cancelled = cancel_all_ ? cancel_all_() : 0;
        out.notice = "Stopped " + std::to_string(out.cancelled) +
                     (out.cancelled == 1 ? " task" : " tasks");
        log_info("Cancel all requested", LogFields{{"tasks", std::to_string(out.cancelled)}});
        break;
    case CommandKind::CycleSort:
        sort_ = static_cast<SortColumn>((static_cast<int>(sort_) + 1) %
                                        (static_cast<int>(SortColumn::Sync) + 1));
        sort_view();
        out.notice = sort_notice();
        break;
    case CommandKind::ToggleSortDirection:
        ascending_ = !ascending_;
        sort_view();
        out.notice = sort_notice();
        break;
    case CommandKind::ToggleHidden: {
        auto cur = current();
        if (!cur) {
            out.notice = "No repository selected";
            out.notice_is_error = true;
            return out;
        }
        const std::string name = cur->filename().string();
        if (hidden_.erase(*cur)) {
            out.notice = "Unhid " + name;
        } else {
            hidden_.insert(*cur);
            marked_.erase(*cur);
            out.notice = "Hid " + name + " (" + std::to_string(hidden_.size()) + " hidden)";
        }
        log_debug("Toggled hidden", LogFields{{"repo", cur->string()},
                                              {"hidden", hidden_.count(*cur) ? "yes" : "no"}});
        break;
    }
    case CommandKind::ShowHidden: {
        if (hidden_.empty() && !show_hidden_) {
            out.notice = "No hidden repositories";
            break;
        }
        auto cur = current();
        show_hidden_ = !show_hidden_;
        keep_cursor_on(cur);
        out.notice = std::string(show_hidden_ ? "Showing " : "Concealing ") +
                     std::to_string(hidden_.size()) + " hidden";
        break;
    }
    }
    clamp_cursor();
    return out;
}
