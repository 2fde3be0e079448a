#ifndef COMMAND_DISPATCHER_HPP
#define COMMAND_DISPATCHER_HPP

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "state_aggregator.hpp"

/**
 * @brief Discrete user commands understood by the dispatcher.
 */
enum class CommandKind {
    RefreshOne,
    RefreshAll,
    FetchSelected,
    PullSelected,
    PushSelected,
    Quit,
    NavigateUp,
    NavigateDown,
    ToggleSelect,
    FilterByText,
    FetchAll,
    SyncSelected,
    PruneSelected,
    CheckoutSelected,
    SelectAll,
    ClearSelection,
    NavigateTop,
    NavigateBottom,
    CancelAll,
    CycleSort,
    ToggleSortDirection,
    ToggleHidden,
    ShowHidden
};

/// Column the repository view is ordered by.
enum class SortColumn { Discovery, Name, Status, Sync };

/** @return Lower-case name of @a col as shown in the header. */
const char* sort_column_label(SortColumn col);

struct Command {
    CommandKind kind = CommandKind::RefreshOne;
    std::string text; ///< Filter text or checkout branch
};

/**
 * @brief What a command did.
 */
struct DispatchOutcome {
    std::vector<RepoPath> submitted; ///< Repositories a task was queued for
    std::vector<RepoPath> rejected;  ///< Repositories already busy
    std::string notice;              ///< Message for the status line, may be empty
    bool notice_is_error = false;
    bool quit = false;   ///< Quit was requested
    size_t cancelled = 0; ///< Tasks stopped by CancelAll
};

/**
 * @brief Translates commands and the current selection into tasks.
 *
 * Owns the view state: order, filter text, cursor, marked and hidden
 * repositories. The order is recomputed only by the sort commands, so rows
 * do not move under the cursor while results arrive. Hidden repositories
 * leave the view and the selection but stay part of the "All" commands. Task
 * submission goes through StateAggregator::begin() first, so a repository
 * that is already busy is reported back instead of being queued twice.
 */
class CommandDispatcher {
  public:
    using SubmitFn = std::function<void(Task)>;
    using CancelFn = std::function<size_t()>;

    CommandDispatcher(StateAggregator& agg, SubmitFn submit, CancelFn cancel_all);

    DispatchOutcome dispatch(const Command& cmd);

    /** @return Paths matching the filter and not hidden, in view order. */
    std::vector<RepoPath> visible() const;

    /** @return Repositories a Selected command would target right now. */
    std::vector<RepoPath> selection() const;

    /** @return Repository under the cursor, if the view is not empty. */
    std::optional<RepoPath> current() const;

    size_t cursor() const { return cursor_; }
    const std::set<RepoPath>& marked() const { return marked_; }
    const std::string& filter() const { return filter_; }
    SortColumn sort_column() const { return sort_; }
    bool sort_ascending() const { return ascending_; }
    const std::set<RepoPath>& hidden() const { return hidden_; }
    bool showing_hidden() const { return show_hidden_; }

  private:
    DispatchOutcome submit_all(const std::vector<RepoPath>& targets, OperationKind kind,
                               const std::string& argument = {});
    void clamp_cursor();
    void keep_cursor_on(const std::optional<RepoPath>& path);
    void sort_view();
    std::string sort_notice() const;

    StateAggregator& agg_;
    SubmitFn submit_;
    CancelFn cancel_all_;
    std::string filter_;
    size_t cursor_ = 0;
    std::set<RepoPath> marked_;
    std::vector<RepoPath> order_;
    SortColumn sort_ = SortColumn::Discovery;
    bool ascending_ = true;
    std::set<RepoPath> hidden_;
    bool show_hidden_ = false;
};

/**
 * @brief Case-insensitive substring match of @a filter against @a path.
 *
 * An empty filter matches everything.
 */
bool matches_filter(const RepoPath& path, const std::string& filter);

#endif // COMMAND_DISPATCHER_HPP
