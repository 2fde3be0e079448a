#include "event_loop.hpp"

#include <algorithm>
#include <map>
#include <utility>

#include "logger.hpp"

namespace {

const char* const CONFIRM_QUIT_MSG = "Press q again to quit";
constexpr size_t PAGE_STEP = 10;

} // namespace

EventLoop::EventLoop(StateAggregator& agg, CommandDispatcher& disp, EventQueue& events,
                     Renderer render, LoopConfig cfg, QueuedFn queued)
    : agg_(agg), disp_(disp), events_(events), render_(std::move(render)), cfg_(cfg),
      queued_(std::move(queued)) {}

int EventLoop::run() {
    start();
    while (run_once(cfg_.tick)) {
    }
    return 0;
}

void EventLoop::start() {
    auto now = Clock::now();
    next_tick_ = now + cfg_.tick;
    next_auto_refresh_ = now + cfg_.auto_refresh;
    if (cfg_.initial_refresh && agg_.table().size() > 0)
        dispatch(CommandKind::RefreshAll);
    render();
}

bool EventLoop::run_once(std::chrono::milliseconds max_wait) {
    if (finished_)
        return false;
    auto now = Clock::now();
    auto until_tick = std::chrono::duration_cast<std::chrono::milliseconds>(next_tick_ - now);
    auto wait = std::max(std::chrono::milliseconds(0), std::min(max_wait, until_tick));
    bool changed = false;
    if (auto ev = events_.wait_for(wait)) {
        changed |= handle_event(*ev);
        // Fold everything already queued into the same frame.
        while (!quit_) {
            auto more = events_.try_pop();
            if (!more)
                break;
            changed |= handle_event(*more);
        }
    }
    now = Clock::now();
    if (!quit_ && now >= next_tick_) {
        changed |= on_tick(now);
        next_tick_ = now + cfg_.tick;
    }
    if (quit_) {
        finish();
        return false;
    }
    if (changed)
        render();
    return true;
}

bool EventLoop::handle_event(const LoopEvent& ev) {
    switch (ev.type) {
    case LoopEvent::KEY:
        return handle_key(ev.key);
    case LoopEvent::COMPLETION:
        agg_.apply(ev.result);
        return true;
    case LoopEvent::RESIZE:
        return true;
    case LoopEvent::QUIT:
        log_info("Quit requested by signal");
        request_quit(true);
        return true;
    }
    return false;
}

bool EventLoop::handle_key(const KeyEvent& key) {
    switch (mode_) {
    case UiMode::Normal:
        return handle_normal_key(key);
    case UiMode::Filter:
    case UiMode::Checkout:
        return handle_input_key(key);
    case UiMode::Help:
    case UiMode::ErrorLog:
    case UiMode::Details:
        break;
    }
    if (key.key == Key::Escape || key.key == Key::Enter ||
        (key.key == Key::Char && (key.ch == 'q' || key.ch == '?' || key.ch == 'E'))) {
        mode_ = UiMode::Normal;
        return true;
    }
    return handle_overlay_key(key);
}

bool EventLoop::handle_overlay_key(const KeyEvent& key) {
    if (mode_ == UiMode::Details && (key.key == Key::Up || key.key == Key::Down)) {
        dispatch(key.key == Key::Up ? CommandKind::NavigateUp : CommandKind::NavigateDown);
        overlay_scroll_ = 0;
        return true;
    }
    const size_t lines = overlay_lines().size();
    const size_t last = lines > 0 ? lines - 1 : 0;
    const bool ch = key.key == Key::Char;
    size_t next = overlay_scroll_;
    if (key.key == Key::Down || (ch && key.ch == 'j'))
        next = std::min(overlay_scroll_ + 1, last);
    else if (key.key == Key::Up || (ch && key.ch == 'k'))
        next = overlay_scroll_ > 0 ? overlay_scroll_ - 1 : 0;
    else if (key.key == Key::PageDown)
        next = std::min(overlay_scroll_ + PAGE_STEP, last);
    else if (key.key == Key::PageUp)
        next = overlay_scroll_ > PAGE_STEP ? overlay_scroll_ - PAGE_STEP : 0;
    else if (key.key == Key::Home || (ch && key.ch == 'g'))
        next = 0;
    else if (key.key == Key::End || (ch && key.ch == 'G'))
        next = last;
    else
        return false;
    if (next == overlay_scroll_)
        return false;
    overlay_scroll_ = next;
    return true;
}

void EventLoop::open_overlay(UiMode mode) {
    mode_ = mode;
    overlay_scroll_ = 0;
}

bool EventLoop::handle_normal_key(const KeyEvent& key) {
    const bool quit_key = key.key == Key::Escape || (key.key == Key::Char && key.ch == 'q');
    if (!quit_key && confirm_quit_) {
        confirm_quit_ = false;
        if (message_ == CONFIRM_QUIT_MSG)
            message_.clear();
    }
    if (quit_key) {
        request_quit(confirm_quit_);
        return true;
    }
    switch (key.key) {
    case Key::Up:
        dispatch(CommandKind::NavigateUp);
        return true;
    case Key::Down:
        dispatch(CommandKind::NavigateDown);
        return true;
    case Key::Home:
        dispatch(CommandKind::NavigateTop);
        return true;
    case Key::End:
        dispatch(CommandKind::NavigateBottom);
        return true;
    case Key::PageUp:
    case Key::PageDown:
        for (size_t i = 0; i < PAGE_STEP; ++i)
            dispatch(key.key == Key::PageUp ? CommandKind::NavigateUp : CommandKind::NavigateDown);
        return true;
    case Key::Enter:
        if (!disp_.current())
            return false;
        open_overlay(UiMode::Details);
        return true;
    case Key::Char:
        break;
    case Key::Escape:
    case Key::Backspace:
        return false;
    }
    switch (key.ch) {
    case 'j':
        dispatch(CommandKind::NavigateDown);
        break;
    case 'k':
        dispatch(CommandKind::NavigateUp);
        break;
    case 'g':
        dispatch(CommandKind::NavigateTop);
        break;
    case 'G':
        dispatch(CommandKind::NavigateBottom);
        break;
    case ' ':
    case 'x':
        dispatch(CommandKind::ToggleSelect);
        break;
    case 'X':
        dispatch(CommandKind::ClearSelection);
        break;
    case 'a':
        dispatch(CommandKind::SelectAll);
        break;
    case 'r':
        dispatch(CommandKind::RefreshOne);
        break;
    case 'R':
        dispatch(CommandKind::RefreshAll);
        break;
    case 'f':
        dispatch(CommandKind::FetchSelected);
        break;
    case 'F':
        dispatch(CommandKind::FetchAll);
        break;
    case 'l':
        dispatch(CommandKind::PullSelected);
        break;
    case 'h':
        dispatch(CommandKind::PushSelected);
        break;
    case 's':
        dispatch(CommandKind::SyncSelected);
        break;
    case 'p':
        dispatch(CommandKind::PruneSelected);
        break;
    case 'S':
        dispatch(CommandKind::CancelAll);
        break;
    case 'c':
        input_.clear();
        mode_ = UiMode::Checkout;
        break;
    case '/':
        input_ = disp_.filter();
        mode_ = UiMode::Filter;
        break;
    case 'E':
        open_overlay(UiMode::ErrorLog);
        break;
    case '?':
        open_overlay(UiMode::Help);
        break;
    case 'o':
        dispatch(CommandKind::CycleSort);
        break;
    case 'O':
        dispatch(CommandKind::ToggleSortDirection);
        break;
    case 'i':
        dispatch(CommandKind::ToggleHidden);
        break;
    case 'I':
        dispatch(CommandKind::ShowHidden);
        break;
    default:
        return false;
    }
    return true;
}

bool EventLoop::handle_input_key(const KeyEvent& key) {
    const bool filter = mode_ == UiMode::Filter;
    switch (key.key) {
    case Key::Char:
        input_ += key.ch;
        break;
    case Key::Backspace:
        if (input_.empty())
            return false;
        input_.pop_back();
        break;
    case Key::Enter:
        mode_ = UiMode::Normal;
        if (!filter) {
            std::string branch = input_;
            input_.clear();
            dispatch(CommandKind::CheckoutSelected, branch);
        }
        return true;
    case Key::Escape:
        mode_ = UiMode::Normal;
        input_.clear();
        if (filter)
            dispatch(CommandKind::FilterByText);
        return true;
    default:
        return false;
    }
    if (filter)
        dispatch(CommandKind::FilterByText, input_);
    return true;
}

bool EventLoop::on_tick(Clock::time_point now) {
    bool changed = false;
    if (agg_.busy_count() > 0) {
        ++spinner_;
        changed = true;
    }
    if (confirm_quit_ && now >= confirm_until_) {
        confirm_quit_ = false;
        if (message_ == CONFIRM_QUIT_MSG)
            message_.clear();
        changed = true;
    }
    if (!message_.empty() && !message_is_error_ && now - message_at_ >= cfg_.message_ttl) {
        message_.clear();
        changed = true;
    }
    if (cfg_.auto_refresh.count() > 0 && now >= next_auto_refresh_) {
        next_auto_refresh_ = now + cfg_.auto_refresh;
        // Busy repositories are skipped silently; they will be picked up next time.
        DispatchOutcome out = disp_.dispatch(Command{CommandKind::RefreshAll, {}});
        log_debug("Auto refresh", LogFields{{"queued", std::to_string(out.submitted.size())},
                                            {"skipped", std::to_string(out.rejected.size())}});
        if (!out.submitted.empty())
            changed = true;
    }
    return changed;
}

void EventLoop::dispatch(CommandKind kind, const std::string& text) {
    apply_outcome(disp_.dispatch(Command{kind, text}));
}

void EventLoop::apply_outcome(const DispatchOutcome& out) {
    if (out.quit)
        request_quit(false);
    if (!out.notice.empty())
        set_message(out.notice, out.notice_is_error);
}

void EventLoop::request_quit(bool confirmed) {
    if (!confirmed && agg_.busy_count() > 0 && !confirm_quit_) {
        confirm_quit_ = true;
        confirm_until_ = Clock::now() + cfg_.confirm_ttl;
        set_message(CONFIRM_QUIT_MSG, false);
        return;
    }
    quit_ = true;
}

void EventLoop::finish() {
    if (finished_)
        return;
    if (agg_.busy_count() > 0) {
        set_message("Stopping running operations...", false);
        render();
    }
    DispatchOutcome out = disp_.dispatch(Command{CommandKind::CancelAll, {}});
    size_t applied = 0;
    while (auto ev = events_.try_pop()) {
        if (ev->type == LoopEvent::COMPLETION) {
            agg_.apply(ev->result);
            ++applied;
        }
    }
    finished_ = true;
    log_info("Event loop finished", LogFields{{"cancelled", std::to_string(out.cancelled)},
                                              {"drained", std::to_string(applied)}});
}

void EventLoop::set_message(const std::string& msg, bool is_error) {
    message_ = msg;
    message_is_error_ = is_error;
    message_at_ = Clock::now();
}

std::vector<std::string> EventLoop::overlay_lines() const {
    switch (mode_) {
    case UiMode::Help:
        return help_overlay_lines();
    case UiMode::ErrorLog:
        return error_log_lines(agg_.error_log());
    case UiMode::Details:
        if (auto cur = disp_.current()) {
            if (auto st = agg_.table().get(*cur))
                return details_lines(*st);
        }
        break;
    case UiMode::Normal:
    case UiMode::Filter:
    case UiMode::Checkout:
        break;
    }
    return {};
}

UiSnapshot EventLoop::snapshot() const {
    UiSnapshot s;
    auto all = agg_.table().snapshot();
    s.total = all.size();
    std::map<RepoPath, size_t> index;
    for (size_t i = 0; i < all.size(); ++i)
        index[all[i].path] = i;
    for (const auto& p : disp_.visible()) {
        auto it = index.find(p);
        if (it != index.end())
            s.rows.push_back(std::move(all[it->second]));
    }
    s.marked = disp_.marked();
    s.cursor = s.rows.empty() ? 0 : std::min(disp_.cursor(), s.rows.size() - 1);
    s.filter = disp_.filter();
    s.input = input_;
    s.status_message = message_;
    s.status_is_error = message_is_error_;
    s.spinner = spinner_;
    s.mode = mode_;
    s.overlay = overlay_lines();
    s.overlay_scroll = overlay_scroll_;
    if (disp_.sort_column() != SortColumn::Discovery || !disp_.sort_ascending())
        s.sort = std::string(sort_column_label(disp_.sort_column())) +
                 (disp_.sort_ascending() ? " asc" : " desc");
    s.hidden = disp_.hidden().size();
    s.showing_hidden = disp_.showing_hidden();
    s.busy = agg_.busy_count();
    s.queued = queued_ ? queued_() : 0;
    return s;
}

void EventLoop::render() {
    if (render_)
        render_(snapshot());
}
