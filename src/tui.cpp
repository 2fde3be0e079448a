#include "tui.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>
#include "git_commands.hpp"
#include "time_utils.hpp"
#include "version.hpp"

namespace {

constexpr int NAME_WIDTH = 24;
constexpr int BRANCH_WIDTH = 16;
constexpr int SYNC_WIDTH = 10;
constexpr int TREE_WIDTH = 22;
constexpr size_t REASON_WIDTH = 60;
// Lines taken by the header and footer around the repository list.
constexpr size_t CHROME_LINES = 9;

const char* const RULE = "--------------------------------------------------------------"
                         "----------------------------------------";

bool is_lead_byte(char ch) { return (static_cast<unsigned char>(ch) & 0xC0) != 0x80; }

// Number of UTF-8 characters in @a s.
size_t char_count(const std::string& s) {
    return static_cast<size_t>(std::count_if(s.begin(), s.end(), is_lead_byte));
}

// Shorten to @a width characters, cutting at a character boundary.
std::string clip(const std::string& s, size_t width) {
    if (char_count(s) <= width)
        return s;
    const size_t keep = width < 2 ? width : width - 1;
    size_t pos = 0;
    size_t chars = 0;
    for (; pos < s.size(); ++pos) {
        if (is_lead_byte(s[pos])) {
            if (chars == keep)
                break;
            ++chars;
        }
    }
    return s.substr(0, pos) + (width < 2 ? "" : "~");
}

// clip() padded with spaces to exactly @a width characters.
std::string fit(const std::string& s, size_t width) {
    std::string out = clip(s, width);
    const size_t n = char_count(out);
    if (n < width)
        out.append(width - n, ' ');
    return out;
}

std::string display_name(const RepoPath& p, bool censor, char censor_char) {
    std::string name = p.filename().string();
    if (name.empty())
        name = p.string();
    if (censor)
        name.assign(name.size(), censor_char);
    return name;
}

std::string first_line(const std::string& s) {
    std::string t = git::trim_copy(s);
    return t.substr(0, t.find('\n'));
}

} // namespace

TuiColors make_tui_colors(bool no_colors, const std::string& custom_color, const TuiTheme& theme) {
    auto choose = [&](const std::string& def) {
        return no_colors ? std::string() : (custom_color.empty() ? def : custom_color);
    };
    return {no_colors ? std::string() : theme.reset,
            choose(theme.green),
            choose(theme.yellow),
            choose(theme.red),
            choose(theme.cyan),
            choose(theme.gray),
            no_colors ? std::string() : theme.bold,
            choose(theme.magenta),
            no_colors ? std::string() : theme.inverse};
}

char spinner_glyph(unsigned n) {
    static const char frames[] = {'|', '/', '-', '\\'};
    return frames[n % 4];
}

std::string render_header(const UiSnapshot& snap, const TuiColors& c) {
    std::ostringstream out;
    out << c.bold << "gitfleet" << c.reset << " v" << GITFLEET_VERSION << "\n";
    out << "Repos: " << snap.total;
    if (!snap.filter.empty())
        out << " (" << snap.rows.size() << " shown, filter \"" << snap.filter << "\")";
    out << "  Busy: " << (snap.busy ? c.yellow : "") << snap.busy << c.reset;
    out << "  Queued: " << snap.queued;
    out << "  Marked: " << snap.marked.size();
    if (snap.hidden > 0)
        out << "  Hidden: " << snap.hidden << (snap.showing_hidden ? " (shown)" : "");
    if (!snap.sort.empty())
        out << "  Sort: " << snap.sort;
    out << "\n";
    out << "Status: ";
    if (snap.status_message.empty()) {
        if (snap.busy > 0)
            out << c.yellow << "Working " << spinner_glyph(snap.spinner) << c.reset;
        else
            out << c.green << "Idle" << c.reset;
    } else {
        out << (snap.status_is_error ? c.red : c.cyan) << snap.status_message << c.reset;
    }
    out << "\n";
    return out.str();
}

std::string render_repo_entry(const RepositoryState& st, bool marked, bool current,
                              unsigned spinner, bool censor_names, char censor_char,
                              const TuiColors& c, std::chrono::system_clock::time_point now) {
    std::string color = c.gray;
    std::string label = status_label(st.status);
    switch (st.status) {
    case RS_UNKNOWN:
        color = c.gray;
        break;
    case RS_REFRESHING:
        color = c.yellow;
        if (st.pending_operation)
            label = operation_label(*st.pending_operation);
        label += std::string(" ") + spinner_glyph(spinner);
        break;
    case RS_CLEAN:
        color = c.green;
        break;
    case RS_ERROR:
        color = c.red;
        if (st.error)
            label = failure_label(st.error->kind);
        break;
    }
    std::ostringstream out;
    if (current)
        out << c.inverse;
    out << (marked ? "*" : " ") << (current ? ">" : " ");
    out << color << " [" << std::left << std::setw(11) << label << "]" << c.reset;
    if (current)
        out << c.inverse;
    out << " " << std::left << fit(display_name(st.path, censor_names, censor_char), NAME_WIDTH);
    out << " " << fit(st.info.branch.value_or("-"), BRANCH_WIDTH);
    std::string sync = st.status == RS_UNKNOWN ? "" : sync_summary(st.info);
    std::string tree = st.status == RS_UNKNOWN ? "" : worktree_summary(st.info);
    out << " " << (st.info.behind.value_or(0) > 0 ? c.magenta : "") << std::setw(SYNC_WIDTH)
        << clip(sync, SYNC_WIDTH);
    if (st.info.behind.value_or(0) > 0)
        out << c.reset << (current ? c.inverse : "");
    out << " " << std::setw(TREE_WIDTH) << clip(tree, TREE_WIDTH);
    out << " " << std::right << std::setw(4) << (st.last_sync ? format_age(*st.last_sync, now) : "")
        << std::left;
    if (current)
        out << c.reset;
    if (st.status == RS_ERROR && st.error)
        out << " " << c.red << clip(first_line(st.error->message), REASON_WIDTH) << c.reset;
    else if (!st.message.empty())
        out << " " << c.gray << clip(first_line(st.message), REASON_WIDTH) << c.reset;
    out << "\n";
    return out.str();
}

std::string render_footer(const UiSnapshot& snap, const TuiColors& c) {
    std::ostringstream out;
    switch (snap.mode) {
    case UiMode::Filter:
        out << c.bold << "Filter: " << c.reset << snap.input << "_  (Enter accept, Esc clear)";
        break;
    case UiMode::Checkout:
        out << c.bold << "Checkout branch: " << c.reset << snap.input
            << "_  (Enter submit, Esc cancel)";
        break;
    case UiMode::Help:
    case UiMode::ErrorLog:
    case UiMode::Details:
        out << c.gray << "j/k scroll  Esc or q to close" << c.reset;
        break;
    case UiMode::Normal:
        out << c.gray
            << "q quit  r/R refresh  f/F fetch  l pull  h push  s sync  p prune  c checkout"
               "  / filter  o sort  i hide  E errors  S stop  ? help"
            << c.reset;
        break;
    }
    out << "\n";
    return out.str();
}

std::string render_frame(const UiSnapshot& snap, const DisplayOptions& opts) {
    TuiColors colors = make_tui_colors(opts.no_colors, opts.custom_color, opts.theme);
    std::ostringstream out;
    out << "\033[2J\033[H";
    out << render_header(snap, colors);
    out << RULE << "\n";
    if (snap.mode == UiMode::Help || snap.mode == UiMode::ErrorLog ||
        snap.mode == UiMode::Details) {
        const size_t total = snap.overlay.size();
        if (opts.max_rows > 0 && total > opts.max_rows) {
            // One row is kept for the position line.
            const size_t avail = std::max<size_t>(1, opts.max_rows - 1);
            const size_t first = std::min(snap.overlay_scroll, total - 1);
            const size_t last = std::min(total, first + avail);
            for (size_t i = first; i < last; ++i)
                out << " " << snap.overlay[i] << "\n";
            out << colors.gray << "  lines " << first + 1 << "-" << last << " of " << total
                << colors.reset << "\n";
        } else {
            for (const auto& line : snap.overlay)
                out << " " << line << "\n";
        }
    } else {
        out << colors.bold << "  " << " [" << std::left << std::setw(11) << "Status" << "] "
            << std::setw(NAME_WIDTH) << "Repository" << " " << std::setw(BRANCH_WIDTH)
            << "Branch" << " " << std::setw(SYNC_WIDTH) << "Sync" << " " << std::setw(TREE_WIDTH)
            << "Worktree" << " " << std::right << std::setw(4) << "Age" << std::left
            << colors.reset << "\n";
        if (snap.rows.empty())
            out << colors.gray << "  (no repositories)" << colors.reset << "\n";
        size_t first = 0;
        size_t count = snap.rows.size();
        if (opts.max_rows > 0 && count > opts.max_rows) {
            size_t half = opts.max_rows / 2;
            first = snap.cursor > half ? snap.cursor - half : 0;
            first = std::min(first, count - opts.max_rows);
            count = opts.max_rows;
        }
        auto now = std::chrono::system_clock::now();
        for (size_t i = first; i < first + count; ++i) {
            const auto& st = snap.rows[i];
            out << render_repo_entry(st, snap.marked.count(st.path) > 0, i == snap.cursor,
                                     snap.spinner, opts.censor_names, opts.censor_char, colors,
                                     now);
        }
    }
    out << RULE << "\n";
    out << render_footer(snap, colors);
    return out.str();
}

void draw_tui(const UiSnapshot& snap, const DisplayOptions& opts) {
    DisplayOptions sized = opts;
    winsize ws{};
    if (sized.max_rows == 0 && ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 &&
        ws.ws_row > CHROME_LINES)
        sized.max_rows = ws.ws_row - CHROME_LINES;
    std::cout << render_frame(snap, sized) << std::flush;
}

std::vector<std::string> help_overlay_lines() {
    return {"Keys",
            "",
            "  q, Esc        quit (asks again while work is running)",
            "  j/k, arrows   move cursor",
            "  g / G         jump to top / bottom",
            "  space, x      toggle mark on current repository",
            "  a / X         mark all shown / clear marks",
            "  r / R         refresh current / all repositories",
            "  f / F         fetch selection / all repositories",
            "  l / h         pull / push selection",
            "  s             sync selection (fetch, pull, push)",
            "  p             prune remote-tracking branches of selection",
            "  c             checkout a branch on the selection",
            "  /             filter by path",
            "  o / O         next sort column / reverse sort direction",
            "  i / I         hide current repository / show hidden ones",
            "  Enter         repository details",
            "  E             error log",
            "  S             stop all running and queued operations",
            "  ?             this help",
            "",
            "In overlays j/k and PgUp/PgDn scroll; in details the arrows step between repositories.",
            "The selection is the marked repositories, or the current one when none are marked."};
}

std::vector<std::string> error_log_lines(const std::deque<ErrorLogEntry>& log) {
    std::vector<std::string> lines;
    lines.push_back("Error log (" + std::to_string(log.size()) + " entries, newest first)");
    lines.emplace_back();
    if (log.empty())
        lines.emplace_back("  no errors");
    for (auto it = log.rbegin(); it != log.rend(); ++it) {
        std::ostringstream line;
        line << "  "
             << format_local_time(std::chrono::system_clock::to_time_t(it->time), "%H:%M:%S")
             << "  " << std::left << std::setw(9) << operation_label(it->kind) << std::setw(17)
             << failure_label(it->failure) << it->path.string() << ": "
             << clip(first_line(it->message), REASON_WIDTH);
        lines.push_back(line.str());
    }
    return lines;
}

std::vector<std::string> details_lines(const RepositoryState& st) {
    std::vector<std::string> lines;
    const StatusSnapshot& s = st.info;
    lines.push_back("Path:        " + st.path.string());
    lines.push_back(std::string("Status:      ") + status_label(st.status));
    if (st.pending_operation)
        lines.push_back(std::string("Running:     ") + operation_label(*st.pending_operation));
    lines.push_back("Branch:      " + s.branch.value_or("-"));
    lines.push_back(std::string("Upstream:    ") + (s.has_upstream ? "yes" : "no"));
    lines.push_back("Sync:        " + sync_summary(s));
    lines.push_back("Worktree:    " + worktree_summary(s));
    lines.push_back("Remote URL:  " + s.remote_url.value_or("-"));
    if (s.last_commit) {
        lines.push_back("Last commit: " + s.last_commit->id + " " + s.last_commit->summary);
        lines.push_back("Author:      " + s.last_commit->author + ", " +
                        format_local_time(s.last_commit->time, "%Y-%m-%d %H:%M"));
    } else {
        lines.push_back("Last commit: -");
    }
    if (st.last_sync) {
        lines.push_back("Refreshed:   " +
                        format_local_time(std::chrono::system_clock::to_time_t(*st.last_sync)) +
                        " (" + format_age(*st.last_sync) + " ago)");
    } else {
        lines.push_back("Refreshed:   never");
    }
    if (st.last_operation)
        lines.push_back(std::string("Last op:     ") + operation_label(*st.last_operation));
    if (!st.message.empty())
        lines.push_back("Message:     " + first_line(st.message));
    if (st.error) {
        lines.push_back(std::string("Last error:  ") + failure_label(st.error->kind));
        std::istringstream msg(st.error->message);
        std::string line;
        while (std::getline(msg, line))
            lines.push_back("  " + line);
    }
    return lines;
}

std::string render_plain_line(const RepositoryState& st, bool censor_names, char censor_char) {
    std::ostringstream out;
    std::string label = status_label(st.status);
    if (st.status == RS_ERROR && st.error)
        label = failure_label(st.error->kind);
    out << "[" << label << "] " << display_name(st.path, censor_names, censor_char);
    if (st.info.branch)
        out << " (" << *st.info.branch << ")";
    if (st.status == RS_CLEAN)
        out << " " << sync_summary(st.info) << ", " << worktree_summary(st.info);
    if (st.status == RS_ERROR && st.error)
        out << " - " << first_line(st.error->message);
    return out.str();
}
