#ifndef TUI_HPP
#define TUI_HPP

#include <chrono>
#include <deque>
#include <set>
#include <string>
#include <vector>
#include "repo.hpp"
#include "state_aggregator.hpp"

/**
 * @brief Theme definition for TUI colors.
 *
 * Contains raw ANSI sequences for each color used by the interface.
 */
struct TuiTheme {
    std::string reset = "\033[0m";
    std::string green = "\033[32m";
    std::string yellow = "\033[33m";
    std::string red = "\033[31m";
    std::string cyan = "\033[36m";
    std::string gray = "\033[90m";
    std::string bold = "\033[1m";
    std::string magenta = "\033[35m";
    std::string inverse = "\033[7m";
};

/**
 * @brief Resolved color codes for the TUI.
 */
struct TuiColors {
    std::string reset;
    std::string green;
    std::string yellow;
    std::string red;
    std::string cyan;
    std::string gray;
    std::string bold;
    std::string magenta;
    std::string inverse;
};

/**
 * @brief Create a color palette honoring user preferences.
 *
 * @param no_colors    Suppress every escape sequence.
 * @param custom_color Sequence replacing all foreground colors when not empty.
 * @param theme        Default sequences.
 */
TuiColors make_tui_colors(bool no_colors, const std::string& custom_color, const TuiTheme& theme);

/// Interaction mode of the control loop.
enum class UiMode { Normal, Filter, Checkout, Help, ErrorLog, Details };

/**
 * @brief Immutable view of everything a frame shows.
 *
 * Built by the control loop after each iteration that changed something and
 * handed to the renderer.
 */
struct UiSnapshot {
    std::vector<RepositoryState> rows; ///< Filtered records in table order
    std::set<RepoPath> marked;
    size_t cursor = 0;            ///< Index into rows
    std::string filter;           ///< Active filter text
    std::string input;            ///< Text typed in Filter or Checkout mode
    std::string status_message;
    bool status_is_error = false;
    unsigned spinner = 0;         ///< Animation frame
    UiMode mode = UiMode::Normal;
    std::vector<std::string> overlay; ///< Lines of the help, error or details overlay
    size_t overlay_scroll = 0;        ///< First overlay line shown when it does not fit
    std::string sort;                 ///< Sort description, empty in discovery order
    size_t hidden = 0;                ///< Repositories hidden from the view
    bool showing_hidden = false;
    size_t busy = 0;
    size_t queued = 0;
    size_t total = 0;
};

/**
 * @brief Presentation settings independent of the data shown.
 */
struct DisplayOptions {
    bool no_colors = false;
    std::string custom_color;
    TuiTheme theme;
    bool censor_names = false;
    char censor_char = '*';
    size_t max_rows = 0; ///< Rows of the list or overlay to draw, 0 for all
};

/**
 * @brief Render the header: title, counters and status line.
 */
std::string render_header(const UiSnapshot& snap, const TuiColors& c);

/**
 * @brief Render one row of the repository list.
 *
 * @param st           Record to draw.
 * @param marked       Row is part of the marked selection.
 * @param current      Row is under the cursor.
 * @param spinner      Animation frame for busy rows.
 * @param censor_names Replace the repository name by @a censor_char.
 * @param censor_char  Replacement character.
 * @param c            Color palette.
 * @param now          Reference time for the age column.
 * @return Line terminated by a newline.
 */
std::string render_repo_entry(const RepositoryState& st, bool marked, bool current,
                              unsigned spinner, bool censor_names, char censor_char,
                              const TuiColors& c,
                              std::chrono::system_clock::time_point now =
                                  std::chrono::system_clock::now());

/**
 * @brief Render the key hints or the prompt of the active input mode.
 */
std::string render_footer(const UiSnapshot& snap, const TuiColors& c);

/**
 * @brief Render a whole frame, starting with clear-screen and home.
 */
std::string render_frame(const UiSnapshot& snap, const DisplayOptions& opts);

/**
 * @brief Draw @a snap to stdout, sized to the terminal.
 */
void draw_tui(const UiSnapshot& snap, const DisplayOptions& opts);

/** @return Lines of the help overlay. */
std::vector<std::string> help_overlay_lines();

/** @return One line per error log entry, newest first. */
std::vector<std::string> error_log_lines(const std::deque<ErrorLogEntry>& log);

/** @return Lines describing every field of @a st. */
std::vector<std::string> details_lines(const RepositoryState& st);

/**
 * @brief Render a record as one plain line for non-interactive listing.
 */
std::string render_plain_line(const RepositoryState& st, bool censor_names, char censor_char);

/** @return Spinner glyph for frame @a n. */
char spinner_glyph(unsigned n);

#endif // TUI_HPP
