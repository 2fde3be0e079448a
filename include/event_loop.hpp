#ifndef EVENT_LOOP_HPP
#define EVENT_LOOP_HPP

#include <chrono>
#include <functional>
#include <string>
#include <vector>

#include "command_dispatcher.hpp"
#include "event_queue.hpp"
#include "state_aggregator.hpp"
#include "tui.hpp"

/**
 * @brief Timing settings of the control loop.
 */
struct LoopConfig {
    std::chrono::milliseconds tick{250};          ///< Spinner and expiry resolution
    std::chrono::milliseconds auto_refresh{0};    ///< RefreshAll interval, 0 disables
    std::chrono::milliseconds message_ttl{2000};  ///< Lifetime of info messages
    std::chrono::milliseconds confirm_ttl{2000};  ///< Window for the second quit key
    bool initial_refresh = true;                  ///< RefreshAll on start()
};

/**
 * @brief Single-threaded controller driving dispatcher, aggregator and view.
 *
 * Every event (key, completion, resize, quit signal) and every tick is
 * handled on the thread calling run() or run_once(). Completions are only
 * applied here, so the table has exactly one writer and rendering never
 * races with an update.
 */
class EventLoop {
  public:
    using Renderer = std::function<void(const UiSnapshot&)>;
    using QueuedFn = std::function<size_t()>;

    /**
     * @param agg      Aggregator owning the table.
     * @param disp     Dispatcher holding the view and submitting tasks.
     * @param events   Queue fed by the input reader and the worker pool sink.
     * @param render   Called with a fresh snapshot whenever the view changed.
     * @param cfg      Timing settings.
     * @param queued   Reports tasks waiting in the pool, for the header.
     */
    EventLoop(StateAggregator& agg, CommandDispatcher& disp, EventQueue& events, Renderer render,
              LoopConfig cfg = {}, QueuedFn queued = {});

    /** Run until quit; returns the process exit code. */
    int run();

    /** Issue the initial refresh, if configured, and draw the first frame. */
    void start();

    /**
     * @brief Wait up to @a max_wait for one event, handle it and any tick due.
     *
     * When the event requests quitting, all work is cancelled and the
     * resulting completions are applied before this returns.
     *
     * @return `false` once the loop has finished.
     */
    bool run_once(std::chrono::milliseconds max_wait);

    /**
     * @brief Handle one event.
     *
     * @return Whether the view changed.
     */
    bool handle_event(const LoopEvent& ev);

    /** @return The view as the renderer would receive it now. */
    UiSnapshot snapshot() const;

    UiMode mode() const { return mode_; }
    size_t overlay_scroll() const { return overlay_scroll_; }
    bool finished() const { return finished_; }
    bool confirming_quit() const { return confirm_quit_; }
    const std::string& status_message() const { return message_; }

  private:
    using Clock = std::chrono::steady_clock;

    bool handle_key(const KeyEvent& key);
    bool handle_normal_key(const KeyEvent& key);
    bool handle_input_key(const KeyEvent& key);
    bool handle_overlay_key(const KeyEvent& key);
    void open_overlay(UiMode mode);
    std::vector<std::string> overlay_lines() const;
    bool on_tick(Clock::time_point now);
    void apply_outcome(const DispatchOutcome& out);
    void dispatch(CommandKind kind, const std::string& text = {});
    void request_quit(bool confirmed);
    void finish();
    void set_message(const std::string& msg, bool is_error);
    void render();

    StateAggregator& agg_;
    CommandDispatcher& disp_;
    EventQueue& events_;
    Renderer render_;
    LoopConfig cfg_;
    QueuedFn queued_;

    UiMode mode_ = UiMode::Normal;
    std::string input_;
    size_t overlay_scroll_ = 0;
    std::string message_;
    bool message_is_error_ = false;
    Clock::time_point message_at_{};
    bool confirm_quit_ = false;
    Clock::time_point confirm_until_{};
    unsigned spinner_ = 0;
    Clock::time_point next_tick_{};
    Clock::time_point next_auto_refresh_{};
    bool quit_ = false;
    bool finished_ = false;
};

#endif // EVENT_LOOP_HPP
