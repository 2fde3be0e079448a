#ifndef TERMINAL_INPUT_HPP
#define TERMINAL_INPUT_HPP

#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <termios.h>

#include "event_queue.hpp"

/**
 * @brief Decode raw terminal bytes into key events.
 *
 * Understands printable characters, Enter, Backspace, a lone Escape and the
 * CSI/SS3 sequences for arrows, Home, End, PageUp and PageDown. Unknown
 * escape sequences are dropped.
 */
std::vector<KeyEvent> decode_keys(const std::string& bytes);

/**
 * @brief Puts stdin in non-canonical, no-echo mode for its lifetime.
 */
class TermGuard {
  public:
    TermGuard();
    ~TermGuard();
    TermGuard(const TermGuard&) = delete;
    TermGuard& operator=(const TermGuard&) = delete;

    bool active() const { return active_; }

  private:
    termios orig_{};
    bool active_ = false;
};

/**
 * @brief Switches to the alternate screen and hides the cursor.
 */
struct AltScreenGuard {
    AltScreenGuard();
    ~AltScreenGuard();
    AltScreenGuard(const AltScreenGuard&) = delete;
    AltScreenGuard& operator=(const AltScreenGuard&) = delete;
};

/**
 * @brief Route SIGINT, SIGTERM and SIGWINCH to flags read by TerminalInput.
 *
 * SIGPIPE is ignored so a closed terminal cannot kill the process.
 */
void install_signal_handlers();

/** @return Whether SIGINT or SIGTERM arrived; clears the flag. */
bool take_quit_signal();

/** @return Whether SIGWINCH arrived; clears the flag. */
bool take_resize_signal();

/**
 * @brief Background reader turning stdin and signals into loop events.
 *
 * Polls stdin every 100 ms, posts KEY events for decoded keys, RESIZE for
 * SIGWINCH and QUIT for SIGINT/SIGTERM. End of input posts QUIT as well.
 */
class TerminalInput {
  public:
    explicit TerminalInput(EventQueue& queue, int fd = 0);
    ~TerminalInput();
    TerminalInput(const TerminalInput&) = delete;
    TerminalInput& operator=(const TerminalInput&) = delete;

    void start();
    void stop();

  private:
    void run();

    EventQueue& queue_;
    int fd_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

#endif // TERMINAL_INPUT_HPP
