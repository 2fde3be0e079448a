#include "terminal_input.hpp"

#include <cctype>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <poll.h>
#include <unistd.h>

#include "logger.hpp"

namespace {

volatile std::sig_atomic_t g_quit_signal = 0;
volatile std::sig_atomic_t g_resize_signal = 0;

void handle_signal(int sig) {
    if (sig == SIGWINCH)
        g_resize_signal = 1;
    else
        g_quit_signal = 1;
}

// Decode the sequence starting at bytes[i] == ESC. Returns the number of
// bytes consumed.
size_t decode_escape(const std::string& bytes, size_t i, std::vector<KeyEvent>& out) {
    if (i + 1 >= bytes.size() || (bytes[i + 1] != '[' && bytes[i + 1] != 'O')) {
        out.push_back(KeyEvent{Key::Escape, 0});
        return 1;
    }
    size_t j = i + 2;
    std::string params;
    while (j < bytes.size() && (std::isdigit(static_cast<unsigned char>(bytes[j])) ||
                                bytes[j] == ';'))
        params += bytes[j++];
    if (j >= bytes.size())
        return bytes.size() - i;
    char final = bytes[j];
    switch (final) {
    case 'A':
        out.push_back(KeyEvent{Key::Up, 0});
        break;
    case 'B':
        out.push_back(KeyEvent{Key::Down, 0});
        break;
    case 'H':
        out.push_back(KeyEvent{Key::Home, 0});
        break;
    case 'F':
        out.push_back(KeyEvent{Key::End, 0});
        break;
    case '~':
        if (params == "1" || params == "7")
            out.push_back(KeyEvent{Key::Home, 0});
        else if (params == "4" || params == "8")
            out.push_back(KeyEvent{Key::End, 0});
        else if (params == "5")
            out.push_back(KeyEvent{Key::PageUp, 0});
        else if (params == "6")
            out.push_back(KeyEvent{Key::PageDown, 0});
        break;
    default:
        break;
    }
    return j - i + 1;
}

} // namespace

std::vector<KeyEvent> decode_keys(const std::string& bytes) {
    std::vector<KeyEvent> out;
    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c == 0x1b) {
            i += decode_escape(bytes, i, out);
            continue;
        }
        if (c == '\r' || c == '\n')
            out.push_back(KeyEvent{Key::Enter, 0});
        else if (c == 0x7f || c == 0x08)
            out.push_back(KeyEvent{Key::Backspace, 0});
        else if (c >= 0x20 && c < 0x7f)
            out.push_back(KeyEvent{Key::Char, static_cast<char>(c)});
        ++i;
    }
    return out;
}

TermGuard::TermGuard() {
    if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &orig_) != 0)
        return;
    termios t = orig_;
    t.c_lflag &= ~(ICANON | ECHO);
    t.c_cc[VMIN] = 1;
    t.c_cc[VTIME] = 0;
    active_ = tcsetattr(STDIN_FILENO, TCSANOW, &t) == 0;
}

TermGuard::~TermGuard() {
    if (active_)
        tcsetattr(STDIN_FILENO, TCSANOW, &orig_);
}

AltScreenGuard::AltScreenGuard() { std::cout << "\033[?1049h\033[?25l" << std::flush; }

AltScreenGuard::~AltScreenGuard() { std::cout << "\033[?25h\033[?1049l" << std::flush; }

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = handle_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGWINCH, &sa, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
}

bool take_quit_signal() {
    if (!g_quit_signal)
        return false;
    g_quit_signal = 0;
    return true;
}

bool take_resize_signal() {
    if (!g_resize_signal)
        return false;
    g_resize_signal = 0;
    return true;
}

TerminalInput::TerminalInput(EventQueue& queue, int fd) : queue_(queue), fd_(fd) {}

TerminalInput::~TerminalInput() { stop(); }

void TerminalInput::start() {
    if (thread_.joinable())
        return;
    stop_.store(false);
    thread_ = std::thread(&TerminalInput::run, this);
}

void TerminalInput::stop() {
    stop_.store(true);
    if (thread_.joinable())
        thread_.join();
}

void TerminalInput::run() {
    bool input_open = true;
    while (!stop_.load()) {
        if (take_quit_signal())
            queue_.push(LoopEvent::make(LoopEvent::QUIT));
        if (take_resize_signal())
            queue_.push(LoopEvent::make(LoopEvent::RESIZE));
        if (!input_open) {
            usleep(100 * 1000);
            continue;
        }
        pollfd pfd{fd_, POLLIN, 0};
        int rc = poll(&pfd, 1, 100);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            log_error("Polling terminal input failed", LogFields{{"errno", std::to_string(errno)}});
            input_open = false;
            queue_.push(LoopEvent::make(LoopEvent::QUIT));
            continue;
        }
        if (rc == 0)
            continue;
        char buf[64];
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n < 0 && (errno == EINTR || errno == EAGAIN))
            continue;
        if (n <= 0) {
            log_info("Terminal input closed");
            input_open = false;
            queue_.push(LoopEvent::make(LoopEvent::QUIT));
            continue;
        }
        for (const auto& k : decode_keys(std::string(buf, static_cast<size_t>(n))))
            queue_.push(LoopEvent::make_key(k.key, k.ch));
    }
}
