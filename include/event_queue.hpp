#ifndef EVENT_QUEUE_HPP
#define EVENT_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "repo.hpp"

/// Logical keys produced by the terminal reader.
enum class Key { Char, Enter, Escape, Backspace, Up, Down, Home, End, PageUp, PageDown };

struct KeyEvent {
    Key key = Key::Char;
    char ch = 0; ///< Valid for Key::Char
};

/**
 * @brief Anything the control loop reacts to besides the tick.
 */
struct LoopEvent {
    enum Type { KEY, COMPLETION, RESIZE, QUIT };
    Type type = KEY;
    KeyEvent key;
    OperationResult result; ///< Valid for COMPLETION

    static LoopEvent make_key(Key k, char ch = 0) {
        LoopEvent ev;
        ev.type = KEY;
        ev.key = KeyEvent{k, ch};
        return ev;
    }
    static LoopEvent make_completion(OperationResult res) {
        LoopEvent ev;
        ev.type = COMPLETION;
        ev.result = std::move(res);
        return ev;
    }
    static LoopEvent make(Type t) {
        LoopEvent ev;
        ev.type = t;
        return ev;
    }
};

/**
 * @brief Many-producer, single-consumer queue feeding the control loop.
 */
class EventQueue {
  public:
    void push(LoopEvent ev) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            events_.push_back(std::move(ev));
        }
        cv_.notify_one();
    }

    /**
     * @brief Wait up to @a timeout for the next event.
     *
     * @return The event, or `std::nullopt` when the timeout elapsed first.
     */
    std::optional<LoopEvent> wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        if (!cv_.wait_for(lk, timeout, [this] { return !events_.empty(); }))
            return std::nullopt;
        LoopEvent ev = std::move(events_.front());
        events_.pop_front();
        return ev;
    }

    /** @return The next event without waiting, if any. */
    std::optional<LoopEvent> try_pop() { return wait_for(std::chrono::milliseconds(0)); }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return events_.size();
    }

  private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<LoopEvent> events_;
};

#endif // EVENT_QUEUE_HPP
